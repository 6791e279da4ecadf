#include "LinuxProcessActions.h"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <string>
#include <system_error>
#include <utility>

#include <signal.h>
#include <sys/types.h>

namespace Platform
{

namespace
{

[[nodiscard]] ProcessActionResult classifyKillError(std::int32_t pid, int err)
{
    switch (err)
    {
    case EPERM:
        spdlog::warn("SIGTERM to PID {} denied", pid);
        return ProcessActionResult::error(ProcessActionStatus::PermissionDenied, "Permission denied - process belongs to another user");
    case ESRCH:
        spdlog::debug("SIGTERM to PID {}: no such process", pid);
        return ProcessActionResult::error(ProcessActionStatus::NotFound, "Process not found - may have already exited");
    case EINVAL:
        return ProcessActionResult::error(ProcessActionStatus::InvalidArgument, "Invalid signal");
    default:
        break;
    }

    auto message = std::system_category().message(err);
    spdlog::warn("SIGTERM to PID {} failed: {}", pid, message);
    return ProcessActionResult::error(ProcessActionStatus::Failed, std::move(message));
}

} // namespace

ProcessActionCapabilities LinuxProcessActions::actionCapabilities() const
{
    return {.canTerminate = true};
}

ProcessActionResult LinuxProcessActions::terminate(std::int32_t pid)
{
    // kill(0, ...) and negative pids address process groups, never a single process
    if (pid <= 0)
    {
        return ProcessActionResult::error(ProcessActionStatus::InvalidArgument, "Invalid PID");
    }

    if (::kill(static_cast<pid_t>(pid), SIGTERM) != 0)
    {
        return classifyKillError(pid, errno);
    }

    spdlog::info("Sent SIGTERM to PID {}", pid);
    return ProcessActionResult::ok();
}

} // namespace Platform
