#include "ProcessTerminator.h"

#include <spdlog/spdlog.h>

#include <format>
#include <utility>

namespace Domain
{

ProcessTerminator::ProcessTerminator(std::unique_ptr<Platform::IProcessActions> actions, EssentialProcessPolicy policy)
    : m_Actions(std::move(actions)), m_Policy(std::move(policy))
{
}

bool ProcessTerminator::canTerminate() const
{
    return m_Actions && m_Actions->actionCapabilities().canTerminate;
}

TerminateResult ProcessTerminator::terminate(std::int32_t pid, std::string_view name)
{
    TerminateResult result{.outcome = TerminateOutcome::Failed, .pid = pid, .name = std::string(name), .message = {}};

    if (m_Policy.isEssential(pid, name))
    {
        spdlog::info("ProcessTerminator: refusing to terminate essential process {} (PID {})", name, pid);
        result.outcome = TerminateOutcome::Blocked;
        result.message = std::format("{} (PID {}) is essential and cannot be terminated.", name, pid);
        return result;
    }

    if (!m_Actions)
    {
        result.message = "Process actions are not available on this platform.";
        spdlog::error("ProcessTerminator: no process actions backend");
        return result;
    }

    const auto actionResult = m_Actions->terminate(pid);
    switch (actionResult.status)
    {
    case Platform::ProcessActionStatus::Ok:
        spdlog::info("ProcessTerminator: sent SIGTERM to {} (PID {})", name, pid);
        result.outcome = TerminateOutcome::Sent;
        break;
    case Platform::ProcessActionStatus::NotFound:
        spdlog::debug("ProcessTerminator: {} (PID {}) already exited", name, pid);
        result.outcome = TerminateOutcome::NotFound;
        break;
    case Platform::ProcessActionStatus::PermissionDenied:
        spdlog::warn("ProcessTerminator: no permission to terminate {} (PID {})", name, pid);
        result.outcome = TerminateOutcome::PermissionDenied;
        result.message = std::format("No permission to terminate {} (PID {}). Try running as root.", name, pid);
        break;
    case Platform::ProcessActionStatus::InvalidArgument:
    case Platform::ProcessActionStatus::Failed:
        spdlog::error("ProcessTerminator: failed to terminate {} (PID {}): {}", name, pid, actionResult.errorMessage);
        result.outcome = TerminateOutcome::Failed;
        result.message = std::format("Failed to terminate {} (PID {}): {}", name, pid, actionResult.errorMessage);
        break;
    }

    return result;
}

CleanupReport ProcessTerminator::cleanNonEssential(const std::vector<DisplayRow>& displayedRows)
{
    CleanupReport report;

    for (const auto& row : displayedRows)
    {
        if (m_SelfPid.has_value() && row.pid == *m_SelfPid)
        {
            ++report.skippedSelf;
            continue;
        }

        // Re-check against the policy; the row tag may be one refresh old.
        if (m_Policy.isEssential(row.pid, row.displayName))
        {
            ++report.blocked;
            continue;
        }

        ++report.attempted;
        auto result = terminate(row.pid, row.displayName);
        switch (result.outcome)
        {
        case TerminateOutcome::Sent:
            ++report.sent;
            break;
        case TerminateOutcome::NotFound:
            ++report.notFound;
            break;
        case TerminateOutcome::Blocked:
            ++report.blocked;
            break;
        case TerminateOutcome::PermissionDenied:
        case TerminateOutcome::Failed:
            report.failures.push_back(std::move(result));
            break;
        }
    }

    spdlog::info("ProcessTerminator: cleanup sent={} blocked={} notFound={} failed={}",
                 report.sent,
                 report.blocked,
                 report.notFound,
                 report.failures.size());
    return report;
}

} // namespace Domain
