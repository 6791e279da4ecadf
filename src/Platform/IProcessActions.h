#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace Platform
{

/// Classification of a signal delivery attempt.
enum class ProcessActionStatus : std::uint8_t
{
    Ok,
    NotFound,         // ESRCH - process already exited
    PermissionDenied, // EPERM - caller may not signal this process
    InvalidArgument,  // Bad pid or signal
    Failed,           // Anything else
};

/// Result of a process action (terminate, etc.)
struct ProcessActionResult
{
    ProcessActionStatus status = ProcessActionStatus::Failed;
    std::string errorMessage;

    [[nodiscard]] bool success() const noexcept
    {
        return status == ProcessActionStatus::Ok;
    }

    static ProcessActionResult ok()
    {
        return {.status = ProcessActionStatus::Ok, .errorMessage = {}};
    }
    static ProcessActionResult error(ProcessActionStatus status, std::string msg)
    {
        return {.status = status, .errorMessage = std::move(msg)};
    }
};

/// Capabilities for process actions.
struct ProcessActionCapabilities
{
    bool canTerminate = false; // SIGTERM
};

/// Interface for platform-specific process actions.
class IProcessActions
{
  public:
    virtual ~IProcessActions() = default;

    IProcessActions() = default;
    IProcessActions(const IProcessActions&) = default;
    IProcessActions& operator=(const IProcessActions&) = default;
    IProcessActions(IProcessActions&&) = default;
    IProcessActions& operator=(IProcessActions&&) = default;

    /// What actions this platform supports.
    [[nodiscard]] virtual ProcessActionCapabilities actionCapabilities() const = 0;

    /// Send SIGTERM (graceful termination request).
    [[nodiscard]] virtual ProcessActionResult terminate(std::int32_t pid) = 0;
};

} // namespace Platform
