#pragma once

#include "Domain/EssentialProcessPolicy.h"
#include "Domain/ProcessListReconciler.h"
#include "Platform/IProcessActions.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Domain
{

enum class TerminateOutcome : std::uint8_t
{
    Sent,             // SIGTERM delivered
    Blocked,          // Essential; no signal was sent
    NotFound,         // Process had already exited
    PermissionDenied, // Caller lacks permission to signal it
    Failed,           // Any other OS error
};

[[nodiscard]] constexpr std::string_view toString(TerminateOutcome outcome) noexcept
{
    switch (outcome)
    {
    case TerminateOutcome::Sent:
        return "Sent";
    case TerminateOutcome::Blocked:
        return "Blocked";
    case TerminateOutcome::NotFound:
        return "NotFound";
    case TerminateOutcome::PermissionDenied:
        return "PermissionDenied";
    case TerminateOutcome::Failed:
        return "Failed";
    }
    return "Unknown";
}

struct TerminateResult
{
    TerminateOutcome outcome = TerminateOutcome::Failed;
    std::int32_t pid = 0;
    std::string name;
    std::string message; // User-facing text; empty for Sent and NotFound
};

/// Aggregate of a "clean all non-essential" pass.
struct CleanupReport
{
    std::size_t attempted = 0; // Termination requests issued to the OS
    std::size_t sent = 0;
    std::size_t blocked = 0; // Essential rows skipped
    std::size_t notFound = 0;
    std::size_t skippedSelf = 0;
    std::vector<TerminateResult> failures; // PermissionDenied and Failed entries
};

/// Applies the essential-process policy in front of the platform's terminate action.
class ProcessTerminator
{
  public:
    explicit ProcessTerminator(std::unique_ptr<Platform::IProcessActions> actions, EssentialProcessPolicy policy = {});
    ~ProcessTerminator() = default;

    ProcessTerminator(const ProcessTerminator&) = delete;
    ProcessTerminator& operator=(const ProcessTerminator&) = delete;
    ProcessTerminator(ProcessTerminator&&) = default;
    ProcessTerminator& operator=(ProcessTerminator&&) = default;

    /// Request graceful termination of one process. Essential processes are never signalled.
    [[nodiscard]] TerminateResult terminate(std::int32_t pid, std::string_view name);

    /// Terminate every non-essential row in @p displayedRows (display order).
    /// Continues past individual failures.
    [[nodiscard]] CleanupReport cleanNonEssential(const std::vector<DisplayRow>& displayedRows);

    /// PID that cleanNonEssential never signals (normally our own process).
    void setSelfPid(std::optional<std::int32_t> pid)
    {
        m_SelfPid = pid;
    }

    [[nodiscard]] const EssentialProcessPolicy& policy() const noexcept
    {
        return m_Policy;
    }

    [[nodiscard]] bool canTerminate() const;

  private:
    std::unique_ptr<Platform::IProcessActions> m_Actions;
    EssentialProcessPolicy m_Policy;
    std::optional<std::int32_t> m_SelfPid;
};

} // namespace Domain
