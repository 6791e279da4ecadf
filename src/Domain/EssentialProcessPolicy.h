#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace Domain
{

/// Longest process name the Linux kernel reports (comm is TASK_COMM_LEN - 1 bytes).
inline constexpr std::size_t KERNEL_COMM_MAX_LENGTH = 15;

/// Decides which processes are protected from termination.
/// A process is essential when its PID is in the protected PID set or its name
/// exactly matches a protected name. A protected name longer than the kernel's comm
/// limit also matches its truncated form, since that is all /proc reports.
/// Pure; no I/O.
class EssentialProcessPolicy
{
  public:
    /// Policy with the built-in protected PIDs and names.
    EssentialProcessPolicy();

    EssentialProcessPolicy(std::vector<std::int32_t> protectedPids, std::vector<std::string> protectedNames);

    [[nodiscard]] bool isEssential(std::int32_t pid, std::string_view name) const;

    [[nodiscard]] bool isProtectedPid(std::int32_t pid) const
    {
        return m_ProtectedPids.contains(pid);
    }

    [[nodiscard]] bool isProtectedName(std::string_view name) const
    {
        return m_ProtectedNames.contains(name) ||
               (name.size() == KERNEL_COMM_MAX_LENGTH && m_TruncatedNames.contains(name));
    }

    [[nodiscard]] const std::set<std::int32_t>& protectedPids() const noexcept
    {
        return m_ProtectedPids;
    }

    [[nodiscard]] const std::set<std::string, std::less<>>& protectedNames() const noexcept
    {
        return m_ProtectedNames;
    }

    [[nodiscard]] static std::vector<std::int32_t> defaultProtectedPids();
    [[nodiscard]] static std::vector<std::string> defaultProtectedNames();

  private:
    std::set<std::int32_t> m_ProtectedPids;
    std::set<std::string, std::less<>> m_ProtectedNames;
    std::set<std::string, std::less<>> m_TruncatedNames; // Comm-length prefixes of over-long protected names
};

} // namespace Domain
