#pragma once

#include "Platform/IProcessProbe.h"

#include <cstdint>
#include <filesystem>

namespace Platform
{

/// Linux implementation of IProcessProbe.
/// Reads from /proc filesystem.
class LinuxProcessProbe : public IProcessProbe
{
  public:
    /// @param procRoot Root of the proc filesystem (overridable for tests).
    explicit LinuxProcessProbe(std::filesystem::path procRoot = "/proc");
    ~LinuxProcessProbe() override = default;

    LinuxProcessProbe(const LinuxProcessProbe&) = delete;
    LinuxProcessProbe& operator=(const LinuxProcessProbe&) = delete;
    LinuxProcessProbe(LinuxProcessProbe&&) = default;
    LinuxProcessProbe& operator=(LinuxProcessProbe&&) = default;

    [[nodiscard]] std::vector<ProcessCounters> enumerate() override;

  private:
    std::filesystem::path m_ProcRoot;
    std::uint64_t m_PageSize;

    /// Parse /proc/[pid]/stat for a single process
    [[nodiscard]] bool parseProcessStat(std::int32_t pid, ProcessCounters& counters) const;

    /// Parse /proc/[pid]/statm for resident memory
    void parseProcessStatm(std::int32_t pid, ProcessCounters& counters) const;
};

} // namespace Platform
