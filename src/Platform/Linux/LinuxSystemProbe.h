#pragma once

#include "Platform/ISystemProbe.h"

#include <filesystem>

namespace Platform
{

/// Linux implementation of ISystemProbe.
/// Reads memory totals from /proc/meminfo.
class LinuxSystemProbe : public ISystemProbe
{
  public:
    /// @param meminfoPath Path of the meminfo file (overridable for tests).
    explicit LinuxSystemProbe(std::filesystem::path meminfoPath = "/proc/meminfo");
    ~LinuxSystemProbe() override = default;

    LinuxSystemProbe(const LinuxSystemProbe&) = delete;
    LinuxSystemProbe& operator=(const LinuxSystemProbe&) = delete;
    LinuxSystemProbe(LinuxSystemProbe&&) = default;
    LinuxSystemProbe& operator=(LinuxSystemProbe&&) = default;

    [[nodiscard]] std::optional<MemoryCounters> readMemory() override;

  private:
    std::filesystem::path m_MeminfoPath;
};

} // namespace Platform
