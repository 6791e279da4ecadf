#include "LinuxSystemProbe.h"

#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdint>
#include <fstream>
#include <string>
#include <string_view>
#include <utility>

namespace Platform
{

namespace
{

/// Parse the kB value of a "Key:   12345 kB" meminfo line.
[[nodiscard]] bool parseKbValue(std::string_view line, std::uint64_t& outBytes)
{
    const auto colonPos = line.find(':');
    if (colonPos == std::string_view::npos)
    {
        return false;
    }

    const char* begin = line.data() + colonPos + 1;
    const char* const end = line.data() + line.size();
    while (begin < end && (*begin == ' ' || *begin == '\t'))
    {
        ++begin;
    }

    std::uint64_t kb = 0;
    const auto result = std::from_chars(begin, end, kb);
    if (result.ec != std::errc{})
    {
        return false;
    }

    outBytes = kb * 1024ULL;
    return true;
}

} // namespace

LinuxSystemProbe::LinuxSystemProbe(std::filesystem::path meminfoPath) : m_MeminfoPath(std::move(meminfoPath))
{
    spdlog::debug("LinuxSystemProbe: meminfo={}", m_MeminfoPath.string());
}

std::optional<MemoryCounters> LinuxSystemProbe::readMemory()
{
    // Format: /proc/meminfo
    // MemTotal:       16384000 kB
    // MemFree:         1234567 kB
    // MemAvailable:    8765432 kB
    // Buffers:          123456 kB
    // Cached:          2345678 kB

    std::ifstream meminfo(m_MeminfoPath);
    if (!meminfo.is_open())
    {
        spdlog::warn("Failed to open {}", m_MeminfoPath.string());
        return std::nullopt;
    }

    MemoryCounters memory;
    bool hasTotal = false;

    std::string line;
    while (std::getline(meminfo, line))
    {
        if (line.starts_with("MemTotal:"))
        {
            hasTotal = parseKbValue(line, memory.totalBytes);
        }
        else if (line.starts_with("MemFree:"))
        {
            (void) parseKbValue(line, memory.freeBytes);
        }
        else if (line.starts_with("MemAvailable:"))
        {
            memory.hasAvailable = parseKbValue(line, memory.availableBytes);
        }
        else if (line.starts_with("Buffers:"))
        {
            (void) parseKbValue(line, memory.buffersBytes);
        }
        else if (line.starts_with("Cached:"))
        {
            (void) parseKbValue(line, memory.cachedBytes);
        }
    }

    if (!hasTotal || memory.totalBytes == 0)
    {
        spdlog::warn("MemTotal not found in {}", m_MeminfoPath.string());
        return std::nullopt;
    }

    return memory;
}

} // namespace Platform
