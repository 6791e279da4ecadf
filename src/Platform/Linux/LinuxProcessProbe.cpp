// Keep this translation unit parseable on non-Linux platforms (e.g. clangd on another host)
// by compiling the implementation only when targeting Linux and required headers exist.
#if defined(__linux__) && __has_include(<unistd.h>)

#include "LinuxProcessProbe.h"

#include <spdlog/spdlog.h>

#include <charconv>
#include <fstream>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

#include <unistd.h>

namespace Platform
{

namespace
{

template<std::integral T> [[nodiscard]] constexpr auto toU64PositiveOr(T value, std::uint64_t fallback) noexcept -> std::uint64_t
{
    if constexpr (std::is_signed_v<T>)
    {
        if (value <= 0)
        {
            return fallback;
        }
    }
    else
    {
        if (value == 0)
        {
            return fallback;
        }
    }

    return static_cast<std::uint64_t>(value);
}

} // namespace

LinuxProcessProbe::LinuxProcessProbe(std::filesystem::path procRoot)
    : m_ProcRoot(std::move(procRoot)), m_PageSize(toU64PositiveOr(sysconf(_SC_PAGESIZE), 4096ULL))
{
    spdlog::debug("LinuxProcessProbe: root={}, pageSize={}", m_ProcRoot.string(), m_PageSize);
}

std::vector<ProcessCounters> LinuxProcessProbe::enumerate()
{
    std::vector<ProcessCounters> processes;
    processes.reserve(500); // Reasonable initial size

    std::error_code errorCode;
    std::filesystem::directory_iterator it(m_ProcRoot, errorCode);
    if (errorCode)
    {
        spdlog::warn("Cannot open {}: {}", m_ProcRoot.string(), errorCode.message());
        return processes;
    }

    for (; it != std::filesystem::directory_iterator(); it.increment(errorCode))
    {
        if (errorCode)
        {
            spdlog::warn("Error iterating {}: {}", m_ProcRoot.string(), errorCode.message());
            break;
        }

        // Entries may disappear between readdir and stat
        std::error_code entryError;
        if (!it->is_directory(entryError))
        {
            continue;
        }

        const auto filename = it->path().filename().string();
        std::int32_t pid = 0;

        // Check if directory name is a number (process ID)
        const auto result = std::from_chars(filename.data(), filename.data() + filename.size(), pid);
        if (result.ec != std::errc{} || result.ptr != filename.data() + filename.size() || pid < 0)
        {
            continue;
        }

        ProcessCounters counters{};
        if (!parseProcessStat(pid, counters))
        {
            // Exited mid-enumeration or access denied
            spdlog::debug("Skipping PID {}: /proc/{}/stat unavailable", pid, pid);
            continue;
        }

        parseProcessStatm(pid, counters);
        processes.push_back(std::move(counters));
    }

    return processes;
}

bool LinuxProcessProbe::parseProcessStat(std::int32_t pid, ProcessCounters& counters) const
{
    // Format: /proc/[pid]/stat
    // Fields: pid (comm) state ppid ...

    const auto statPath = m_ProcRoot / std::to_string(pid) / "stat";
    std::ifstream statFile(statPath);
    if (!statFile.is_open())
    {
        return false;
    }

    std::string line;
    if (!std::getline(statFile, line))
    {
        return false;
    }

    // Process name is in parentheses and may contain spaces or parentheses
    // Find the last ')' to handle names like "process (name)"
    const auto nameStart = line.find('(');
    const auto nameEnd = line.rfind(')');

    if (nameStart == std::string::npos || nameEnd == std::string::npos || nameEnd <= nameStart)
    {
        return false;
    }

    counters.pid = pid;
    if (nameEnd > nameStart + 1)
    {
        counters.name = line.substr(nameStart + 1, nameEnd - nameStart - 1);
    }

    return true;
}

void LinuxProcessProbe::parseProcessStatm(std::int32_t pid, ProcessCounters& counters) const
{
    // Format: /proc/[pid]/statm
    // Fields: size resident shared text lib data dt (all in pages)

    const auto statmPath = m_ProcRoot / std::to_string(pid) / "statm";
    std::ifstream statmFile(statmPath);
    if (!statmFile.is_open())
    {
        return;
    }

    std::uint64_t size = 0;
    std::uint64_t resident = 0;

    statmFile >> size >> resident;
    if (!statmFile.fail())
    {
        counters.rssBytes = resident * m_PageSize;
    }
}

} // namespace Platform

#endif
