#pragma once

#include <cstdint>

namespace Platform
{

/// Raw memory counters from OS (converted to bytes).
struct MemoryCounters
{
    std::uint64_t totalBytes = 0;
    std::uint64_t freeBytes = 0;
    std::uint64_t availableBytes = 0; // Available for starting new apps (includes reclaimable cache)
    std::uint64_t buffersBytes = 0;
    std::uint64_t cachedBytes = 0;

    bool hasAvailable = false; // Some older kernels lack MemAvailable
};

} // namespace Platform
