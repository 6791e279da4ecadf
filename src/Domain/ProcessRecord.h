#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Domain
{

/// UI-ready process data for one sample.
/// Recreated every cycle; never retained across samples.
struct ProcessRecord
{
    std::int32_t pid = 0;
    std::uint64_t residentMemoryBytes = 0; // 0 if the OS did not report it
    bool isEssential = false;              // Derived by EssentialProcessPolicy each cycle
    std::string displayName = "?";         // "?" if the OS did not report it
};

/// Whole-system memory totals.
/// used + available is not guaranteed to equal total.
struct SystemMemorySummary
{
    std::uint64_t totalBytes = 0;
    std::uint64_t availableBytes = 0;
    std::uint64_t usedBytes = 0;
};

/// One complete, immutable snapshot of process and memory state.
struct Sample
{
    std::vector<ProcessRecord> processes; // Unordered
    std::optional<SystemMemorySummary> memory; // nullopt when the memory read failed
    std::chrono::steady_clock::time_point takenAt{};
    std::uint64_t sequence = 0;
};

} // namespace Domain
