// Benchmarks for UI/Format functions
//
// The RAM column and the summary labels are formatted for every visible row
// every frame, so these sit on the render path.

#include "UI/Format.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <random>

#include <benchmark/benchmark.h>

namespace
{

// formatMegabytes() - RAM (MB) column
static void BM_Format_FormatMegabytes(benchmark::State& state)
{
    std::mt19937_64 rng(42);
    std::uniform_int_distribution<std::uint64_t> dist(0, (1ULL << 36)); // Up to 64GB

    for (auto _ : state)
    {
        auto result = UI::Format::formatMegabytes(dist(rng));
        benchmark::DoNotOptimize(result.data());
    }
}
BENCHMARK(BM_Format_FormatMegabytes);

// formatGigabytes() - memory summary
static void BM_Format_FormatGigabytes(benchmark::State& state)
{
    std::mt19937_64 rng(42);
    std::uniform_int_distribution<std::uint64_t> dist(0, (1ULL << 40));

    for (auto _ : state)
    {
        auto result = UI::Format::formatGigabytes(dist(rng));
        benchmark::DoNotOptimize(result.data());
    }
}
BENCHMARK(BM_Format_FormatGigabytes);

static void BM_Format_MemoryLabel(benchmark::State& state)
{
    const std::optional<std::uint64_t> known = 12ULL << 30;
    const std::optional<std::uint64_t> unknown;

    for (auto _ : state)
    {
        auto a = UI::Format::memoryLabel("Total RAM", known);
        auto b = UI::Format::memoryLabel("Available RAM", unknown);
        benchmark::DoNotOptimize(a.data());
        benchmark::DoNotOptimize(b.data());
    }
}
BENCHMARK(BM_Format_MemoryLabel);

// One table row plus the status bar text
static void BM_Format_FullRow(benchmark::State& state)
{
    std::mt19937_64 rng(42);
    std::uniform_int_distribution<std::int32_t> pidDist(1, 4'194'304);
    std::uniform_int_distribution<std::uint64_t> rssDist(0, (1ULL << 34));

    for (auto _ : state)
    {
        auto pid = UI::Format::formatPid(pidDist(rng));
        auto ram = UI::Format::formatMegabytes(rssDist(rng));
        auto count = UI::Format::formatCountWithLabel(312, "process", "processes");
        auto interval = UI::Format::formatInterval(std::chrono::milliseconds{3000});
        benchmark::DoNotOptimize(pid.data());
        benchmark::DoNotOptimize(ram.data());
        benchmark::DoNotOptimize(count.data());
        benchmark::DoNotOptimize(interval.data());
    }
}
BENCHMARK(BM_Format_FullRow);

} // namespace
