// Benchmarks for Domain/ProcessListReconciler
//
// Reconciliation runs on the UI thread once per sample, so its cost is paid
// as frame time. The interesting cases are a steady list (most rows unchanged)
// and a churning one (memory values shuffle the ordering).

#include "Domain/ProcessListReconciler.h"
#include "Domain/ProcessSampler.h"
#include "Platform/Factory.h"

#include <cstdint>
#include <fstream>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include <benchmark/benchmark.h>

#include <unistd.h>

namespace
{

/// Resident bytes of this process from /proc/self/statm; 0 when unavailable.
[[nodiscard]] std::int64_t currentRssBytes()
{
    std::ifstream statm("/proc/self/statm");
    std::int64_t sizePages = 0;
    std::int64_t residentPages = 0;
    if (!(statm >> sizePages >> residentPages))
    {
        return 0;
    }
    return residentPages * static_cast<std::int64_t>(::sysconf(_SC_PAGESIZE));
}

/// Growth of resident memory across the timed loop; a leak in the
/// reconciler's retained state shows up here as a delta that scales with churn.
void reportRssDelta(benchmark::State& state, std::int64_t rssBeforeBytes)
{
    state.counters["rss_delta_kb"] = benchmark::Counter(static_cast<double>(currentRssBytes() - rssBeforeBytes) / 1024.0);
}

/// Sink that only counts; isolates the reconciler from any display cost.
class CountingSink : public Domain::IProcessListSink
{
  public:
    void insertRow(std::size_t /*index*/, const Domain::DisplayRow& /*row*/) override
    {
        ++m_Mutations;
    }
    void updateRow(const Domain::DisplayRow& /*row*/) override
    {
        ++m_Mutations;
    }
    void removeRow(std::int32_t /*pid*/) override
    {
        ++m_Mutations;
    }
    void moveRow(std::int32_t /*pid*/, std::size_t /*index*/) override
    {
        ++m_Mutations;
    }
    void selectRow(std::int32_t pid) override
    {
        m_Selected = pid;
    }
    void clearSelection() override
    {
        m_Selected.reset();
    }
    [[nodiscard]] std::optional<std::int32_t> selectedPid() const override
    {
        return m_Selected;
    }
    [[nodiscard]] float scrollFraction() const override
    {
        return 0.0F;
    }
    void setScrollFraction(float /*fraction*/) override
    {
    }
    void ensureVisible(std::int32_t /*pid*/) override
    {
    }

    [[nodiscard]] std::uint64_t mutations() const
    {
        return m_Mutations;
    }

  private:
    std::uint64_t m_Mutations = 0;
    std::optional<std::int32_t> m_Selected;
};

std::vector<Domain::ProcessRecord> makeProcesses(std::size_t count, std::mt19937_64& rng)
{
    std::uniform_int_distribution<std::uint64_t> memDist(1ULL << 20, 4ULL << 30);
    std::vector<Domain::ProcessRecord> processes;
    processes.reserve(count);
    for (std::size_t i = 0; i < count; ++i)
    {
        processes.push_back({.pid = static_cast<std::int32_t>(i + 1),
                             .residentMemoryBytes = memDist(rng),
                             .isEssential = false,
                             .displayName = "proc_" + std::to_string(i + 1)});
    }
    return processes;
}

// Same sample every time: should do no sink mutations after the first pass
static void BM_Reconcile_Steady(benchmark::State& state)
{
    std::mt19937_64 rng(42);
    const auto processes = makeProcesses(static_cast<std::size_t>(state.range(0)), rng);

    Domain::ReconcilerState reconcilerState;
    CountingSink sink;
    (void) Domain::ProcessListReconciler::reconcile(reconcilerState, processes, sink);

    for (auto _ : state)
    {
        auto result = Domain::ProcessListReconciler::reconcile(reconcilerState, processes, sink);
        benchmark::DoNotOptimize(result.order.data());
    }

    state.counters["mutations"] = benchmark::Counter(static_cast<double>(sink.mutations()));
}
BENCHMARK(BM_Reconcile_Steady)->Arg(100)->Arg(500)->Arg(2000);

// Ten percent of rows change memory each pass, plus a few exits and arrivals
static void BM_Reconcile_Churn(benchmark::State& state)
{
    const auto count = static_cast<std::size_t>(state.range(0));
    std::mt19937_64 rng(42);
    auto processes = makeProcesses(count, rng);
    std::uniform_int_distribution<std::size_t> indexDist(0, count - 1);
    std::uniform_int_distribution<std::uint64_t> memDist(1ULL << 20, 4ULL << 30);
    auto nextPid = static_cast<std::int32_t>(count + 1);

    Domain::ReconcilerState reconcilerState;
    CountingSink sink;
    (void) Domain::ProcessListReconciler::reconcile(reconcilerState, processes, sink);

    const auto rssBefore = currentRssBytes();

    for (auto _ : state)
    {
        state.PauseTiming();
        for (std::size_t i = 0; i < count / 10; ++i)
        {
            processes[indexDist(rng)].residentMemoryBytes = memDist(rng);
        }
        for (int i = 0; i < 3; ++i)
        {
            processes[indexDist(rng)].pid = nextPid++;
        }
        state.ResumeTiming();

        auto result = Domain::ProcessListReconciler::reconcile(reconcilerState, processes, sink);
        benchmark::DoNotOptimize(result.order.data());
    }

    reportRssDelta(state, rssBefore);
}
BENCHMARK(BM_Reconcile_Churn)->Arg(100)->Arg(500)->Arg(2000);

// Sorting alone: the part of reconcile that scales with n log n
static void BM_SortedForDisplay(benchmark::State& state)
{
    std::mt19937_64 rng(7);
    const auto processes = makeProcesses(static_cast<std::size_t>(state.range(0)), rng);

    for (auto _ : state)
    {
        auto sorted = Domain::ProcessListReconciler::sortedForDisplay(processes);
        benchmark::DoNotOptimize(sorted.data());
    }

    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_SortedForDisplay)->Arg(500)->Arg(5000);

// Full pipeline against the real /proc: sample then reconcile
static void BM_SampleAndReconcile(benchmark::State& state)
{
    Domain::ProcessSampler sampler(Platform::makeProcessProbe(), Platform::makeSystemProbe());
    Domain::ReconcilerState reconcilerState;
    CountingSink sink;

    const auto rssBefore = currentRssBytes();

    for (auto _ : state)
    {
        auto sample = sampler.sample();
        auto result = Domain::ProcessListReconciler::reconcile(reconcilerState, sample.processes, sink);
        benchmark::DoNotOptimize(result.order.data());
    }

    state.counters["processes"] = benchmark::Counter(static_cast<double>(reconcilerState.order.size()));
    reportRssDelta(state, rssBefore);
}
BENCHMARK(BM_SampleAndReconcile)->Unit(benchmark::kMillisecond);

} // namespace
