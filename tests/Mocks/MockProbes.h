/// @file MockProbes.h
/// @brief Shared mock implementations for platform probes, process actions and the list sink.

#pragma once

#include "Domain/ProcessListReconciler.h"
#include "Domain/ProcessRecord.h"
#include "Platform/IProcessActions.h"
#include "Platform/IProcessProbe.h"
#include "Platform/ISystemProbe.h"
#include "Platform/ProcessTypes.h"
#include "Platform/SystemTypes.h"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace TestMocks
{

// =============================================================================
// Test Data Helpers
// =============================================================================

/// Create a ProcessCounters struct with the fields a probe normally fills.
inline Platform::ProcessCounters makeProcessCounters(std::int32_t pid, const std::string& name, std::uint64_t rssBytes = 1024 * 1024)
{
    Platform::ProcessCounters c;
    c.pid = pid;
    c.name = name;
    c.rssBytes = rssBytes;
    return c;
}

/// Create a ProcessRecord as the sampler would emit it.
inline Domain::ProcessRecord makeRecord(std::int32_t pid, std::uint64_t rssBytes, const std::string& name = "", bool isEssential = false)
{
    Domain::ProcessRecord r;
    r.pid = pid;
    r.residentMemoryBytes = rssBytes;
    r.displayName = name.empty() ? "proc_" + std::to_string(pid) : name;
    r.isEssential = isEssential;
    return r;
}

/// Create MemoryCounters with MemAvailable present.
inline Platform::MemoryCounters makeMemoryCounters(std::uint64_t total, std::uint64_t available)
{
    Platform::MemoryCounters m;
    m.totalBytes = total;
    m.availableBytes = available;
    m.hasAvailable = true;
    return m;
}

/// Create a Sample with the given records and sequence number.
inline Domain::Sample makeSample(std::vector<Domain::ProcessRecord> processes, std::uint64_t sequence)
{
    Domain::Sample s;
    s.processes = std::move(processes);
    s.sequence = sequence;
    s.memory = Domain::SystemMemorySummary{.totalBytes = 8ULL << 30, .availableBytes = 6ULL << 30, .usedBytes = 2ULL << 30};
    return s;
}

// =============================================================================
// Mock Process Probe
// =============================================================================

/// Mock implementation of IProcessProbe for testing.
/// Safe to reconfigure while a sampler thread is enumerating.
class MockProcessProbe : public Platform::IProcessProbe
{
  public:
    MockProcessProbe& withProcess(std::int32_t pid, const std::string& name, std::uint64_t rssBytes = 1024 * 1024)
    {
        std::scoped_lock lock(m_Mutex);
        m_Counters.push_back(makeProcessCounters(pid, name, rssBytes));
        return *this;
    }

    MockProcessProbe& withProcess(Platform::ProcessCounters counter)
    {
        std::scoped_lock lock(m_Mutex);
        m_Counters.push_back(std::move(counter));
        return *this;
    }

    void setCounters(std::vector<Platform::ProcessCounters> counters)
    {
        std::scoped_lock lock(m_Mutex);
        m_Counters = std::move(counters);
    }

    [[nodiscard]] std::vector<Platform::ProcessCounters> enumerate() override
    {
        m_EnumerateCount.fetch_add(1);
        std::scoped_lock lock(m_Mutex);
        return m_Counters;
    }

    /// Get number of times enumerate() was called (thread-safe).
    [[nodiscard]] int enumerateCount() const
    {
        return m_EnumerateCount.load();
    }

  private:
    mutable std::mutex m_Mutex;
    std::vector<Platform::ProcessCounters> m_Counters;
    std::atomic<int> m_EnumerateCount{0};
};

// =============================================================================
// Mock System Probe
// =============================================================================

/// Mock implementation of ISystemProbe for testing.
class MockSystemProbe : public Platform::ISystemProbe
{
  public:
    void setMemory(std::optional<Platform::MemoryCounters> memory)
    {
        std::scoped_lock lock(m_Mutex);
        m_Memory = memory;
    }

    [[nodiscard]] std::optional<Platform::MemoryCounters> readMemory() override
    {
        m_ReadCount.fetch_add(1);
        std::scoped_lock lock(m_Mutex);
        return m_Memory;
    }

    [[nodiscard]] int readCount() const
    {
        return m_ReadCount.load();
    }

  private:
    mutable std::mutex m_Mutex;
    std::optional<Platform::MemoryCounters> m_Memory = makeMemoryCounters(8ULL << 30, 6ULL << 30);
    std::atomic<int> m_ReadCount{0};
};

// =============================================================================
// Mock Process Actions
// =============================================================================

/// Records terminate() calls and returns a scripted status per PID (Ok by default).
class MockProcessActions : public Platform::IProcessActions
{
  public:
    MockProcessActions& withStatus(std::int32_t pid, Platform::ProcessActionStatus status, std::string message = "scripted")
    {
        m_Scripted[pid] = Platform::ProcessActionResult{.status = status, .errorMessage = std::move(message)};
        return *this;
    }

    void setCanTerminate(bool canTerminate)
    {
        m_CanTerminate = canTerminate;
    }

    [[nodiscard]] Platform::ProcessActionCapabilities actionCapabilities() const override
    {
        return {.canTerminate = m_CanTerminate};
    }

    [[nodiscard]] Platform::ProcessActionResult terminate(std::int32_t pid) override
    {
        m_Terminated.push_back(pid);
        const auto it = m_Scripted.find(pid);
        return it != m_Scripted.end() ? it->second : Platform::ProcessActionResult::ok();
    }

    /// PIDs passed to terminate(), in call order.
    [[nodiscard]] const std::vector<std::int32_t>& terminated() const
    {
        return m_Terminated;
    }

  private:
    std::map<std::int32_t, Platform::ProcessActionResult> m_Scripted;
    std::vector<std::int32_t> m_Terminated;
    bool m_CanTerminate = true;
};

// =============================================================================
// Recording List Sink
// =============================================================================

/// IProcessListSink that keeps a row vector and counts every mutation.
class RecordingSink : public Domain::IProcessListSink
{
  public:
    void insertRow(std::size_t index, const Domain::DisplayRow& row) override
    {
        ++inserts;
        rows.insert(rows.begin() + static_cast<std::ptrdiff_t>(std::min(index, rows.size())), row);
    }

    void updateRow(const Domain::DisplayRow& row) override
    {
        ++updates;
        updatedPids.push_back(row.pid);
        if (auto it = find(row.pid); it != rows.end())
        {
            *it = row;
        }
    }

    void removeRow(std::int32_t pid) override
    {
        ++removes;
        if (auto it = find(pid); it != rows.end())
        {
            rows.erase(it);
        }
    }

    void moveRow(std::int32_t pid, std::size_t index) override
    {
        ++moves;
        auto it = find(pid);
        if (it == rows.end())
        {
            return;
        }
        auto row = *it;
        rows.erase(it);
        rows.insert(rows.begin() + static_cast<std::ptrdiff_t>(std::min(index, rows.size())), row);
    }

    void selectRow(std::int32_t pid) override
    {
        selected = pid;
    }

    void clearSelection() override
    {
        ++clearSelectionCount;
        selected.reset();
    }

    [[nodiscard]] std::optional<std::int32_t> selectedPid() const override
    {
        return selected;
    }

    [[nodiscard]] float scrollFraction() const override
    {
        return scroll;
    }

    void setScrollFraction(float fraction) override
    {
        scroll = fraction;
        ++scrollRestores;
    }

    void ensureVisible(std::int32_t pid) override
    {
        ensuredVisible = pid;
    }

    [[nodiscard]] std::vector<std::int32_t> pids() const
    {
        std::vector<std::int32_t> result;
        result.reserve(rows.size());
        for (const auto& row : rows)
        {
            result.push_back(row.pid);
        }
        return result;
    }

    [[nodiscard]] const Domain::DisplayRow* row(std::int32_t pid) const
    {
        const auto it = std::ranges::find(rows, pid, &Domain::DisplayRow::pid);
        return it != rows.end() ? &*it : nullptr;
    }

    void resetCounts()
    {
        inserts = updates = removes = moves = scrollRestores = clearSelectionCount = 0;
        updatedPids.clear();
        ensuredVisible.reset();
    }

    std::vector<Domain::DisplayRow> rows;
    std::optional<std::int32_t> selected;
    std::optional<std::int32_t> ensuredVisible;
    float scroll = 0.0F;

    int inserts = 0;
    int updates = 0;
    int removes = 0;
    int moves = 0;
    int scrollRestores = 0;
    int clearSelectionCount = 0;
    std::vector<std::int32_t> updatedPids;

  private:
    std::vector<Domain::DisplayRow>::iterator find(std::int32_t pid)
    {
        return std::ranges::find(rows, pid, &Domain::DisplayRow::pid);
    }
};

} // namespace TestMocks
