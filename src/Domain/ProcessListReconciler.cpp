#include "ProcessListReconciler.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <unordered_set>
#include <utility>

namespace Domain
{

namespace
{

[[nodiscard]] bool sameFields(const DisplayRow& row, const ProcessRecord& record)
{
    return row.residentMemoryBytes == record.residentMemoryBytes && row.isEssential == record.isEssential &&
           row.displayName == record.displayName;
}

/// Indices (into @p values) of one longest strictly increasing subsequence.
[[nodiscard]] std::vector<std::size_t> longestIncreasingRun(const std::vector<std::size_t>& values)
{
    // tails[k] = index of the smallest tail value of an increasing run of length k + 1
    std::vector<std::size_t> tails;
    std::vector<std::size_t> previous(values.size(), values.size());

    for (std::size_t i = 0; i < values.size(); ++i)
    {
        const auto it = std::lower_bound(
            tails.begin(), tails.end(), values[i], [&values](std::size_t index, std::size_t value) { return values[index] < value; });

        if (it != tails.begin())
        {
            previous[i] = *std::prev(it);
        }

        if (it == tails.end())
        {
            tails.push_back(i);
        }
        else
        {
            *it = i;
        }
    }

    std::vector<std::size_t> run;
    if (tails.empty())
    {
        return run;
    }

    run.resize(tails.size());
    std::size_t cursor = tails.back();
    for (std::size_t k = tails.size(); k > 0; --k)
    {
        run[k - 1] = cursor;
        cursor = previous[cursor];
    }
    return run;
}

[[nodiscard]] std::size_t positionOf(const std::vector<std::int32_t>& order, std::int32_t pid)
{
    const auto it = std::ranges::find(order, pid);
    return static_cast<std::size_t>(std::distance(order.begin(), it));
}

} // namespace

const DisplayRow* ReconcilerState::find(std::int32_t pid) const
{
    const auto it = rows.find(pid);
    return it != rows.end() ? &it->second : nullptr;
}

std::vector<DisplayRow> ReconcilerState::rowsInDisplayOrder() const
{
    std::vector<DisplayRow> result;
    result.reserve(order.size());
    for (const auto pid : order)
    {
        if (const auto* row = find(pid))
        {
            result.push_back(*row);
        }
    }
    return result;
}

std::vector<ProcessRecord> ProcessListReconciler::sortedForDisplay(const std::vector<ProcessRecord>& processes)
{
    std::vector<ProcessRecord> sorted;
    sorted.reserve(processes.size());

    std::unordered_set<std::int32_t> seen;
    seen.reserve(processes.size());
    for (const auto& record : processes)
    {
        if (seen.insert(record.pid).second)
        {
            sorted.push_back(record);
        }
    }

    std::ranges::stable_sort(sorted, [](const ProcessRecord& a, const ProcessRecord& b) {
        return a.residentMemoryBytes > b.residentMemoryBytes;
    });
    return sorted;
}

ReconcileResult ProcessListReconciler::reconcile(ReconcilerState& state,
                                                 const std::vector<ProcessRecord>& processes,
                                                 IProcessListSink& sink)
{
    ReconcileResult result;

    // Read what the user sees before anything moves.
    state.selectedPid = sink.selectedPid();
    state.scrollFraction = std::clamp(sink.scrollFraction(), 0.0F, 1.0F);

    const auto target = sortedForDisplay(processes);

    std::unordered_map<std::int32_t, std::size_t> targetIndex;
    targetIndex.reserve(target.size());
    for (std::size_t i = 0; i < target.size(); ++i)
    {
        targetIndex.emplace(target[i].pid, i);
    }

    // Stale rows
    std::vector<std::int32_t> current;
    current.reserve(target.size());
    for (const auto pid : state.order)
    {
        if (targetIndex.contains(pid))
        {
            current.push_back(pid);
            continue;
        }
        sink.removeRow(pid);
        state.rows.erase(pid);
        ++result.removed;
    }

    // Unchanged rows: refresh fields in place
    for (const auto& record : target)
    {
        const auto it = state.rows.find(record.pid);
        if (it == state.rows.end() || sameFields(it->second, record))
        {
            continue;
        }
        it->second.residentMemoryBytes = record.residentMemoryBytes;
        it->second.isEssential = record.isEssential;
        it->second.displayName = record.displayName;
        sink.updateRow(it->second);
        ++result.updated;
    }

    // Survivors on the longest run already in target order stay where they are.
    std::vector<std::size_t> survivorTargets;
    survivorTargets.reserve(current.size());
    for (const auto pid : current)
    {
        survivorTargets.push_back(targetIndex.at(pid));
    }

    std::unordered_set<std::int32_t> anchored;
    for (const auto index : longestIncreasingRun(survivorTargets))
    {
        anchored.insert(current[index]);
    }

    // Place every other row directly after its target predecessor, left to right.
    for (std::size_t i = 0; i < target.size(); ++i)
    {
        const auto& record = target[i];
        if (anchored.contains(record.pid))
        {
            continue;
        }

        const bool isNew = !state.rows.contains(record.pid);
        if (!isNew)
        {
            current.erase(current.begin() + static_cast<std::ptrdiff_t>(positionOf(current, record.pid)));
        }

        const std::size_t destination = (i == 0) ? 0 : positionOf(current, target[i - 1].pid) + 1;

        if (isNew)
        {
            DisplayRow row{
                .pid = record.pid,
                .residentMemoryBytes = record.residentMemoryBytes,
                .handle = state.nextHandle++,
                .isEssential = record.isEssential,
                .displayName = record.displayName,
            };
            current.insert(current.begin() + static_cast<std::ptrdiff_t>(destination), record.pid);
            sink.insertRow(destination, row);
            state.rows.emplace(record.pid, std::move(row));
            ++result.inserted;
        }
        else
        {
            current.insert(current.begin() + static_cast<std::ptrdiff_t>(destination), record.pid);
            sink.moveRow(record.pid, destination);
            ++result.moved;
        }
    }

    state.order = std::move(current);

    // Selection follows the PID; it never lands on whatever now occupies the old index.
    if (state.selectedPid.has_value())
    {
        if (state.rows.contains(*state.selectedPid))
        {
            sink.selectRow(*state.selectedPid);
        }
        else
        {
            spdlog::debug("ProcessListReconciler: selected PID {} exited; clearing selection", *state.selectedPid);
            state.selectedPid.reset();
            sink.clearSelection();
        }
    }

    sink.setScrollFraction(state.scrollFraction);
    if (state.selectedPid.has_value())
    {
        sink.ensureVisible(*state.selectedPid);
    }

    result.order = state.order;
    result.selectedPid = state.selectedPid;

    spdlog::debug("ProcessListReconciler: {} rows (+{} -{} ~{} moved {})",
                  result.order.size(),
                  result.inserted,
                  result.removed,
                  result.updated,
                  result.moved);
    return result;
}

} // namespace Domain
