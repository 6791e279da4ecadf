#pragma once

#include "Domain/ProcessRecord.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Domain
{

/// Opaque, never-reused token identifying one on-screen row for its whole lifetime.
using RowHandle = std::uint64_t;

/// Last-rendered state of one displayed process, keyed by PID.
struct DisplayRow
{
    std::int32_t pid = 0;
    std::uint64_t residentMemoryBytes = 0;
    RowHandle handle = 0;
    bool isEssential = false; // Selects one of the two row tags (essential / non-essential)
    std::string displayName;
};

/// Ordered, identity-keyed list surface the reconciler drives.
/// All calls happen on the thread that owns the display.
class IProcessListSink
{
  public:
    virtual ~IProcessListSink() = default;

    IProcessListSink() = default;
    IProcessListSink(const IProcessListSink&) = default;
    IProcessListSink& operator=(const IProcessListSink&) = default;
    IProcessListSink(IProcessListSink&&) = default;
    IProcessListSink& operator=(IProcessListSink&&) = default;

    /// Create a row so that it ends up at @p index.
    virtual void insertRow(std::size_t index, const DisplayRow& row) = 0;

    /// Replace the fields of the existing row with the same PID, keeping its position and handle.
    virtual void updateRow(const DisplayRow& row) = 0;

    virtual void removeRow(std::int32_t pid) = 0;

    /// Detach the row for @p pid and re-insert it so that it ends up at @p index.
    virtual void moveRow(std::int32_t pid, std::size_t index) = 0;

    virtual void selectRow(std::int32_t pid) = 0;
    virtual void clearSelection() = 0;
    [[nodiscard]] virtual std::optional<std::int32_t> selectedPid() const = 0;

    /// Vertical scroll position in [0, 1].
    [[nodiscard]] virtual float scrollFraction() const = 0;
    virtual void setScrollFraction(float fraction) = 0;

    /// Scroll the minimum amount needed for the row to be on screen.
    virtual void ensureVisible(std::int32_t pid) = 0;
};

/// Display state carried between reconciliations. Owned by a single thread.
struct ReconcilerState
{
    std::unordered_map<std::int32_t, DisplayRow> rows;
    std::vector<std::int32_t> order; // PIDs in display order
    std::optional<std::int32_t> selectedPid;
    float scrollFraction = 0.0F;
    RowHandle nextHandle = 1;

    [[nodiscard]] const DisplayRow* find(std::int32_t pid) const;

    /// Rows in the order they are shown.
    [[nodiscard]] std::vector<DisplayRow> rowsInDisplayOrder() const;
};

/// Outcome of one reconciliation.
struct ReconcileResult
{
    std::vector<std::int32_t> order;
    std::optional<std::int32_t> selectedPid;
    std::size_t inserted = 0;
    std::size_t updated = 0;
    std::size_t removed = 0;
    std::size_t moved = 0;

    [[nodiscard]] bool layoutChanged() const noexcept
    {
        return inserted != 0 || removed != 0 || moved != 0;
    }
};

/// Brings a displayed row set in line with a fresh, unordered sample.
///
/// Target order is resident memory descending (stable for ties). Rows present in both the
/// previous state and the sample are updated in place; new PIDs get fresh rows, vanished PIDs
/// are removed, and survivors are repositioned with the fewest moves (rows on a longest
/// increasing run of target positions stay put). Selection follows the PID, never the index.
///
/// PID identity is the PID value alone: a PID reused by an unrelated process within one refresh
/// interval is indistinguishable from the original process and keeps its row.
class ProcessListReconciler
{
  public:
    /// Reconcile @p state and @p sink against @p processes.
    /// Selection and scroll fraction are read from the sink before any mutation.
    static ReconcileResult reconcile(ReconcilerState& state, const std::vector<ProcessRecord>& processes, IProcessListSink& sink);

    /// The canonical display order: resident memory descending, stable, first occurrence of a PID wins.
    [[nodiscard]] static std::vector<ProcessRecord> sortedForDisplay(const std::vector<ProcessRecord>& processes);
};

} // namespace Domain
