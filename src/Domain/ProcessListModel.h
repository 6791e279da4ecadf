#pragma once

#include "Domain/ProcessListReconciler.h"
#include "Domain/ProcessRecord.h"

#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

namespace Domain
{

/// Hand-off point between the sampler thread and the UI thread.
///
/// submit() may be called from any thread and keeps only the newest unconsumed sample.
/// applyPending() and apply() run on the UI thread and are the only code that touches
/// the reconciler state or the display surface.
class ProcessListModel
{
  public:
    ProcessListModel() = default;
    ~ProcessListModel() = default;

    ProcessListModel(const ProcessListModel&) = delete;
    ProcessListModel& operator=(const ProcessListModel&) = delete;
    ProcessListModel(ProcessListModel&&) = delete;
    ProcessListModel& operator=(ProcessListModel&&) = delete;

    /// Store @p sample for the UI thread, replacing any sample not yet applied.
    void submit(Sample sample);

    [[nodiscard]] bool hasPending() const;

    /// Reconcile the pending sample, if any, into @p sink.
    /// Returns nullopt when there was nothing to apply or a reconciliation is already running.
    std::optional<ReconcileResult> applyPending(IProcessListSink& sink);

    /// Reconcile @p sample directly, bypassing the mailbox.
    std::optional<ReconcileResult> apply(Sample sample, IProcessListSink& sink);

    [[nodiscard]] const ReconcilerState& state() const noexcept
    {
        return m_State;
    }

    [[nodiscard]] std::vector<DisplayRow> displayedRows() const
    {
        return m_State.rowsInDisplayOrder();
    }

    /// Memory summary of the last applied sample; nullopt if it could not be read.
    [[nodiscard]] const std::optional<SystemMemorySummary>& memory() const noexcept
    {
        return m_Memory;
    }

    /// True once at least one sample has been applied.
    [[nodiscard]] bool hasSample() const noexcept
    {
        return m_LastSequence != 0;
    }

    [[nodiscard]] std::uint64_t lastSequence() const noexcept
    {
        return m_LastSequence;
    }

  private:
    mutable std::mutex m_PendingMutex;
    std::optional<Sample> m_Pending;

    ReconcilerState m_State;
    std::optional<SystemMemorySummary> m_Memory;
    std::uint64_t m_LastSequence = 0;
    bool m_Reconciling = false;
};

} // namespace Domain
