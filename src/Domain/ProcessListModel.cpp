#include "ProcessListModel.h"

#include <spdlog/spdlog.h>

#include <utility>

namespace Domain
{

namespace
{

/// Clears the in-progress flag on every exit path.
class ReconcileGuard
{
  public:
    explicit ReconcileGuard(bool& flag) : m_Flag(flag)
    {
        m_Flag = true;
    }
    ~ReconcileGuard()
    {
        m_Flag = false;
    }

    ReconcileGuard(const ReconcileGuard&) = delete;
    ReconcileGuard& operator=(const ReconcileGuard&) = delete;
    ReconcileGuard(ReconcileGuard&&) = delete;
    ReconcileGuard& operator=(ReconcileGuard&&) = delete;

  private:
    bool& m_Flag;
};

} // namespace

void ProcessListModel::submit(Sample sample)
{
    std::lock_guard lock(m_PendingMutex);
    if (m_Pending.has_value())
    {
        spdlog::debug("ProcessListModel: sample #{} superseded by #{}", m_Pending->sequence, sample.sequence);
    }
    m_Pending = std::move(sample);
}

bool ProcessListModel::hasPending() const
{
    std::lock_guard lock(m_PendingMutex);
    return m_Pending.has_value();
}

std::optional<ReconcileResult> ProcessListModel::applyPending(IProcessListSink& sink)
{
    if (m_Reconciling)
    {
        spdlog::warn("ProcessListModel: refresh already in progress; ignoring re-entrant apply");
        return std::nullopt;
    }

    std::optional<Sample> pending;
    {
        std::lock_guard lock(m_PendingMutex);
        pending.swap(m_Pending);
    }

    if (!pending.has_value())
    {
        return std::nullopt;
    }

    return apply(std::move(*pending), sink);
}

std::optional<ReconcileResult> ProcessListModel::apply(Sample sample, IProcessListSink& sink)
{
    if (m_Reconciling)
    {
        spdlog::warn("ProcessListModel: refresh already in progress; ignoring re-entrant apply");
        return std::nullopt;
    }

    // The synchronous initial sample and the sampler thread may finish out of order.
    if (sample.sequence != 0 && sample.sequence <= m_LastSequence)
    {
        spdlog::debug("ProcessListModel: dropping stale sample #{} (last applied #{})", sample.sequence, m_LastSequence);
        return std::nullopt;
    }

    ReconcileGuard guard(m_Reconciling);

    auto result = ProcessListReconciler::reconcile(m_State, sample.processes, sink);
    m_Memory = sample.memory;
    m_LastSequence = sample.sequence != 0 ? sample.sequence : m_LastSequence + 1;
    return result;
}

} // namespace Domain
