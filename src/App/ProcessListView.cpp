#include "ProcessListView.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <utility>

namespace App
{

namespace
{

[[nodiscard]] auto findRow(std::vector<Domain::DisplayRow>& rows, std::int32_t pid)
{
    return std::ranges::find(rows, pid, &Domain::DisplayRow::pid);
}

} // namespace

void ProcessListView::insertRow(std::size_t index, const Domain::DisplayRow& row)
{
    const auto clamped = std::min(index, m_Rows.size());
    m_Rows.insert(m_Rows.begin() + static_cast<std::ptrdiff_t>(clamped), row);
}

void ProcessListView::updateRow(const Domain::DisplayRow& row)
{
    auto it = findRow(m_Rows, row.pid);
    if (it == m_Rows.end())
    {
        spdlog::warn("ProcessListView: update for unknown PID {}", row.pid);
        return;
    }
    *it = row;
}

void ProcessListView::removeRow(std::int32_t pid)
{
    auto it = findRow(m_Rows, pid);
    if (it != m_Rows.end())
    {
        m_Rows.erase(it);
    }
    if (m_PendingEnsureVisible == pid)
    {
        m_PendingEnsureVisible.reset();
    }
}

void ProcessListView::moveRow(std::int32_t pid, std::size_t index)
{
    auto it = findRow(m_Rows, pid);
    if (it == m_Rows.end())
    {
        spdlog::warn("ProcessListView: move for unknown PID {}", pid);
        return;
    }

    Domain::DisplayRow row = std::move(*it);
    m_Rows.erase(it);
    const auto clamped = std::min(index, m_Rows.size());
    m_Rows.insert(m_Rows.begin() + static_cast<std::ptrdiff_t>(clamped), std::move(row));
}

void ProcessListView::selectRow(std::int32_t pid)
{
    m_SelectedPid = pid;
}

void ProcessListView::clearSelection()
{
    m_SelectedPid.reset();
}

std::optional<std::int32_t> ProcessListView::selectedPid() const
{
    return m_SelectedPid;
}

float ProcessListView::scrollFraction() const
{
    return m_ScrollFraction;
}

void ProcessListView::setScrollFraction(float fraction)
{
    m_ScrollFraction = std::clamp(fraction, 0.0F, 1.0F);
    m_PendingScroll = m_ScrollFraction;
}

void ProcessListView::ensureVisible(std::int32_t pid)
{
    m_PendingEnsureVisible = pid;
}

std::optional<std::size_t> ProcessListView::indexOf(std::int32_t pid) const
{
    const auto it = std::ranges::find(m_Rows, pid, &Domain::DisplayRow::pid);
    if (it == m_Rows.end())
    {
        return std::nullopt;
    }
    return static_cast<std::size_t>(std::distance(m_Rows.begin(), it));
}

const Domain::DisplayRow* ProcessListView::selectedRow() const
{
    if (!m_SelectedPid.has_value())
    {
        return nullptr;
    }
    const auto index = indexOf(*m_SelectedPid);
    return index.has_value() ? &m_Rows[*index] : nullptr;
}

void ProcessListView::userSelect(std::int32_t pid)
{
    m_SelectedPid = pid;
}

void ProcessListView::observeScroll(float fraction)
{
    m_ScrollFraction = std::clamp(fraction, 0.0F, 1.0F);
}

std::optional<float> ProcessListView::takePendingScroll()
{
    return std::exchange(m_PendingScroll, std::nullopt);
}

std::optional<std::int32_t> ProcessListView::takePendingEnsureVisible()
{
    return std::exchange(m_PendingEnsureVisible, std::nullopt);
}

} // namespace App
