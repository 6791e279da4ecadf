#pragma once

#include "Domain/ProcessListReconciler.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace App
{

/// Retained row list behind the process table.
///
/// The reconciler mutates it through IProcessListSink; the ImGui renderer reads rows(),
/// reports user selection and the observed scroll position, and consumes pending scroll
/// requests once per frame. Lives on the UI thread.
class ProcessListView : public Domain::IProcessListSink
{
  public:
    ProcessListView() = default;
    ~ProcessListView() override = default;

    ProcessListView(const ProcessListView&) = delete;
    ProcessListView& operator=(const ProcessListView&) = delete;
    ProcessListView(ProcessListView&&) = delete;
    ProcessListView& operator=(ProcessListView&&) = delete;

    // IProcessListSink
    void insertRow(std::size_t index, const Domain::DisplayRow& row) override;
    void updateRow(const Domain::DisplayRow& row) override;
    void removeRow(std::int32_t pid) override;
    void moveRow(std::int32_t pid, std::size_t index) override;
    void selectRow(std::int32_t pid) override;
    void clearSelection() override;
    [[nodiscard]] std::optional<std::int32_t> selectedPid() const override;
    [[nodiscard]] float scrollFraction() const override;
    void setScrollFraction(float fraction) override;
    void ensureVisible(std::int32_t pid) override;

    [[nodiscard]] const std::vector<Domain::DisplayRow>& rows() const noexcept
    {
        return m_Rows;
    }

    [[nodiscard]] std::optional<std::size_t> indexOf(std::int32_t pid) const;

    [[nodiscard]] const Domain::DisplayRow* selectedRow() const;

    /// Selection made by the user (click or keyboard).
    void userSelect(std::int32_t pid);

    /// Scroll position as rendered this frame.
    void observeScroll(float fraction);

    /// Scroll position the renderer must apply, if any. Clears the request.
    [[nodiscard]] std::optional<float> takePendingScroll();

    /// Row the renderer must bring into view, if any. Clears the request.
    [[nodiscard]] std::optional<std::int32_t> takePendingEnsureVisible();

  private:
    std::vector<Domain::DisplayRow> m_Rows;
    std::optional<std::int32_t> m_SelectedPid;
    float m_ScrollFraction = 0.0F;
    std::optional<float> m_PendingScroll;
    std::optional<std::int32_t> m_PendingEnsureVisible;
};

} // namespace App
