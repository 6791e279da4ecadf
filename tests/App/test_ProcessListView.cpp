/// @file test_ProcessListView.cpp
/// @brief Tests for App::ProcessListView, the retained rows behind the process table

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
#include "App/ProcessListView.h"
#include "Domain/ProcessListModel.h"
#include "Mocks/MockProbes.h"

#include <gtest/gtest.h>

#include <vector>

namespace App
{
namespace
{

using TestMocks::makeRecord;
using TestMocks::makeSample;

Domain::DisplayRow makeRow(std::int32_t pid, Domain::RowHandle handle)
{
    return Domain::DisplayRow{.pid = pid, .residentMemoryBytes = 0, .handle = handle, .isEssential = false, .displayName = "p"};
}

std::vector<std::int32_t> pidsOf(const ProcessListView& view)
{
    std::vector<std::int32_t> pids;
    for (const auto& row : view.rows())
    {
        pids.push_back(row.pid);
    }
    return pids;
}

// =============================================================================
// Sink operations
// =============================================================================

TEST(ProcessListViewTest, InsertAtIndex)
{
    ProcessListView view;
    view.insertRow(0, makeRow(1, 1));
    view.insertRow(1, makeRow(3, 2));
    view.insertRow(1, makeRow(2, 3));

    EXPECT_EQ(pidsOf(view), (std::vector<std::int32_t>{1, 2, 3}));
    EXPECT_EQ(view.indexOf(3), 2U);
    EXPECT_FALSE(view.indexOf(9).has_value());
}

TEST(ProcessListViewTest, InsertPastEndAppends)
{
    ProcessListView view;
    view.insertRow(10, makeRow(1, 1));

    EXPECT_EQ(pidsOf(view), (std::vector<std::int32_t>{1}));
}

TEST(ProcessListViewTest, MoveRowEndsUpAtIndex)
{
    ProcessListView view;
    for (std::int32_t pid = 1; pid <= 4; ++pid)
    {
        view.insertRow(view.rows().size(), makeRow(pid, static_cast<Domain::RowHandle>(pid)));
    }

    view.moveRow(4, 0);
    EXPECT_EQ(pidsOf(view), (std::vector<std::int32_t>{4, 1, 2, 3}));

    view.moveRow(4, 3);
    EXPECT_EQ(pidsOf(view), (std::vector<std::int32_t>{1, 2, 3, 4}));
}

TEST(ProcessListViewTest, UpdateKeepsPositionAndHandle)
{
    ProcessListView view;
    view.insertRow(0, makeRow(1, 11));
    view.insertRow(1, makeRow(2, 22));

    auto updated = makeRow(1, 11);
    updated.residentMemoryBytes = 999;
    view.updateRow(updated);

    EXPECT_EQ(view.rows()[0].residentMemoryBytes, 999U);
    EXPECT_EQ(view.rows()[0].handle, 11U);
}

TEST(ProcessListViewTest, RemoveUnknownPidIsHarmless)
{
    ProcessListView view;
    view.insertRow(0, makeRow(1, 1));

    view.removeRow(42);

    EXPECT_EQ(view.rows().size(), 1U);
}

// =============================================================================
// Selection and scroll requests
// =============================================================================

TEST(ProcessListViewTest, SelectedRowResolvesByPid)
{
    ProcessListView view;
    view.insertRow(0, makeRow(1, 1));
    view.insertRow(1, makeRow(2, 2));

    view.userSelect(2);
    ASSERT_NE(view.selectedRow(), nullptr);
    EXPECT_EQ(view.selectedRow()->pid, 2);

    view.clearSelection();
    EXPECT_EQ(view.selectedRow(), nullptr);
}

TEST(ProcessListViewTest, PendingScrollIsConsumedOnce)
{
    ProcessListView view;
    view.setScrollFraction(0.6F);

    EXPECT_FLOAT_EQ(view.scrollFraction(), 0.6F);
    EXPECT_EQ(view.takePendingScroll(), 0.6F);
    EXPECT_FALSE(view.takePendingScroll().has_value());
}

TEST(ProcessListViewTest, ScrollFractionIsClamped)
{
    ProcessListView view;

    view.observeScroll(1.7F);
    EXPECT_FLOAT_EQ(view.scrollFraction(), 1.0F);

    view.setScrollFraction(-0.5F);
    EXPECT_FLOAT_EQ(view.scrollFraction(), 0.0F);
}

TEST(ProcessListViewTest, RemovingRowCancelsEnsureVisible)
{
    ProcessListView view;
    view.insertRow(0, makeRow(1, 1));
    view.ensureVisible(1);

    view.removeRow(1);

    EXPECT_FALSE(view.takePendingEnsureVisible().has_value());
}

// =============================================================================
// Through the model
// =============================================================================

TEST(ProcessListViewTest, SelectionSurvivesReorderThroughModel)
{
    Domain::ProcessListModel model;
    ProcessListView view;

    (void) model.apply(makeSample({makeRecord(10, 50), makeRecord(20, 30)}, 1), view);
    view.userSelect(20);
    view.observeScroll(0.3F);
    const auto handle = view.rows()[1].handle;

    (void) model.apply(makeSample({makeRecord(20, 10), makeRecord(30, 90)}, 2), view);

    EXPECT_EQ(pidsOf(view), (std::vector<std::int32_t>{30, 20}));
    EXPECT_EQ(view.selectedPid(), 20);
    EXPECT_EQ(view.rows()[1].handle, handle);
    EXPECT_EQ(view.takePendingScroll(), 0.3F);
    EXPECT_EQ(view.takePendingEnsureVisible(), 20);
}

TEST(ProcessListViewTest, SelectionClearedWhenProcessExitsThroughModel)
{
    Domain::ProcessListModel model;
    ProcessListView view;

    (void) model.apply(makeSample({makeRecord(10, 50), makeRecord(20, 30)}, 1), view);
    view.userSelect(10);

    (void) model.apply(makeSample({makeRecord(20, 30)}, 2), view);

    EXPECT_FALSE(view.selectedPid().has_value());
    EXPECT_EQ(view.selectedRow(), nullptr);
}

} // namespace
} // namespace App
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
