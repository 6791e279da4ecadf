/// @file test_ProcessListReconciler.cpp
/// @brief Tests for Domain::ProcessListReconciler
///
/// Tests cover:
/// - Display order (memory descending, stable ties, duplicate PIDs)
/// - Row identity across refreshes
/// - Minimal mutation (updates only when fields change, fewest moves)
/// - Selection and scroll preservation

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
#include "Domain/ProcessListReconciler.h"
#include "Mocks/MockProbes.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <random>
#include <vector>

namespace
{

using Domain::ProcessListReconciler;
using Domain::ReconcilerState;
using TestMocks::makeRecord;
using TestMocks::RecordingSink;

constexpr std::uint64_t MB = 1024ULL * 1024ULL;

// =============================================================================
// Ordering
// =============================================================================

TEST(ProcessListReconcilerTest, OrdersByMemoryDescending)
{
    ReconcilerState state;
    RecordingSink sink;

    const auto result = ProcessListReconciler::reconcile(state, {makeRecord(1, 10 * MB), makeRecord(2, 30 * MB), makeRecord(3, 20 * MB)}, sink);

    EXPECT_EQ(result.order, (std::vector<std::int32_t>{2, 3, 1}));
    EXPECT_EQ(sink.pids(), result.order);
    EXPECT_EQ(result.inserted, 3U);
}

TEST(ProcessListReconcilerTest, TiesKeepSampleOrder)
{
    const auto sorted = ProcessListReconciler::sortedForDisplay({makeRecord(7, 5 * MB), makeRecord(3, 5 * MB), makeRecord(9, 5 * MB)});

    ASSERT_EQ(sorted.size(), 3U);
    EXPECT_EQ(sorted[0].pid, 7);
    EXPECT_EQ(sorted[1].pid, 3);
    EXPECT_EQ(sorted[2].pid, 9);
}

TEST(ProcessListReconcilerTest, DuplicatePidKeepsFirstOccurrence)
{
    const auto sorted = ProcessListReconciler::sortedForDisplay({makeRecord(4, 1 * MB, "first"), makeRecord(4, 9 * MB, "second")});

    ASSERT_EQ(sorted.size(), 1U);
    EXPECT_EQ(sorted[0].displayName, "first");
    EXPECT_EQ(sorted[0].residentMemoryBytes, 1 * MB);
}

TEST(ProcessListReconcilerTest, EmptySampleClearsAllRows)
{
    ReconcilerState state;
    RecordingSink sink;
    (void) ProcessListReconciler::reconcile(state, {makeRecord(1, MB), makeRecord(2, 2 * MB)}, sink);

    const auto result = ProcessListReconciler::reconcile(state, {}, sink);

    EXPECT_TRUE(result.order.empty());
    EXPECT_TRUE(sink.rows.empty());
    EXPECT_TRUE(state.rows.empty());
    EXPECT_EQ(result.removed, 2U);
}

TEST(ProcessListReconcilerTest, EmptyToEmptyIsNoOp)
{
    ReconcilerState state;
    RecordingSink sink;

    const auto result = ProcessListReconciler::reconcile(state, {}, sink);

    EXPECT_TRUE(result.order.empty());
    EXPECT_FALSE(result.layoutChanged());
    EXPECT_EQ(sink.inserts + sink.removes + sink.moves + sink.updates, 0);
}

// =============================================================================
// Identity and minimal mutation
// =============================================================================

TEST(ProcessListReconcilerTest, IdenticalSampleProducesNoMutations)
{
    ReconcilerState state;
    RecordingSink sink;
    const std::vector processes = {makeRecord(1, 10 * MB), makeRecord(2, 20 * MB), makeRecord(3, 30 * MB)};
    (void) ProcessListReconciler::reconcile(state, processes, sink);
    sink.resetCounts();
    sink.selected = 2;
    sink.scroll = 0.4F;

    const auto result = ProcessListReconciler::reconcile(state, processes, sink);

    EXPECT_EQ(sink.inserts, 0);
    EXPECT_EQ(sink.updates, 0);
    EXPECT_EQ(sink.removes, 0);
    EXPECT_EQ(sink.moves, 0);
    EXPECT_FALSE(result.layoutChanged());
    EXPECT_EQ(sink.selected, 2);
    EXPECT_FLOAT_EQ(sink.scroll, 0.4F);
    EXPECT_EQ(result.selectedPid, 2);
    EXPECT_EQ(sink.clearSelectionCount, 0);
}

TEST(ProcessListReconcilerTest, SurvivingRowsKeepTheirHandle)
{
    ReconcilerState state;
    RecordingSink sink;
    (void) ProcessListReconciler::reconcile(state, {makeRecord(1, 10 * MB), makeRecord(2, 20 * MB)}, sink);
    const auto handleOf1 = state.find(1)->handle;
    const auto handleOf2 = state.find(2)->handle;

    (void) ProcessListReconciler::reconcile(state, {makeRecord(1, 50 * MB), makeRecord(2, 20 * MB), makeRecord(3, 5 * MB)}, sink);

    EXPECT_EQ(state.find(1)->handle, handleOf1);
    EXPECT_EQ(state.find(2)->handle, handleOf2);
    EXPECT_EQ(sink.row(1)->handle, handleOf1);
}

TEST(ProcessListReconcilerTest, HandlesAreNeverReused)
{
    ReconcilerState state;
    RecordingSink sink;
    (void) ProcessListReconciler::reconcile(state, {makeRecord(1, MB)}, sink);
    const auto firstHandle = state.find(1)->handle;

    (void) ProcessListReconciler::reconcile(state, {}, sink);
    (void) ProcessListReconciler::reconcile(state, {makeRecord(1, MB)}, sink);

    EXPECT_NE(state.find(1)->handle, firstHandle);
}

TEST(ProcessListReconcilerTest, UpdatesOnlyRowsWhoseFieldsChanged)
{
    ReconcilerState state;
    RecordingSink sink;
    (void) ProcessListReconciler::reconcile(state, {makeRecord(1, 30 * MB), makeRecord(2, 20 * MB), makeRecord(3, 10 * MB)}, sink);
    sink.resetCounts();

    (void) ProcessListReconciler::reconcile(state, {makeRecord(1, 30 * MB), makeRecord(2, 21 * MB), makeRecord(3, 10 * MB)}, sink);

    EXPECT_EQ(sink.updatedPids, (std::vector<std::int32_t>{2}));
    EXPECT_EQ(sink.moves, 0);
    EXPECT_EQ(sink.row(2)->residentMemoryBytes, 21 * MB);
}

TEST(ProcessListReconcilerTest, EssentialFlagChangeIsAnUpdate)
{
    ReconcilerState state;
    RecordingSink sink;
    (void) ProcessListReconciler::reconcile(state, {makeRecord(1, MB, "a", false)}, sink);
    sink.resetCounts();

    (void) ProcessListReconciler::reconcile(state, {makeRecord(1, MB, "a", true)}, sink);

    EXPECT_EQ(sink.updates, 1);
    EXPECT_TRUE(sink.row(1)->isEssential);
}

TEST(ProcessListReconcilerTest, SwapOfTwoRowsIsOneMove)
{
    ReconcilerState state;
    RecordingSink sink;
    (void) ProcessListReconciler::reconcile(
        state, {makeRecord(1, 40 * MB), makeRecord(2, 30 * MB), makeRecord(3, 20 * MB), makeRecord(4, 10 * MB)}, sink);
    sink.resetCounts();

    // 4 jumps to the top; the rest keep relative order
    const auto result = ProcessListReconciler::reconcile(
        state, {makeRecord(1, 40 * MB), makeRecord(2, 30 * MB), makeRecord(3, 20 * MB), makeRecord(4, 90 * MB)}, sink);

    EXPECT_EQ(result.order, (std::vector<std::int32_t>{4, 1, 2, 3}));
    EXPECT_EQ(sink.pids(), result.order);
    EXPECT_EQ(result.moved, 1U);
}

TEST(ProcessListReconcilerTest, ReversalMovesAllButOne)
{
    ReconcilerState state;
    RecordingSink sink;
    (void) ProcessListReconciler::reconcile(state, {makeRecord(1, 4 * MB), makeRecord(2, 3 * MB), makeRecord(3, 2 * MB), makeRecord(4, MB)}, sink);
    sink.resetCounts();

    const auto result =
        ProcessListReconciler::reconcile(state, {makeRecord(1, MB), makeRecord(2, 2 * MB), makeRecord(3, 3 * MB), makeRecord(4, 4 * MB)}, sink);

    EXPECT_EQ(result.order, (std::vector<std::int32_t>{4, 3, 2, 1}));
    EXPECT_EQ(sink.pids(), result.order);
    EXPECT_EQ(result.moved, 3U);
}

TEST(ProcessListReconcilerTest, InsertsAndRemovalsLandInTargetOrder)
{
    ReconcilerState state;
    RecordingSink sink;
    (void) ProcessListReconciler::reconcile(state, {makeRecord(1, 50 * MB), makeRecord(2, 30 * MB), makeRecord(3, 10 * MB)}, sink);

    const auto result = ProcessListReconciler::reconcile(
        state, {makeRecord(1, 50 * MB), makeRecord(3, 10 * MB), makeRecord(5, 40 * MB), makeRecord(6, 5 * MB)}, sink);

    EXPECT_EQ(result.order, (std::vector<std::int32_t>{1, 5, 3, 6}));
    EXPECT_EQ(sink.pids(), result.order);
    EXPECT_EQ(result.removed, 1U);
    EXPECT_EQ(result.inserted, 2U);
    EXPECT_EQ(result.moved, 0U);
}

TEST(ProcessListReconcilerTest, SinkMatchesTargetAcrossRandomSequences)
{
    std::mt19937 rng(1234);
    std::uniform_int_distribution<int> pidDist(1, 40);
    std::uniform_int_distribution<int> memDist(1, 8);

    ReconcilerState state;
    RecordingSink sink;

    for (int round = 0; round < 50; ++round)
    {
        std::vector<Domain::ProcessRecord> processes;
        for (int i = 0; i < 25; ++i)
        {
            processes.push_back(makeRecord(pidDist(rng), static_cast<std::uint64_t>(memDist(rng)) * MB));
        }

        const auto result = ProcessListReconciler::reconcile(state, processes, sink);

        std::vector<std::int32_t> expected;
        for (const auto& record : ProcessListReconciler::sortedForDisplay(processes))
        {
            expected.push_back(record.pid);
        }
        ASSERT_EQ(result.order, expected) << "round " << round;
        ASSERT_EQ(sink.pids(), expected) << "round " << round;
        ASSERT_EQ(state.rows.size(), expected.size());
    }
}

// =============================================================================
// Selection and scroll
// =============================================================================

TEST(ProcessListReconcilerTest, SelectionFollowsPidWhenRowMoves)
{
    ReconcilerState state;
    RecordingSink sink;
    (void) ProcessListReconciler::reconcile(state, {makeRecord(10, 50 * MB), makeRecord(20, 30 * MB)}, sink);
    sink.selected = 20;

    const auto result = ProcessListReconciler::reconcile(state, {makeRecord(20, 10 * MB), makeRecord(30, 90 * MB)}, sink);

    EXPECT_EQ(result.order, (std::vector<std::int32_t>{30, 20}));
    EXPECT_EQ(result.selectedPid, 20);
    EXPECT_EQ(sink.selected, 20);
    EXPECT_EQ(sink.ensuredVisible, 20);
}

TEST(ProcessListReconcilerTest, SelectionClearedWhenProcessExits)
{
    ReconcilerState state;
    RecordingSink sink;
    (void) ProcessListReconciler::reconcile(state, {makeRecord(10, 50 * MB), makeRecord(20, 30 * MB)}, sink);
    sink.selected = 10;

    const auto result = ProcessListReconciler::reconcile(state, {makeRecord(20, 30 * MB), makeRecord(30, 90 * MB)}, sink);

    EXPECT_FALSE(result.selectedPid.has_value());
    EXPECT_FALSE(sink.selected.has_value());
    EXPECT_EQ(sink.clearSelectionCount, 1);
    EXPECT_FALSE(sink.ensuredVisible.has_value());
}

TEST(ProcessListReconcilerTest, NoSelectionStaysUnselected)
{
    ReconcilerState state;
    RecordingSink sink;

    const auto result = ProcessListReconciler::reconcile(state, {makeRecord(1, MB)}, sink);

    EXPECT_FALSE(result.selectedPid.has_value());
    EXPECT_FALSE(sink.selected.has_value());
    EXPECT_EQ(sink.clearSelectionCount, 0);
}

TEST(ProcessListReconcilerTest, ScrollFractionIsRestored)
{
    ReconcilerState state;
    RecordingSink sink;
    (void) ProcessListReconciler::reconcile(state, {makeRecord(1, MB), makeRecord(2, 2 * MB)}, sink);
    sink.scroll = 0.4F;

    (void) ProcessListReconciler::reconcile(state, {makeRecord(1, 3 * MB), makeRecord(2, 2 * MB), makeRecord(3, MB)}, sink);

    EXPECT_FLOAT_EQ(sink.scroll, 0.4F);
    EXPECT_FLOAT_EQ(state.scrollFraction, 0.4F);
    EXPECT_GE(sink.scrollRestores, 1);
}

TEST(ProcessListReconcilerTest, RowsInDisplayOrderMatchesSink)
{
    ReconcilerState state;
    RecordingSink sink;
    (void) ProcessListReconciler::reconcile(state, {makeRecord(1, MB), makeRecord(2, 3 * MB), makeRecord(3, 2 * MB)}, sink);

    const auto rows = state.rowsInDisplayOrder();

    ASSERT_EQ(rows.size(), 3U);
    EXPECT_EQ(rows[0].pid, 2);
    EXPECT_EQ(rows[1].pid, 3);
    EXPECT_EQ(rows[2].pid, 1);
}

} // namespace
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
