/// @file test_ProcessListModel.cpp
/// @brief Tests for Domain::ProcessListModel (sample hand-off and stale/re-entrant guards)

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
#include "Domain/ProcessListModel.h"
#include "Mocks/MockProbes.h"

#include <gtest/gtest.h>

#include <thread>
#include <vector>

namespace
{

using Domain::ProcessListModel;
using TestMocks::makeRecord;
using TestMocks::makeSample;
using TestMocks::RecordingSink;

TEST(ProcessListModelTest, StartsEmpty)
{
    ProcessListModel model;
    RecordingSink sink;

    EXPECT_FALSE(model.hasSample());
    EXPECT_FALSE(model.hasPending());
    EXPECT_FALSE(model.applyPending(sink).has_value());
    EXPECT_TRUE(model.displayedRows().empty());
}

TEST(ProcessListModelTest, AppliesSubmittedSample)
{
    ProcessListModel model;
    RecordingSink sink;

    model.submit(makeSample({makeRecord(1, 100), makeRecord(2, 200)}, 1));
    EXPECT_TRUE(model.hasPending());

    const auto result = model.applyPending(sink);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->order, (std::vector<std::int32_t>{2, 1}));
    EXPECT_FALSE(model.hasPending());
    EXPECT_TRUE(model.hasSample());
    EXPECT_EQ(model.lastSequence(), 1U);
    EXPECT_TRUE(model.memory().has_value());
}

TEST(ProcessListModelTest, NewerSubmissionSupersedesPending)
{
    ProcessListModel model;
    RecordingSink sink;

    model.submit(makeSample({makeRecord(1, 100)}, 1));
    model.submit(makeSample({makeRecord(9, 100)}, 2));
    const auto result = model.applyPending(sink);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->order, (std::vector<std::int32_t>{9}));
    EXPECT_EQ(sink.inserts, 1);
}

TEST(ProcessListModelTest, StaleSampleIsDropped)
{
    ProcessListModel model;
    RecordingSink sink;
    ASSERT_TRUE(model.apply(makeSample({makeRecord(1, 100)}, 5), sink).has_value());

    const auto result = model.apply(makeSample({makeRecord(2, 100)}, 4), sink);

    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(sink.pids(), (std::vector<std::int32_t>{1}));
    EXPECT_EQ(model.lastSequence(), 5U);
}

TEST(ProcessListModelTest, FailedMemoryReadIsReported)
{
    ProcessListModel model;
    RecordingSink sink;
    auto sample = makeSample({makeRecord(1, 100)}, 1);
    sample.memory.reset();

    ASSERT_TRUE(model.apply(std::move(sample), sink).has_value());

    EXPECT_TRUE(model.hasSample());
    EXPECT_FALSE(model.memory().has_value());
    EXPECT_EQ(sink.rows.size(), 1U);
}

TEST(ProcessListModelTest, DisplayedRowsFollowDisplayOrder)
{
    ProcessListModel model;
    RecordingSink sink;

    (void) model.apply(makeSample({makeRecord(1, 10), makeRecord(2, 30), makeRecord(3, 20)}, 1), sink);
    const auto rows = model.displayedRows();

    ASSERT_EQ(rows.size(), 3U);
    EXPECT_EQ(rows[0].pid, 2);
    EXPECT_EQ(rows[2].pid, 1);
}

/// Sink that tries to re-enter the model from inside a reconciliation.
class ReentrantSink : public RecordingSink
{
  public:
    explicit ReentrantSink(ProcessListModel& model) : m_Model(model)
    {
    }

    void insertRow(std::size_t index, const Domain::DisplayRow& row) override
    {
        RecordingSink::insertRow(index, row);
        if (!m_Tried)
        {
            m_Tried = true;
            nestedResult = m_Model.apply(makeSample({makeRecord(99, 1)}, 100), *this);
        }
    }

    std::optional<Domain::ReconcileResult> nestedResult;

  private:
    ProcessListModel& m_Model;
    bool m_Tried = false;
};

TEST(ProcessListModelTest, ReentrantApplyIsIgnored)
{
    ProcessListModel model;
    ReentrantSink sink(model);

    const auto result = model.apply(makeSample({makeRecord(1, 10)}, 1), sink);

    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(sink.nestedResult.has_value());
    EXPECT_EQ(sink.pids(), (std::vector<std::int32_t>{1}));

    // The guard is released afterwards
    EXPECT_TRUE(model.apply(makeSample({makeRecord(2, 10)}, 2), sink).has_value());
}

TEST(ProcessListModelTest, SubmitFromAnotherThread)
{
    ProcessListModel model;
    RecordingSink sink;

    std::thread producer(
        [&model]
        {
            for (std::uint64_t seq = 1; seq <= 100; ++seq)
            {
                model.submit(makeSample({makeRecord(static_cast<std::int32_t>(seq), seq)}, seq));
            }
        });

    for (int i = 0; i < 1000; ++i)
    {
        (void) model.applyPending(sink);
    }
    producer.join();
    (void) model.applyPending(sink);

    EXPECT_EQ(model.lastSequence(), 100U);
    EXPECT_EQ(sink.pids(), (std::vector<std::int32_t>{100}));
}

} // namespace
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
