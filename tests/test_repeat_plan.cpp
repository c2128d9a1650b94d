#include <gtest/gtest.h>
#include <limits>
#include <map>
#include <vector>

#include "core/errors.hpp"
#include "core/repeat_plan.hpp"

using repcat::config_error;
using repcat::repeat_plan;
using repcat::task;

namespace {

std::vector<task> drain(const repeat_plan& plan) {
    std::vector<task> out;
    auto cur = plan.produce_tasks();
    while (auto t = cur.next()) out.push_back(*t);
    return out;
}

std::vector<std::size_t> file_order(const repeat_plan& plan) {
    std::vector<std::size_t> out;
    for (const auto& t : drain(plan)) out.push_back(t.file_index);
    return out;
}

}

TEST(RepeatPlan, OuterRepeatInterleavesFiles) {
    repeat_plan plan(2, 2);
    EXPECT_EQ(file_order(plan), (std::vector<std::size_t>{0, 1, 0, 1}));
    EXPECT_EQ(plan.task_count(), 4u);
}

TEST(RepeatPlan, PerFilePassesAreConsecutive) {
    repeat_plan plan(2, 1, 3);
    const auto tasks = drain(plan);
    ASSERT_EQ(tasks.size(), 6u);
    const std::vector<task> expected = {
        {0, 0, 0}, {0, 1, 0}, {0, 2, 0},
        {1, 0, 0}, {1, 1, 0}, {1, 2, 0},
    };
    EXPECT_EQ(tasks, expected);
}

TEST(RepeatPlan, OverridesApplyPerFile) {
    repeat_plan plan(3, 2, 1, {{1, 3}});
    EXPECT_EQ(file_order(plan), (std::vector<std::size_t>{0, 1, 1, 1, 2, 0, 1, 1, 1, 2}));
    EXPECT_EQ(plan.repeat_for(0), 1u);
    EXPECT_EQ(plan.repeat_for(1), 3u);
    EXPECT_EQ(plan.passes_per_round(), 5u);
    EXPECT_EQ(plan.task_count(), 10u);
}

TEST(RepeatPlan, TaskCountMatchesGeneratedSequence) {
    repeat_plan plan(5, 3, 2, {{0, 4}, {4, 1}});
    EXPECT_EQ(drain(plan).size(), plan.task_count());
}

TEST(RepeatPlan, OuterIndexAdvancesPerRound) {
    repeat_plan plan(1, 3);
    const auto tasks = drain(plan);
    ASSERT_EQ(tasks.size(), 3u);
    for (std::uint64_t i = 0; i < 3; ++i) {
        EXPECT_EQ(tasks[i].outer, i);
        EXPECT_EQ(tasks[i].pass, 0u);
    }
}

TEST(RepeatPlan, CursorsAreIndependentAndRestartable) {
    repeat_plan plan(2, 1, 2);
    auto a = plan.produce_tasks();
    auto b = plan.produce_tasks();
    ASSERT_TRUE(a.next());
    ASSERT_TRUE(a.next());
    const auto first_b = b.next();
    ASSERT_TRUE(first_b);
    EXPECT_EQ(*first_b, (task{0, 0, 0}));
}

TEST(RepeatPlan, LargeFileCountIsLazy) {
    // A billion files: only the cursor position is held, never the task list.
    repeat_plan plan(1'000'000'000, 2);
    EXPECT_EQ(plan.task_count(), 2'000'000'000u);
    auto cur = plan.produce_tasks();
    EXPECT_EQ(cur.next()->file_index, 0u);
    EXPECT_EQ(cur.next()->file_index, 1u);
}

TEST(RepeatPlan, RejectsNonPositiveCounts) {
    EXPECT_THROW(repeat_plan(1, 0), config_error);
    EXPECT_THROW(repeat_plan(1, -1), config_error);
    EXPECT_THROW(repeat_plan(1, 1, 0), config_error);
    EXPECT_THROW(repeat_plan(1, 1, -5), config_error);
    EXPECT_THROW(repeat_plan(2, 1, 1, {{1, 0}}), config_error);
}

TEST(RepeatPlan, RejectsEmptyListAndOutOfRangeOverride) {
    EXPECT_THROW(repeat_plan(0, 1), config_error);
    EXPECT_THROW(repeat_plan(2, 1, 1, {{2, 3}}), config_error);
}

TEST(RepeatPlan, TaskCountOverflowIsConfigError) {
    constexpr auto big = std::numeric_limits<std::int64_t>::max();
    EXPECT_THROW(repeat_plan(1, big, big), config_error);
    EXPECT_THROW(repeat_plan(3, 1, big), config_error);
    EXPECT_THROW(repeat_plan(3, 1, 1, {{0, big}, {1, big}, {2, big}}), config_error);
    EXPECT_EQ(repeat_plan(1, big, 1).task_count(), static_cast<std::uint64_t>(big));
}
