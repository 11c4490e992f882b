#include <gtest/gtest.h>
#include "parallel/executor.hpp"
#include <atomic>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace starkcomp;
using namespace starkcomp::parallel;

class ExecutorTest : public ::testing::TestWithParam<ExecutorKind> {
protected:
    void SetUp() override {
        executor_ = make_executor(GetParam());
    }

    std::unique_ptr<Executor> executor_;
};

TEST_P(ExecutorTest, RunsEveryTaskExactlyOnce) {
    constexpr size_t num_tasks = 257;
    std::vector<std::atomic<int>> hits(num_tasks);
    for (auto& h : hits) {
        h.store(0);
    }

    executor_->parallel_for(num_tasks, [&](size_t i) { hits[i].fetch_add(1); });

    for (size_t i = 0; i < num_tasks; ++i) {
        EXPECT_EQ(hits[i].load(), 1) << "task " << i;
    }
    EXPECT_GE(executor_->concurrency(), 1u);
    EXPECT_STREQ(executor_->name(), to_string(GetParam()));
}

TEST_P(ExecutorTest, ZeroTasksIsANoOp) {
    bool called = false;
    executor_->parallel_for(0, [&](size_t) { called = true; });
    EXPECT_FALSE(called);
}

TEST_P(ExecutorTest, TaskExceptionReachesCaller) {
    EXPECT_THROW(
        executor_->parallel_for(64, [](size_t i) {
            if (i == 17) {
                throw std::out_of_range("task 17 failed");
            }
        }),
        std::out_of_range);
}

TEST_P(ExecutorTest, BatchesCoverRangeDisjointly) {
    constexpr size_t length = 1000;
    std::vector<int> covered(length, 0);

    for_each_batch(*executor_, length, 64, [&](size_t begin, size_t end) {
        EXPECT_LT(begin, end);
        for (size_t i = begin; i < end; ++i) {
            covered[i] += 1;
        }
    });

    for (size_t i = 0; i < length; ++i) {
        EXPECT_EQ(covered[i], 1) << "index " << i;
    }
}

const ExecutorKind kAvailableExecutors[] = {
    ExecutorKind::Sequential,
    ExecutorKind::Tbb,
    ExecutorKind::OpenMp,
#ifdef STARKCOMP_USE_TASKFLOW
    ExecutorKind::Taskflow,
#endif
};

INSTANTIATE_TEST_SUITE_P(
    AllExecutors,
    ExecutorTest,
    ::testing::ValuesIn(kAvailableExecutors),
    [](const ::testing::TestParamInfo<ExecutorKind>& info) {
        return std::string(to_string(info.param));
    });

TEST(ExecutorKindTest, ParseRoundTrip) {
    for (auto kind : {ExecutorKind::Sequential, ExecutorKind::Tbb, ExecutorKind::OpenMp, ExecutorKind::Taskflow}) {
        EXPECT_EQ(parse_executor_kind(to_string(kind)), kind);
    }
    EXPECT_THROW(parse_executor_kind("rayon"), std::invalid_argument);
}

#ifndef STARKCOMP_USE_TASKFLOW
TEST(ExecutorKindTest, TaskflowUnavailableWithoutBuildSupport) {
    EXPECT_THROW(make_executor(ExecutorKind::Taskflow), std::invalid_argument);
}
#endif

TEST(ForEachBatchTest, EmptyRangeRunsNothing) {
    SequentialExecutor executor;
    bool called = false;
    for_each_batch(executor, 0, 16, [&](size_t, size_t) { called = true; });
    EXPECT_FALSE(called);
}

TEST(ForEachBatchTest, SequentialExecutorUsesOneBatch) {
    SequentialExecutor executor;
    std::vector<std::pair<size_t, size_t>> batches;
    for_each_batch(executor, 300, 128, [&](size_t begin, size_t end) { batches.emplace_back(begin, end); });
    ASSERT_EQ(batches.size(), 1u);
    EXPECT_EQ(batches[0], std::make_pair(size_t(0), size_t(300)));
}
