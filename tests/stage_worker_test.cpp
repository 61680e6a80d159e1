#include <gtest/gtest.h>

#include <stdexcept>
#include <stop_token>
#include <string>

#include "infra/bounded_queue/bounded_queue.hpp"
#include "infra/stage_worker/stage_worker.hpp"

using rcopy::infra::ErrorCode;
using rcopy::infra::StageWorker;

TEST(StageWorkerTest, SuccessLeavesPipelineRunning)
{
    std::stop_source pipeline;
    StageWorker worker{"ok", pipeline, [] { return rcopy::infra::VoidResult{}; }};
    EXPECT_TRUE(worker.wait());
    EXPECT_FALSE(pipeline.stop_requested());
}

TEST(StageWorkerTest, FailureStopsPipeline)
{
    std::stop_source pipeline;
    StageWorker worker{"broken", pipeline, []() -> rcopy::infra::VoidResult {
        return std::unexpected(rcopy::infra::make_error(ErrorCode::IoError, "disk went away"));
    }};
    auto res = worker.wait();
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::IoError);
    EXPECT_TRUE(pipeline.stop_requested());
}

TEST(StageWorkerTest, ExceptionBecomesError)
{
    std::stop_source pipeline;
    StageWorker worker{"thrower", pipeline, []() -> rcopy::infra::VoidResult {
        throw std::runtime_error("bad_alloc stand-in");
    }};
    auto res = worker.wait();
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::Unknown);
    EXPECT_NE(res.error().message.find("thrower"), std::string::npos);
    EXPECT_TRUE(pipeline.stop_requested());
}

TEST(StageWorkerTest, DestroyedWithoutWaitStopsBlockedStage)
{
    std::stop_source pipeline;
    rcopy::infra::BoundedQueue<int> never_fed{1};
    const auto token = pipeline.get_token();
    {
        StageWorker worker{"blocked", pipeline, [&]() -> rcopy::infra::VoidResult {
            while (never_fed.pop(token)) {
            }
            return {};
        }};
    }
    EXPECT_TRUE(pipeline.stop_requested());
}
