#include <gtest/gtest.h>
#include "vexdoc/context.hpp"
#include "vexdoc/error.hpp"
#include <thread>

using namespace vexdoc;

TEST(CallContext, StartsUncancelled) {
    CallContext ctx(RequestId{int64_t{1}}, "echo");
    EXPECT_FALSE(ctx.cancelled());
    EXPECT_EQ(ctx.reason(), CancelReason::None);
    EXPECT_EQ(ctx.tool_name(), "echo");
    EXPECT_EQ(std::get<int64_t>(ctx.request_id()), 1);
    EXPECT_EQ(ctx.deadline(), CallContext::Clock::time_point::max());
    EXPECT_NO_THROW(ctx.throw_if_cancelled());
}

TEST(CallContext, FirstCancelWins) {
    CallContext ctx(RequestId{int64_t{1}}, "t");
    EXPECT_TRUE(ctx.cancel(CancelReason::Timeout));
    EXPECT_FALSE(ctx.cancel(CancelReason::Cancelled));
    EXPECT_EQ(ctx.reason(), CancelReason::Timeout);
}

TEST(CallContext, CancelNoneIsIgnored) {
    CallContext ctx(RequestId{int64_t{1}}, "t");
    EXPECT_FALSE(ctx.cancel(CancelReason::None));
    EXPECT_FALSE(ctx.cancelled());
}

TEST(CallContext, ThrowIfCancelledMapsReason) {
    CallContext timed_out(RequestId{int64_t{1}}, "t");
    timed_out.cancel(CancelReason::Timeout);
    EXPECT_THROW(timed_out.throw_if_cancelled(), TimeoutError);

    CallContext cancelled(RequestId{int64_t{2}}, "t");
    cancelled.cancel(CancelReason::Cancelled);
    EXPECT_THROW(cancelled.throw_if_cancelled(), CancelledError);

    CallContext shutdown(RequestId{int64_t{3}}, "t");
    shutdown.cancel(CancelReason::Shutdown);
    EXPECT_THROW(shutdown.throw_if_cancelled(), CancelledError);
}

TEST(CallContext, WaitForTimesOutWhenNotCancelled) {
    CallContext ctx(RequestId{int64_t{1}}, "t");
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(ctx.wait_for(std::chrono::milliseconds(30)));
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(25));
}

TEST(CallContext, WaitForWakesOnCancel) {
    CallContext ctx(RequestId{int64_t{1}}, "t");
    std::thread canceller([&ctx] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        ctx.cancel(CancelReason::Cancelled);
    });
    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(ctx.wait_for(std::chrono::seconds(5)));
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(4));
    canceller.join();
}

TEST(CancelReason, ToString) {
    EXPECT_EQ(to_string(CancelReason::Timeout), "timeout");
    EXPECT_EQ(to_string(CancelReason::Shutdown), "shutdown");
}
