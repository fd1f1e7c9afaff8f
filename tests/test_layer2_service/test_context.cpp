/**
 * @file test_context.cpp
 * @brief Tests for Context: cancellation propagation and deadlines.
 */
#include "lft_service.hpp"
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

using namespace liftoff;
using namespace std::chrono_literals;

TEST(ContextTest, BackgroundIsNeverDone)
{
    Context ctx = Context::background();
    EXPECT_FALSE(ctx.done());
    EXPECT_TRUE(ctx.err().is_ok());
    EXPECT_FALSE(ctx.deadline().has_value());
    EXPECT_FALSE(ctx.wait_for(10ms));
}

TEST(ContextTest, CancelIsIdempotent)
{
    Context ctx = Context::with_cancel(Context::background());
    ctx.cancel();
    ctx.cancel();
    EXPECT_TRUE(ctx.done());
    ASSERT_TRUE(ctx.err().is_error());
    EXPECT_EQ(ctx.err().kind(), ErrorKind::Canceled);
}

TEST(ContextTest, TimeoutExpires)
{
    Context ctx = Context::with_timeout(Context::background(), 20ms);
    ASSERT_TRUE(ctx.deadline().has_value());
    EXPECT_TRUE(ctx.wait_for(5s));
    EXPECT_TRUE(ctx.done());
    EXPECT_EQ(ctx.err().kind(), ErrorKind::DeadlineExceeded);
}

TEST(ContextTest, OutOfRangeTimeoutMeansNoDeadline)
{
    Context ctx = Context::with_timeout(Context::background(), std::chrono::milliseconds::max());
    EXPECT_FALSE(ctx.deadline().has_value());
    EXPECT_FALSE(ctx.done());
    EXPECT_FALSE(ctx.wait_for(std::chrono::milliseconds(10)));

    // Roughly 317 years: representable on its own, not when added to now.
    Context years = Context::with_timeout(Context::background(), std::chrono::milliseconds(10000000000000LL));
    EXPECT_FALSE(years.done());
    EXPECT_TRUE(years.err().is_ok());

    // A parent deadline is still inherited.
    Context bounded = Context::with_timeout(Context::background(), 20ms);
    Context child = Context::with_timeout(bounded, std::chrono::milliseconds::max());
    EXPECT_EQ(child.deadline(), bounded.deadline());
    EXPECT_TRUE(child.wait_for(std::chrono::milliseconds::max()));
    EXPECT_EQ(child.err().kind(), ErrorKind::DeadlineExceeded);
}

TEST(ContextTest, ChildInheritsEarlierDeadline)
{
    Context parent = Context::with_timeout(Context::background(), 50ms);
    Context child = Context::with_timeout(parent, 10s);
    ASSERT_TRUE(child.deadline().has_value());
    EXPECT_EQ(*child.deadline(), *parent.deadline());

    Context tighter = Context::with_timeout(parent, 1ms);
    EXPECT_LT(*tighter.deadline(), *parent.deadline());
}

TEST(ContextTest, ParentCancelPropagatesToChildren)
{
    Context parent = Context::with_cancel(Context::background());
    Context child = Context::with_cancel(parent);
    Context grandchild = Context::with_timeout(child, 10s);

    parent.cancel();
    EXPECT_TRUE(child.done());
    EXPECT_TRUE(grandchild.done());
    EXPECT_EQ(grandchild.err().kind(), ErrorKind::Canceled);
}

TEST(ContextTest, ChildCancelDoesNotAffectParent)
{
    Context parent = Context::with_cancel(Context::background());
    Context child = Context::with_cancel(parent);
    child.cancel();
    EXPECT_TRUE(child.done());
    EXPECT_FALSE(parent.done());
}

TEST(ContextTest, DerivedFromCanceledParentStartsCanceled)
{
    Context parent = Context::with_cancel(Context::background());
    parent.cancel();
    Context child = Context::with_timeout(parent, 10s);
    EXPECT_TRUE(child.done());
    EXPECT_EQ(child.err().kind(), ErrorKind::Canceled);
}

TEST(ContextTest, WaitWakesOnCancelFromAnotherThread)
{
    Context ctx = Context::with_cancel(Context::background());
    std::atomic<bool> woke{false};
    std::thread waiter(
        [&]
        {
            ctx.wait();
            woke = true;
        });
    std::this_thread::sleep_for(20ms);
    EXPECT_FALSE(woke.load());
    ctx.cancel();
    waiter.join();
    EXPECT_TRUE(woke.load());
}
