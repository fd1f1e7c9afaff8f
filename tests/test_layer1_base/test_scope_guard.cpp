// tests/test_layer1_base/test_scope_guard.cpp
/**
 * @file test_scope_guard.cpp
 * @brief Unit tests for liftoff::basics::ScopeGuard.
 */
#include "lft_base.hpp"
#include <gtest/gtest.h>

#include <stdexcept>
#include <utility>

using liftoff::basics::make_scope_guard;

// Test that the ScopeGuard executes its function on normal scope exit.
TEST(ScopeGuardTest, ExecutesOnScopeExit)
{
    bool executed = false;
    {
        auto guard = make_scope_guard([&]() { executed = true; });
        ASSERT_FALSE(executed);
    }
    ASSERT_TRUE(executed);
}

TEST(ScopeGuardTest, ExecutesWithLvalueLambda)
{
    bool executed = false;
    auto my_lambda = [&]() { executed = true; };
    {
        auto guard = make_scope_guard(my_lambda);
    }
    ASSERT_TRUE(executed);
}

TEST(ScopeGuardTest, Dismiss)
{
    bool executed = false;
    {
        auto guard = make_scope_guard([&]() { executed = true; });
        guard.dismiss();
        ASSERT_FALSE(static_cast<bool>(guard));
    }
    ASSERT_FALSE(executed);
}

// invoke() runs now and disarms the destructor.
TEST(ScopeGuardTest, InvokeRunsOnce)
{
    int calls = 0;
    {
        auto guard = make_scope_guard([&]() { ++calls; });
        guard.invoke();
        EXPECT_EQ(calls, 1);
        guard.invoke();
    }
    EXPECT_EQ(calls, 1);
}

TEST(ScopeGuardTest, MoveTransfersOwnership)
{
    int calls = 0;
    {
        auto first = make_scope_guard([&]() { ++calls; });
        {
            auto second = std::move(first);
            EXPECT_FALSE(static_cast<bool>(first));
            EXPECT_TRUE(static_cast<bool>(second));
        }
        EXPECT_EQ(calls, 1);
    }
    EXPECT_EQ(calls, 1);
}

// Runs during stack unwinding.
TEST(ScopeGuardTest, ExecutesWhenExceptionThrown)
{
    bool executed = false;
    try
    {
        auto guard = make_scope_guard([&]() { executed = true; });
        throw std::runtime_error("boom");
    }
    catch (const std::runtime_error &)
    {
    }
    EXPECT_TRUE(executed);
}

// A throwing cleanup must not escape the destructor.
TEST(ScopeGuardTest, ThrowingCallableIsContained)
{
    EXPECT_NO_THROW({
        auto guard = make_scope_guard([]() { throw std::runtime_error("cleanup failed"); });
    });
}
