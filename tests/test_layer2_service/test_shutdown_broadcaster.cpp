/**
 * @file test_shutdown_broadcaster.cpp
 * @brief Tests for ShutdownBroadcaster fan-out, partial failure and the Shutdowner capability.
 */
#include "lft_service.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <csignal>
#include <thread>
#include <vector>

using namespace liftoff;
using namespace std::chrono_literals;

TEST(ShutdownBroadcasterTest, NoListenersSucceeds)
{
    ShutdownBroadcaster b;
    EXPECT_TRUE(b.shutdown().is_ok());
    EXPECT_EQ(b.listener_count(), 0u);
}

TEST(ShutdownBroadcasterTest, EveryListenerReceives)
{
    ShutdownBroadcaster b;
    auto first = b.listen();
    auto second = b.listen();
    EXPECT_EQ(b.listener_count(), 2u);

    ASSERT_TRUE(b.shutdown(SIGINT).is_ok());
    EXPECT_EQ(first.try_receive(), SIGINT);
    EXPECT_EQ(second.wait(), SIGINT);
    EXPECT_FALSE(first.pending());
}

TEST(ShutdownBroadcasterTest, UnconsumedSlotCountsAsFailure)
{
    ShutdownBroadcaster b;
    auto consumed = b.listen();
    auto ignored = b.listen();

    ASSERT_TRUE(b.shutdown().is_ok());
    ASSERT_EQ(consumed.try_receive(), SIGTERM);

    Error err = b.shutdown();
    ASSERT_TRUE(err.is_error());
    EXPECT_EQ(err.kind(), ErrorKind::BroadcastPartialFailure);
    EXPECT_EQ(err.code(), 1);
    EXPECT_EQ(err.message(), "failed to send terminated signal to 1 out of 2 listeners");

    // The consumed slot still got the second signal.
    EXPECT_EQ(consumed.try_receive(), SIGTERM);
    EXPECT_EQ(ignored.try_receive(), SIGTERM);
    EXPECT_FALSE(ignored.pending());
}

TEST(ShutdownBroadcasterTest, OnePendingOfThreeListeners)
{
    ShutdownBroadcaster b;
    auto first = b.listen();
    auto second = b.listen();
    auto third = b.listen();

    ASSERT_TRUE(b.shutdown().is_ok());
    ASSERT_EQ(first.try_receive(), SIGTERM);
    ASSERT_EQ(third.try_receive(), SIGTERM);

    // "second" still holds the first signal.
    Error err = b.shutdown();
    ASSERT_TRUE(err.is_error());
    EXPECT_EQ(err.kind(), ErrorKind::BroadcastPartialFailure);
    EXPECT_EQ(err.code(), 1);
    EXPECT_EQ(err.message(), "failed to send terminated signal to 1 out of 3 listeners");
    EXPECT_EQ(first.try_receive(), SIGTERM);
    EXPECT_EQ(third.try_receive(), SIGTERM);
}

TEST(ShutdownBroadcasterTest, WaitForTimesOutWithoutSignal)
{
    ShutdownBroadcaster b;
    auto l = b.listen();
    EXPECT_FALSE(l.wait_for(10ms).has_value());
}

TEST(ShutdownBroadcasterTest, WaitWakesFromAnotherThread)
{
    ShutdownBroadcaster b;
    auto l = b.listen();
    std::thread sender(
        [&b]
        {
            std::this_thread::sleep_for(20ms);
            (void)b.shutdown(SIGINT);
        });
    EXPECT_EQ(l.wait_for(5s), SIGINT);
    sender.join();
}

TEST(ShutdownBroadcasterTest, CopiesShareSlot)
{
    ShutdownBroadcaster b;
    auto l = b.listen();
    auto copy = l;
    ASSERT_TRUE(b.shutdown().is_ok());
    EXPECT_TRUE(copy.pending());
    EXPECT_EQ(l.try_receive(), SIGTERM);
    EXPECT_FALSE(copy.pending());
}

TEST(ShutdownBroadcasterTest, ConcurrentBroadcastsNeverBlock)
{
    ShutdownBroadcaster b;
    std::vector<ShutdownListener> listeners;
    for (int i = 0; i < 8; ++i)
    {
        listeners.push_back(b.listen());
    }
    std::vector<std::thread> senders;
    for (int i = 0; i < 4; ++i)
    {
        senders.emplace_back([&b] { (void)b.shutdown(); });
    }
    for (auto &t : senders)
    {
        t.join();
    }
    for (const auto &l : listeners)
    {
        EXPECT_TRUE(l.pending());
    }
}

TEST(ShutdownBroadcasterTest, ShutdownerSendsTerminate)
{
    auto b = std::make_shared<ShutdownBroadcaster>();
    auto l = b->listen();
    BroadcastShutdowner s(b);
    ASSERT_TRUE(s.request_shutdown().is_ok());
    EXPECT_EQ(l.try_receive(), SIGTERM);
}

TEST(ShutdownBroadcasterTest, ShutdownerRequiresBroadcaster)
{
    EXPECT_THROW(BroadcastShutdowner(nullptr), std::invalid_argument);
}

TEST(ShutdownBroadcasterTest, SignalNames)
{
    EXPECT_EQ(signal_name(SIGINT), "interrupt");
    EXPECT_EQ(signal_name(SIGTERM), "terminated");
    EXPECT_EQ(signal_name(99), "signal 99");
}
