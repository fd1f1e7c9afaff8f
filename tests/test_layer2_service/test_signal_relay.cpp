/**
 * @file test_signal_relay.cpp
 * @brief Tests for SignalRelay: signal delivery, exclusive ownership and uninstall.
 */
#include "lft_service.hpp"
#include "shared_test_helpers.h"
#include <gtest/gtest.h>

#include <chrono>
#include <csignal>

using namespace liftoff;
using namespace liftoff::tests::helper;
using namespace std::chrono_literals;

#if defined(LIFTOFF_IS_POSIX)

class SignalRelayTest : public ::testing::Test
{
  protected:
    std::shared_ptr<ShutdownBroadcaster> broadcaster_ = std::make_shared<ShutdownBroadcaster>();
    RecordingLogSink log_;
};

TEST_F(SignalRelayTest, RelaysRaisedSignalToListeners)
{
    auto listener = broadcaster_->listen();
    SignalRelay relay(broadcaster_, log_.sink());
    ASSERT_TRUE(relay.install({SIGUSR1}).is_ok());
    EXPECT_TRUE(relay.installed());
    EXPECT_TRUE(SignalRelay::active());

    ASSERT_EQ(std::raise(SIGUSR1), 0);
    EXPECT_EQ(listener.wait_for(5s), SIGUSR1);
    EXPECT_TRUE(wait_until([&] { return log_.contains("received signal"); }, 2s));

    relay.uninstall();
    EXPECT_FALSE(relay.installed());
    EXPECT_FALSE(SignalRelay::active());
}

TEST_F(SignalRelayTest, HandlesTerminate)
{
    auto listener = broadcaster_->listen();
    SignalRelay relay(broadcaster_, log_.sink());
    ASSERT_TRUE(relay.install().is_ok());

    ASSERT_EQ(std::raise(SIGTERM), 0);
    EXPECT_EQ(listener.wait_for(5s), SIGTERM);
}

TEST_F(SignalRelayTest, OnlyOneRelayMayOwnHandlers)
{
    SignalRelay first(broadcaster_, log_.sink());
    SignalRelay second(broadcaster_, log_.sink());
    ASSERT_TRUE(first.install({SIGUSR1}).is_ok());

    Error err = second.install({SIGUSR1});
    ASSERT_TRUE(err.is_error());
    EXPECT_EQ(err.kind(), ErrorKind::SignalRelay);
    EXPECT_FALSE(second.installed());

    // Installing again on the owner is a no-op success.
    EXPECT_TRUE(first.install({SIGUSR1}).is_ok());

    first.uninstall();
    EXPECT_TRUE(second.install({SIGUSR1}).is_ok());
}

TEST_F(SignalRelayTest, DestructorReleasesOwnership)
{
    {
        SignalRelay relay(broadcaster_);
        ASSERT_TRUE(relay.install({SIGUSR2}).is_ok());
        EXPECT_TRUE(SignalRelay::active());
    }
    EXPECT_FALSE(SignalRelay::active());
}

TEST_F(SignalRelayTest, UninstallIsIdempotent)
{
    SignalRelay relay(broadcaster_);
    relay.uninstall();
    ASSERT_TRUE(relay.install({SIGUSR2}).is_ok());
    relay.uninstall();
    relay.uninstall();
    EXPECT_FALSE(relay.installed());
}

TEST_F(SignalRelayTest, InvalidSignalFailsAndRollsBack)
{
    SignalRelay relay(broadcaster_);
    Error err = relay.install({SIGKILL});
    ASSERT_TRUE(err.is_error());
    EXPECT_EQ(err.kind(), ErrorKind::SignalRelay);
    EXPECT_FALSE(relay.installed());
    EXPECT_FALSE(SignalRelay::active());
}

#endif

TEST(SignalRelayBasicTest, RequiresBroadcaster)
{
    EXPECT_THROW(SignalRelay(nullptr), std::invalid_argument);
}
