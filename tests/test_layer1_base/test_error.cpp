/**
 * @file test_error.cpp
 * @brief Tests for liftoff::Error: aggregation, wrapping, inspection and formatting.
 */
#include "lft_base.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace liftoff;
using ::testing::HasSubstr;

TEST(ErrorTest, DefaultIsSuccess)
{
    Error ok;
    EXPECT_TRUE(ok.is_ok());
    EXPECT_FALSE(ok.is_error());
    EXPECT_EQ(ok.message(), "");
    EXPECT_EQ(ok.code(), 0);
    EXPECT_TRUE(ok.errors().empty());
    EXPECT_EQ(ok.to_string(), "ok");
    EXPECT_THROW({ (void)ok.kind(); }, std::logic_error);
}

TEST(ErrorTest, MakeAndFailure)
{
    Error e = Error::make(ErrorKind::DeadlineExceeded, "too slow", 7);
    EXPECT_TRUE(e.is_error());
    EXPECT_EQ(e.kind(), ErrorKind::DeadlineExceeded);
    EXPECT_EQ(e.message(), "too slow");
    EXPECT_EQ(e.code(), 7);
    EXPECT_EQ(e.to_string(), "DeadlineExceeded: too slow");

    Error f = Error::failuref("hook {} failed", 3);
    EXPECT_EQ(f.kind(), ErrorKind::Failure);
    EXPECT_EQ(f.message(), "hook 3 failed");
}

TEST(ErrorTest, CombineDropsSuccesses)
{
    EXPECT_TRUE(Error::combine({}).is_ok());
    EXPECT_TRUE(Error::combine({Error{}, Error{}}).is_ok());

    Error only = Error::failure("only");
    Error single = Error::combine({Error{}, only, Error{}});
    EXPECT_EQ(single, only);
    EXPECT_EQ(single.kind(), ErrorKind::Failure);
}

TEST(ErrorTest, CombineFlattensNested)
{
    Error inner = Error::combine({Error::failure("b"), Error::failure("c")});
    ASSERT_EQ(inner.kind(), ErrorKind::Multiple);

    Error outer = Error::combine({Error::failure("a"), inner});
    EXPECT_EQ(outer.kind(), ErrorKind::Multiple);
    ASSERT_EQ(outer.errors().size(), 3u);
    EXPECT_EQ(outer.errors()[0].message(), "a");
    EXPECT_EQ(outer.errors()[2].message(), "c");
    EXPECT_EQ(outer.message(), "a; b; c");
    EXPECT_EQ(outer.code(), 3);
}

TEST(ErrorTest, AppendKeepsOrder)
{
    Error start = Error::failure("start failed");
    Error rollback = Error::failure("rollback failed");

    Error both = Error::append(start, rollback);
    ASSERT_EQ(both.errors().size(), 2u);
    EXPECT_EQ(both.errors()[0], start);
    EXPECT_EQ(both.errors()[1], rollback);

    EXPECT_EQ(Error::append(start, Error{}), start);
    EXPECT_EQ(Error::append(Error{}, rollback), rollback);
}

TEST(ErrorTest, WrapPrefixesMessageAndKeepsCause)
{
    Error cause = Error::make(ErrorKind::MissingDependency, "no provider of Db", 4);
    Error wrapped = Error::wrap(ErrorKind::ConstructorFailed, "constructor of Api failed", cause);

    EXPECT_EQ(wrapped.kind(), ErrorKind::ConstructorFailed);
    EXPECT_EQ(wrapped.message(), "constructor of Api failed: no provider of Db");
    EXPECT_EQ(wrapped.code(), 4);
    ASSERT_EQ(wrapped.causes().size(), 1u);
    EXPECT_EQ(wrapped.causes()[0], cause);

    EXPECT_TRUE(wrapped.contains(ErrorKind::ConstructorFailed));
    EXPECT_TRUE(wrapped.contains(ErrorKind::MissingDependency));
    EXPECT_FALSE(wrapped.contains(ErrorKind::DependencyCycle));
}

TEST(ErrorTest, WrapOfSuccessIsPlainError)
{
    Error e = Error::wrap(ErrorKind::InvalidOption, "bad option", Error{});
    EXPECT_EQ(e.kind(), ErrorKind::InvalidOption);
    EXPECT_EQ(e.message(), "bad option");
    EXPECT_TRUE(e.causes().empty());
}

TEST(ErrorTest, ContainsSearchesAggregates)
{
    Error agg = Error::combine({Error::failure("x"), Error::make(ErrorKind::Canceled, "y")});
    EXPECT_TRUE(agg.contains(ErrorKind::Canceled));
    EXPECT_TRUE(agg.contains(ErrorKind::Multiple));
    EXPECT_FALSE(Error{}.contains(ErrorKind::Failure));
}

TEST(ErrorTest, VisualizeWithoutGraphFails)
{
    auto r = visualize_error(Error::failure("plain"));
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().message(), "unable to visualize error");

    EXPECT_TRUE(visualize_error(Error{}).is_error());
}

TEST(ErrorTest, VisualizeReturnsAttachedGraph)
{
    Error base = Error::make(ErrorKind::MissingDependency, "missing");
    Error with = base.with_graph("digraph {}");
    EXPECT_FALSE(base.has_graph());
    EXPECT_TRUE(with.has_graph());
    EXPECT_EQ(with.message(), base.message());
    EXPECT_EQ(with.kind(), base.kind());

    auto r = visualize_error(with);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.content(), "digraph {}");

    EXPECT_THROW({ (void)Error{}.with_graph("g"); }, std::logic_error);
}

TEST(ErrorTest, FormatterPrintsMessage)
{
    EXPECT_EQ(fmt::format("[{}]", Error::failure("broken pipe")), "[broken pipe]");
    EXPECT_EQ(fmt::format("[{}]", Error{}), "[ok]");
    EXPECT_EQ(fmt::format("[{:>4}]", Error::failure("x")), "[   x]");
}

TEST(ErrorTest, KindNamesAreStable)
{
    EXPECT_STREQ(to_string(ErrorKind::Failure), "Failure");
    EXPECT_STREQ(to_string(ErrorKind::BroadcastPartialFailure), "BroadcastPartialFailure");
    EXPECT_STREQ(to_string(ErrorKind::Multiple), "Multiple");
}
