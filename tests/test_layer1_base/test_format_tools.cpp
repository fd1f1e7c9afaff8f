/**
 * @file test_format_tools.cpp
 * @brief Tests for format_tools and the source-location helpers.
 */
#include "lft_base.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <source_location>
#include <string>

using namespace liftoff;
using ::testing::HasSubstr;
using ::testing::MatchesRegex;

namespace sample
{
struct Widget
{
};
} // namespace sample

TEST(FormatToolsTest, FilenameOnlyStripsDirectories)
{
    static_assert(format_tools::filename_only("/a/b/c.cpp") == "c.cpp");
    EXPECT_EQ(format_tools::filename_only("C:\\src\\main.cpp"), "main.cpp");
    EXPECT_EQ(format_tools::filename_only("mixed/dir\\file.h"), "file.h");
    EXPECT_EQ(format_tools::filename_only("plain.cpp"), "plain.cpp");
    EXPECT_EQ(format_tools::filename_only(""), "");
}

TEST(FormatToolsTest, TypeNameIsReadable)
{
#if defined(__GNUG__) || defined(__clang__)
    EXPECT_EQ(format_tools::type_name<sample::Widget>(), "sample::Widget");
    EXPECT_EQ(format_tools::type_name<int>(), "int");
#else
    EXPECT_THAT(format_tools::type_name<sample::Widget>(), HasSubstr("sample::Widget"));
#endif
}

TEST(FormatToolsTest, DemangleFallsBackToInput)
{
    EXPECT_EQ(format_tools::demangle("not-a-mangled-name"), "not-a-mangled-name");
    EXPECT_EQ(format_tools::demangle(nullptr), "<null>");
}

TEST(FormatToolsTest, FormattedTimeHasMicroseconds)
{
    const std::string s = format_tools::formatted_time(std::chrono::system_clock::now());
    EXPECT_THAT(s, MatchesRegex("[0-9]{4}-[0-9]{2}-[0-9]{2} [0-9]{2}:[0-9]{2}:[0-9]{2}\\.[0-9]{6}"));
}

TEST(FormatToolsTest, MakeBuffer)
{
    auto mb = format_tools::make_buffer("{}-{}", 1, "two");
    EXPECT_EQ(fmt::to_string(mb), "1-two");
}

TEST(FormatToolsTest, SourceLocationLabel)
{
    const auto loc = std::source_location::current();
    const std::string label = SRCLOC_TO_STR(loc);
    EXPECT_THAT(label, HasSubstr("test_format_tools.cpp:"));
    EXPECT_THAT(label, HasSubstr(std::to_string(loc.line())));
    EXPECT_THAT(label, ::testing::Not(HasSubstr("/")));
}
