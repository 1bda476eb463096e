#include <gtest/gtest.h>
#include "common/utils.hpp"
#include <chrono>

using namespace wordguard::common;

TEST(StringUtilsTest, Utf8RoundTrip) {
    std::u32string decoded = StringUtils::to_utf32("h\xC3\xA9llo");
    EXPECT_EQ(decoded.size(), 5u);
    EXPECT_EQ(decoded[1], U'\u00E9');
    EXPECT_EQ(StringUtils::to_utf8(decoded), "h\xC3\xA9llo");

    EXPECT_TRUE(StringUtils::to_utf32("").empty());
    EXPECT_EQ(StringUtils::to_utf8(U""), "");
}

TEST(StringUtilsTest, MalformedUtf8DecodesToReplacementCharacter) {
    std::u32string decoded = StringUtils::to_utf32("a\xFF" "b");
    ASSERT_EQ(decoded.size(), 3u);
    EXPECT_EQ(decoded[0], U'a');
    EXPECT_EQ(decoded[1], U'\uFFFD');
    EXPECT_EQ(decoded[2], U'b');
}

TEST(StringUtilsTest, LowercaseKeepsLength) {
    EXPECT_EQ(StringUtils::to_lower(std::string("\xC3\x89" "COLE")), "\xC3\xA9" "cole");
    EXPECT_EQ(StringUtils::to_lower(U"FuCK"), U"fuck");

    // Simple case mapping: one code point in, one out
    std::u32string dotted = U"\u0130";
    EXPECT_EQ(StringUtils::to_lower(dotted).size(), 1u);
}

TEST(StringUtilsTest, EqualsIgnoreCase) {
    EXPECT_TRUE(StringUtils::equals_ignore_case(U"ASS", U"ass"));
    EXPECT_TRUE(StringUtils::equals_ignore_case(U"\u00C9t\u00E9", U"\u00E9T\u00C9"));
    EXPECT_FALSE(StringUtils::equals_ignore_case(U"ass", U"asses"));
    EXPECT_FALSE(StringUtils::equals_ignore_case(U"abc", U"abd"));
}

TEST(StringUtilsTest, SplitKeepsEmptyTokens) {
    auto tokens = StringUtils::split(U"a  b", U' ');
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0], U"a");
    EXPECT_TRUE(tokens[1].empty());
    EXPECT_EQ(tokens[2], U"b");

    auto single = StringUtils::split(U"", U' ');
    ASSERT_EQ(single.size(), 1u);
    EXPECT_TRUE(single[0].empty());
}

TEST(StringUtilsTest, ReplaceAll) {
    EXPECT_EQ(StringUtils::replace_all(U"c()ck ()", U"()", U"o"), U"cock o");
    // Non-overlapping, left to right, no rescan of the result
    EXPECT_EQ(StringUtils::replace_all(U"aaa", U"aa", U""), U"a");
    EXPECT_EQ(StringUtils::replace_all(U"aabb", U"ab", U""), U"ab");
    // Empty pattern is a no-op
    EXPECT_EQ(StringUtils::replace_all(U"abc", U"", U"x"), U"abc");
}

TEST(StringUtilsTest, Contains) {
    EXPECT_TRUE(StringUtils::contains(U"classic", U"ass"));
    EXPECT_FALSE(StringUtils::contains(U"classic", U"asses"));
    EXPECT_FALSE(StringUtils::contains(U"classic", U""));
    EXPECT_FALSE(StringUtils::contains(U"", U""));
}

TEST(StringUtilsTest, Trim) {
    EXPECT_EQ(StringUtils::trim("  true \n"), "true");
    EXPECT_EQ(StringUtils::trim("   "), "");
}

TEST(TimeUtilsTest, FormatDuration) {
    EXPECT_EQ(TimeUtils::format_duration(std::chrono::nanoseconds(500)), "500.000ns");
    EXPECT_EQ(TimeUtils::format_duration(std::chrono::microseconds(1500)), "1.500ms");
    EXPECT_EQ(TimeUtils::format_duration(std::chrono::seconds(2)), "2.000s");
}

TEST(TimeUtilsTest, TimerAdvances) {
    TimeUtils::Timer timer;
    EXPECT_GE(timer.elapsed_us(), 0.0);
    timer.reset();
    EXPECT_GE(timer.elapsed_ms(), 0.0);
    EXPECT_GT(TimeUtils::current_time_ms(), 0);
}
