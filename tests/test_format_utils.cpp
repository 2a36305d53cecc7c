#include <gtest/gtest.h>

#include "rateline/format/format_utils.hpp"

#include <cstdint>
#include <limits>

using namespace rateline::format;

TEST(FormatUtils, CountsGetThousandsSeparators) {
    EXPECT_EQ("0", formatCount(0));
    EXPECT_EQ("999", formatCount(999));
    EXPECT_EQ("1,000", formatCount(1000));
    EXPECT_EQ("1,234,567", formatCount(1234567));
    EXPECT_EQ("-12,345", formatCount(-12345));
    EXPECT_EQ("-9,223,372,036,854,775,808", formatCount(std::numeric_limits<int64_t>::min()));
}

TEST(FormatUtils, RateSwitchesToSecondsPerIteration) {
    EXPECT_EQ("12.50it/s", formatRate(12.5));
    EXPECT_EQ("1.00it/s", formatRate(1.0));
    EXPECT_EQ("4.00s/it", formatRate(0.25));
    EXPECT_EQ("?it/s", formatRate(0.0));
    EXPECT_EQ("?it/s", formatRate(std::numeric_limits<double>::infinity()));
}

TEST(FormatUtils, Seconds) {
    EXPECT_EQ("0s", formatSeconds(0.0));
    EXPECT_EQ("42s", formatSeconds(42.0));
    EXPECT_EQ("?s", formatSeconds(std::numeric_limits<double>::quiet_NaN()));
    EXPECT_EQ("?s", formatSeconds(-1.0));
}

TEST(FormatUtils, DisplayWidthIgnoresEscapes) {
    EXPECT_EQ(0u, displayWidth(""));
    EXPECT_EQ(3u, displayWidth("abc"));
    EXPECT_EQ(2u, displayWidth("\033[1m\033[31mab\033[0m"));
    EXPECT_EQ(3u, displayWidth("█▌ "));
}

TEST(FormatUtils, SplitGlyphsKeepsCodePoints) {
    auto glyphs = splitGlyphs("a█b");
    ASSERT_EQ(3u, glyphs.size());
    EXPECT_EQ("█", glyphs[1]);
    
    auto broken = splitGlyphs("x\xff");
    ASSERT_EQ(2u, broken.size());
    EXPECT_EQ("\uFFFD", broken[1]);
}

TEST(FormatUtils, RepeatString) {
    EXPECT_EQ("", repeatString("ab", 0));
    EXPECT_EQ("ababab", repeatString("ab", 3));
    EXPECT_EQ("███", repeatString("█", 3));
}

TEST(FormatUtils, LabelControlCharactersBecomeSpaces) {
    EXPECT_EQ("a b c", sanitizeLabel("a\rb\nc"));
    EXPECT_EQ("tab bed", sanitizeLabel("tab\tbed"));
    EXPECT_EQ("plain", sanitizeLabel("plain"));
    EXPECT_TRUE(isControlCharacter(0x1B));
    EXPECT_FALSE(isControlCharacter('a'));
}
