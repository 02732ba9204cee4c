#include "utils/string_utils.h"
#include <gtest/gtest.h>

TEST(StringUtilsTest, ReplaceAll) {
    std::string s = "a-b-c";
    EXPECT_EQ(replaceAllInPlace(s, "-", "--"), 2u);
    EXPECT_EQ(s, "a--b--c");
    EXPECT_EQ(replaceAllInPlace(s, "", "x"), 0u);
}

TEST(StringUtilsTest, SplitLinesDropsCarriageReturnsAndTrailingNewline) {
    EXPECT_EQ(splitLines("a\r\nb\n"), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(splitLines("a\n\nb"), (std::vector<std::string>{"a", "", "b"}));
    EXPECT_EQ(splitLines(""), (std::vector<std::string>{""}));
}

TEST(StringUtilsTest, JoinLinesTerminatesEveryLine) {
    EXPECT_EQ(joinLines({"a", "b"}), "a\nb\n");
    EXPECT_EQ(joinLines({}), "");
}

TEST(StringUtilsTest, Trim) {
    EXPECT_EQ(trimString("  hi \t"), "hi");
    EXPECT_EQ(trimRight("  hi  "), "  hi");
    EXPECT_EQ(trimString("   "), "");
}

TEST(StringUtilsTest, DecodeUtf8) {
    std::vector<char32_t> cps;
    ASSERT_TRUE(decodeUtf8("a\xc3\xa9\xe2\x98\x83", cps));
    EXPECT_EQ(cps, (std::vector<char32_t>{U'a', 0xE9, 0x2603}));

    cps.clear();
    EXPECT_FALSE(decodeUtf8("\xe2\x98", cps));
    cps.clear();
    EXPECT_FALSE(decodeUtf8("\xff", cps));
    cps.clear();
    EXPECT_FALSE(decodeUtf8("\xc3\x41", cps));
}

TEST(StringUtilsTest, Utf8LengthCountsCodePoints) {
    EXPECT_EQ(utf8Length("abc"), 3u);
    EXPECT_EQ(utf8Length("╔══╗"), 4u);
}

TEST(StringUtilsTest, SanitizeStripsControlCharacters) {
    EXPECT_EQ(sanitizeText("  he\x01llo\x7f\t!  ", 0), "hello !");
    EXPECT_EQ(sanitizeText("a\nb", 0), "a\nb");
    EXPECT_EQ(sanitizeText("a\nb", 0, false), "ab");
}

TEST(StringUtilsTest, SanitizeTruncatesOnCodePointBoundary) {
    EXPECT_EQ(sanitizeText("abcdef", 3), "abc");
    EXPECT_EQ(sanitizeText("\xc3\xa9\xc3\xa9\xc3\xa9", 2), "\xc3\xa9\xc3\xa9");
    EXPECT_EQ(sanitizeText("ab  cd", 3), "ab");
}
