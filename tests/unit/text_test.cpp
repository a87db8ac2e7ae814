#include <conform/core/text.h>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace conform::core;

// ---------------------------------------------------------------------------
// Trimming
// ---------------------------------------------------------------------------
TEST(TextTest, TrimRemovesAsciiWhitespaceOnBothSides) {
    EXPECT_EQ(trim(" \t svg path \r\n"), "svg path");
    EXPECT_EQ(trim(""), "");
    EXPECT_EQ(trim("   "), "");
}

TEST(TextTest, TrimEndKeepsLeadingWhitespace) {
    EXPECT_EQ(trim_end("|   <body>  \r"), "|   <body>");
    EXPECT_EQ(trim_end("  x"), "  x");
}

TEST(TextTest, WhitespaceClassIncludesFormFeedAndVerticalTab) {
    EXPECT_TRUE(is_ascii_whitespace('\f'));
    EXPECT_TRUE(is_ascii_whitespace('\v'));
    EXPECT_FALSE(is_ascii_whitespace('x'));
    EXPECT_FALSE(is_ascii_whitespace('\0'));
}

// ---------------------------------------------------------------------------
// Line splitting
// ---------------------------------------------------------------------------
TEST(TextTest, SplitLinesKeepsTrailingEmptyLine) {
    auto lines = split_lines("a\nb\n");
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "a");
    EXPECT_EQ(lines[1], "b");
    EXPECT_EQ(lines[2], "");
}

TEST(TextTest, SplitLinesDoesNotSplitOnCarriageReturn) {
    auto lines = split_lines("a\r\nb");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "a\r");
    EXPECT_EQ(lines[1], "b");
}

TEST(TextTest, SplitEmptyTextYieldsOneEmptyLine) {
    auto lines = split_lines("");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_TRUE(lines[0].empty());
}

TEST(TextTest, JoinLinesUsesSingleNewlines) {
    std::vector<std::string> owned{"| <html>", "|   <head>"};
    EXPECT_EQ(join_lines(owned), "| <html>\n|   <head>");
    EXPECT_EQ(join_lines(std::vector<std::string>{}), "");
    EXPECT_EQ(join_lines(split_lines("x\ny")), "x\ny");
}

// ---------------------------------------------------------------------------
// UTF-8 / UTF-16
// ---------------------------------------------------------------------------
TEST(TextTest, AppendUtf8EncodesEachLength) {
    std::string out;
    append_utf8(out, U'A');
    append_utf8(out, 0xE9);
    append_utf8(out, 0x20AC);
    append_utf8(out, 0x1F600);
    EXPECT_EQ(out, "A\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80");
}

TEST(TextTest, AppendUtf8ReplacesSurrogates) {
    std::string out;
    append_utf8(out, 0xD800);
    EXPECT_EQ(out, "\xEF\xBF\xBD");
}

TEST(TextTest, ValidUtf8Detection) {
    EXPECT_TRUE(is_valid_utf8("plain"));
    EXPECT_TRUE(is_valid_utf8("\xF0\x9F\x98\x80"));
    EXPECT_FALSE(is_valid_utf8("\xC0\x80"));      // overlong
    EXPECT_FALSE(is_valid_utf8("\xED\xA0\x80"));  // surrogate
    EXPECT_FALSE(is_valid_utf8("\xE2\x82"));      // truncated
}

TEST(TextTest, Utf16ConversionProducesSurrogatePairs) {
    EXPECT_EQ(utf8_to_utf16("a\xF0\x9F\x98\x80"), std::u16string(u"a\xD83D\xDE00"));
}

TEST(TextTest, Utf16ConversionReplacesMalformedBytes) {
    EXPECT_EQ(utf8_to_utf16("\xFFx"), std::u16string(u"\xFFFDx"));
}
