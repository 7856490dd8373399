/**
 * @file test_string_escape.cpp
 * @brief Minimal escaping and UTF-16 key ordering tests
 */

#include "canonjson/canonical_json.hpp"

#include <compare>
#include <string>

#include <gtest/gtest.h>

using namespace canonjson::canonical;
using canonjson::ErrorCode;

TEST(StringEscape, PlainAscii)
{
    EXPECT_EQ(*escape_string("hello"), R"("hello")");
    EXPECT_EQ(*escape_string(""), R"("")");
}

TEST(StringEscape, QuoteAndBackslash)
{
    EXPECT_EQ(*escape_string(R"(say "hi")"), R"("say \"hi\"")");
    EXPECT_EQ(*escape_string(R"(C:\dir)"), R"("C:\\dir")");
}

TEST(StringEscape, ShortEscapes)
{
    EXPECT_EQ(*escape_string("\b\f\n\r\t"), R"("\b\f\n\r\t")");
}

TEST(StringEscape, OtherControlCharacters)
{
    EXPECT_EQ(*escape_string(std::string("\x00", 1)), R"("\u0000")");
    EXPECT_EQ(*escape_string("\x01"), R"("\u0001")");
    EXPECT_EQ(*escape_string("\x0f"), R"("\u000f")");
    EXPECT_EQ(*escape_string("\x1f"), R"("\u001f")");
}

TEST(StringEscape, NoOptionalEscapes)
{
    // Solidus and DEL stay literal
    EXPECT_EQ(*escape_string("a/b"), R"("a/b")");
    EXPECT_EQ(*escape_string("\x7f"), "\"\x7f\"");
}

TEST(StringEscape, NonAsciiPassesThrough)
{
    const std::string euro = "\xe2\x82\xac";
    const std::string grinning = "\xf0\x9f\x98\x80";
    const std::string umlaut = "\xc3\xb6";
    EXPECT_EQ(*escape_string(euro), "\"" + euro + "\"");
    EXPECT_EQ(*escape_string(grinning), "\"" + grinning + "\"");
    EXPECT_EQ(*escape_string(umlaut + "x"), "\"" + umlaut + "x\"");
}

TEST(StringEscape, MalformedUtf8Rejected)
{
    for (const std::string bad : {std::string("\xff"),
                                  std::string("\xc0\xaf"),          // overlong '/'
                                  std::string("\xed\xa0\x80"),      // lone surrogate
                                  std::string("\xe2\x82"),          // truncated
                                  std::string("\xf4\x90\x80\x80"),  // above U+10FFFF
                                  std::string("a\x80")}) {
        auto result = escape_string(bad);
        ASSERT_FALSE(result);
        EXPECT_EQ(result.error().code, ErrorCode::kInvalidString);
    }
}

TEST(CompareUtf16, AsciiOrder)
{
    EXPECT_EQ(*compare_utf16("a", "b"), std::strong_ordering::less);
    EXPECT_EQ(*compare_utf16("b", "a"), std::strong_ordering::greater);
    EXPECT_EQ(*compare_utf16("abc", "abc"), std::strong_ordering::equal);
    EXPECT_EQ(*compare_utf16("ab", "abc"), std::strong_ordering::less);
    EXPECT_EQ(*compare_utf16("B", "a"), std::strong_ordering::less);
}

TEST(CompareUtf16, SupplementaryBeforeHighBmp)
{
    // U+1F600 is D83D DE00 in UTF-16, which sorts before U+FF21 even though
    // its UTF-8 lead byte is larger
    const std::string grinning = "\xf0\x9f\x98\x80";
    const std::string fullwidth_a = "\xef\xbc\xa1";
    EXPECT_EQ(*compare_utf16(grinning, fullwidth_a), std::strong_ordering::less);
    EXPECT_EQ(*compare_utf16(fullwidth_a, grinning), std::strong_ordering::greater);
}

TEST(CompareUtf16, MalformedRejected)
{
    auto result = compare_utf16("ok", "\xff");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::kInvalidString);
}
