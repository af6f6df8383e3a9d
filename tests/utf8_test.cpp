#include "common/utf8.hpp"

#include <gtest/gtest.h>

using namespace soda;

TEST(Utf8Test, AcceptsWellFormedText) {
    EXPECT_TRUE(utf8::isValid(""));
    EXPECT_TRUE(utf8::isValid("hello world"));
    EXPECT_TRUE(utf8::isValid("gr\xC3\xBC\xC3\x9F" "e"));           // grüße
    EXPECT_TRUE(utf8::isValid("\xE2\x82\xAC"));                     // €
    EXPECT_TRUE(utf8::isValid("\xF0\x9F\x8E\xA4"));                 // 🎤
}

TEST(Utf8Test, RejectsMalformedText) {
    EXPECT_FALSE(utf8::isValid("\xFF"));
    EXPECT_FALSE(utf8::isValid("abc\xC3"));                         // truncated
    EXPECT_FALSE(utf8::isValid("\xC0\xAF"));                        // overlong
    EXPECT_FALSE(utf8::isValid("\xED\xA0\x80"));                    // surrogate
    EXPECT_FALSE(utf8::isValid("\xF4\x90\x80\x80"));                // > U+10FFFF
}

TEST(Utf8Test, LossyDecodeKeepsValidText) {
    EXPECT_EQ(utf8::toLossy("hello"), "hello");
    EXPECT_EQ(utf8::toLossy("\xE2\x82\xAC" "5"), "\xE2\x82\xAC" "5");
}

TEST(Utf8Test, LossyDecodeReplacesBadBytes) {
    EXPECT_EQ(utf8::toLossy("a\xFF" "b"), "a\xEF\xBF\xBD" "b");
    EXPECT_EQ(utf8::toLossy("abc\xC3"), "abc\xEF\xBF\xBD");
}

TEST(Utf8Test, LossyDecodeOfNullIsEmpty) {
    EXPECT_EQ(utf8::toLossy(nullptr), "");
    EXPECT_EQ(utf8::toLossy(nullptr, 4), "");
}

TEST(Utf8Test, LossyDecodeHonoursLength) {
    const char data[] = {'o', 'k', '\0', 'x'};
    EXPECT_EQ(utf8::toLossy(data, 2), "ok");
}
