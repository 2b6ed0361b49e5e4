#include <gtest/gtest.h>
#include "../src/utf8.h"

TEST(Utf8Test, ValidateAscii) { EXPECT_FALSE(Utf8::validate("hello, world").has_value()); }

TEST(Utf8Test, ValidateEmpty) { EXPECT_FALSE(Utf8::validate("").has_value()); }

TEST(Utf8Test, ValidateMultiByte) {
    EXPECT_FALSE(Utf8::validate("Ñoño 你好世界 🌍").has_value());
}

TEST(Utf8Test, RejectsStrayContinuationByte) {
    auto bad = Utf8::validate("ab\x80"
                              "cd");
    ASSERT_TRUE(bad.has_value());
    EXPECT_EQ(*bad, 2u);
}

TEST(Utf8Test, RejectsTruncatedSequence) {
    // First two bytes of a three byte sequence
    auto bad = Utf8::validate("x\xE4\xBD");
    ASSERT_TRUE(bad.has_value());
    EXPECT_EQ(*bad, 1u);
}

TEST(Utf8Test, RejectsOverlongEncoding) {
    EXPECT_TRUE(Utf8::validate("\xC0\xAF").has_value());
    EXPECT_TRUE(Utf8::validate("\xE0\x80\xAF").has_value());
    EXPECT_TRUE(Utf8::validate("\xF0\x80\x80\xAF").has_value());
}

TEST(Utf8Test, RejectsSurrogates) { EXPECT_TRUE(Utf8::validate("\xED\xA0\x80").has_value()); }

TEST(Utf8Test, RejectsAboveMaxCodePoint) {
    EXPECT_TRUE(Utf8::validate("\xF4\x90\x80\x80").has_value());
    EXPECT_TRUE(Utf8::validate("\xF5\x80\x80\x80").has_value());
}

TEST(Utf8Test, AcceptsMaxCodePoint) { EXPECT_FALSE(Utf8::validate("\xF4\x8F\xBF\xBF").has_value()); }

TEST(Utf8Test, BoundaryChecks) {
    std::string text = "aéb"; // a, C3 A9, b
    EXPECT_TRUE(Utf8::isBoundary(text, 0));
    EXPECT_TRUE(Utf8::isBoundary(text, 1));
    EXPECT_FALSE(Utf8::isBoundary(text, 2));
    EXPECT_TRUE(Utf8::isBoundary(text, 3));
    EXPECT_TRUE(Utf8::isBoundary(text, 4));
    EXPECT_FALSE(Utf8::isBoundary(text, 5));
}

TEST(Utf8Test, LengthCountsScalarValues) {
    EXPECT_EQ(Utf8::length(""), 0u);
    EXPECT_EQ(Utf8::length("hey"), 3u);
    EXPECT_EQ(Utf8::length("😊😊"), 2u);
    EXPECT_EQ(Utf8::length("Ñoño"), 4u);
}

TEST(Utf8Test, SingleScalar) {
    EXPECT_TRUE(Utf8::isSingleScalar("_"));
    EXPECT_TRUE(Utf8::isSingleScalar("👉"));
    EXPECT_FALSE(Utf8::isSingleScalar(""));
    EXPECT_FALSE(Utf8::isSingleScalar("ab"));
    EXPECT_FALSE(Utf8::isSingleScalar("\xE4\xBD"));
}
