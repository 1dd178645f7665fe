#include "gtest/gtest.h"
#include <name_parts/text_direction.hpp>

using name_parts::is_rtl;

TEST(TextDirectionTest, CodePointRanges) {
    EXPECT_TRUE(name_parts::is_rtl_code_point(0x05D0));  // alef
    EXPECT_TRUE(name_parts::is_rtl_code_point(0x0627));  // arabic alef
    EXPECT_FALSE(name_parts::is_rtl_code_point('A'));
    EXPECT_FALSE(name_parts::is_rtl_code_point(0x00E9));
}

TEST(TextDirectionTest, FirstStrongCharacterDecides) {
    EXPECT_TRUE(is_rtl("שלום"));
    EXPECT_TRUE(is_rtl("مرحبا"));
    EXPECT_FALSE(is_rtl("Hello"));
    EXPECT_TRUE(is_rtl("1923 (לוי)"));
    EXPECT_FALSE(is_rtl("Levi לוי"));
    EXPECT_FALSE(is_rtl(""));
    EXPECT_FALSE(is_rtl("123 - 456"));
}

TEST(TextDirectionTest, WordList) {
    EXPECT_FALSE(is_rtl(std::vector<std::string>{}));
    EXPECT_TRUE(is_rtl(std::vector<std::string>{ "מרים", "לוי" }));
    EXPECT_TRUE(is_rtl(std::vector<std::string>{ "-", "לוי" }));
    EXPECT_FALSE(is_rtl(std::vector<std::string>{ "Ivan", "לוי" }));
}

TEST(TextDirectionTest, TruncatedSequenceIsIgnored) {
    // Lead byte of a two byte sequence without its continuation.
    EXPECT_FALSE(is_rtl(std::string_view("\xD7", 1)));
}

TEST(TextDirectionTest, StrongLatinSupplementCharacters) {
    // Ordinal indicators and the micro sign decide before the Hebrew text.
    EXPECT_FALSE(is_rtl("\xC2\xAA לוי"));
    EXPECT_FALSE(is_rtl("\xC2\xB5 לוי"));
    EXPECT_FALSE(is_rtl("\xC2\xBA לוי"));
    // The degree sign stays neutral.
    EXPECT_TRUE(is_rtl("\xC2\xB0 לוי"));
}
