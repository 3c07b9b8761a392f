//
// Created by gregorian-rayne on 2/16/26.
//

#include "sbt/utils/string_utils.hpp"

#include <gtest/gtest.h>
#include <cstdint>

namespace sbt::string_utils
{
    TEST(StringUtilsTest, Trim) {
        EXPECT_EQ(trim("  Dead store \t"), "Dead store");
        EXPECT_EQ(trim_left("\n x "), "x ");
        EXPECT_EQ(trim_right(" x \r\n"), " x");
        EXPECT_EQ(trim("   "), "");
        EXPECT_EQ(trim(""), "");
    }

    TEST(StringUtilsTest, ParseInt) {
        EXPECT_EQ(parse_int<int>("42"), 42);
        EXPECT_EQ(parse_int<std::int64_t>(" 17 "), 17);
        EXPECT_EQ(parse_int<int>("-3"), -3);
        EXPECT_FALSE(parse_int<int>("").has_value());
        EXPECT_FALSE(parse_int<int>("12abc").has_value());
        EXPECT_FALSE(parse_int<int>("abc").has_value());
        EXPECT_FALSE(parse_int<std::int8_t>("300").has_value());
    }

    TEST(StringUtilsTest, Truncate) {
        EXPECT_EQ(truncate("short", 10), "short");
        EXPECT_EQ(truncate("src/very/long/path.c", 10), "src/ver...");
        EXPECT_EQ(truncate("abcdef", 2), "ab");
    }

}  // namespace sbt::string_utils
