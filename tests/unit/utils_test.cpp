// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <array>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

#include "utils.hpp"

#include "common/gtest_utils.hpp"

using namespace validbr;

namespace {
constexpr char char_min = std::numeric_limits<char>::min();
constexpr char char_max = std::numeric_limits<char>::max();

TEST(TestUtils, IsDigit)
{
    for (char c = char_min; c < char_max; ++c) {
        if (c >= '0' && c <= '9') {
            EXPECT_TRUE(isdigit(c));
        } else {
            EXPECT_FALSE(isdigit(c));
        }
    }
}

TEST(TestUtils, IsSpace)
{
    for (char c = char_min; c < char_max; ++c) {
        if (c == ' ' || c == '\f' || c == '\n' || c == '\r' || c == '\t' || c == '\v') {
            EXPECT_TRUE(isspace(c));
        } else {
            EXPECT_FALSE(isspace(c));
        }
    }
}

TEST(TestUtils, IsSeparator)
{
    for (char c = char_min; c < char_max; ++c) {
        if (c == '.' || c == '-' || c == '/' || isspace(c)) {
            EXPECT_TRUE(isseparator(c));
        } else {
            EXPECT_FALSE(isseparator(c));
        }
    }

    EXPECT_FALSE(isseparator('_'));
    EXPECT_FALSE(isseparator('\\'));
    EXPECT_FALSE(isseparator(','));
}

TEST(TestUtils, ToDigit)
{
    for (uint8_t i = 0; i < 10; ++i) { EXPECT_EQ(todigit(i), '0' + i); }
}

TEST(TestUtils, DigitsInRange)
{
    EXPECT_TRUE(digits_in_range(std::array<uint8_t, 3>{0, 5, 9}));
    EXPECT_TRUE(digits_in_range(std::array<uint8_t, 0>{}));
    EXPECT_FALSE(digits_in_range(std::array<uint8_t, 3>{0, 10, 9}));
    EXPECT_FALSE(digits_in_range(std::array<uint8_t, 1>{255}));
}

TEST(TestUtils, AppendDigits)
{
    std::string output{"x"};
    append_digits(output, std::array<uint8_t, 4>{0, 0, 4, 2});
    EXPECT_EQ(output, "x0042");
}

TEST(TestUtils, ScanDigits)
{
    std::array<uint8_t, 4> output{};
    auto scan = scan_digits("1.2-3/4 5", output);
    EXPECT_EQ(scan.count, 5);
    EXPECT_FALSE(scan.invalid.has_value());
    EXPECT_THAT(output, ::testing::ElementsAre(1, 2, 3, 4));

    scan = scan_digits("", output);
    EXPECT_EQ(scan.count, 0);
    EXPECT_FALSE(scan.invalid.has_value());

    scan = scan_digits(" .-/", output);
    EXPECT_EQ(scan.count, 0);
    EXPECT_FALSE(scan.invalid.has_value());
}

TEST(TestUtils, ScanDigitsStopsAtInvalidCharacter)
{
    std::array<uint8_t, 2> output{};
    auto scan = scan_digits("12345#67", output);
    EXPECT_EQ(scan.count, 5);
    ASSERT_TRUE(scan.invalid.has_value());
    EXPECT_EQ(*scan.invalid, 5);
    EXPECT_THAT(output, ::testing::ElementsAre(1, 2));

    scan = scan_digits(std::string_view{"\xff" "1"}, output);
    ASSERT_TRUE(scan.invalid.has_value());
    EXPECT_EQ(*scan.invalid, 0);
    EXPECT_EQ(scan.count, 0);
}

TEST(TestUtils, Printable)
{
    EXPECT_EQ(printable('a'), "'a'");
    EXPECT_EQ(printable(' '), "' '");
    EXPECT_EQ(printable('\n'), "\\x0a");
    EXPECT_EQ(printable('\0'), "\\x00");
    EXPECT_EQ(printable('\x7f'), "\\x7f");
    EXPECT_EQ(printable(static_cast<char>(0xc3)), "\\xc3");
}

} // namespace
