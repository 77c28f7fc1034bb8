// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <array>
#include <cstring>
#include <string_view>

#include "utils.hpp"
#include "validbr.h"

#include "common/gtest_utils.hpp"

using namespace std::literals;
using ::testing::ElementsAre;

namespace {

VALIDBR_RET_CODE parse(std::string_view str, validbr_cpf &output)
{
    return validbr_parse_cpf(str.data(), str.size(), &output);
}

TEST(TestCpfInterface, Parse)
{
    validbr_cpf value{};
    EXPECT_EQ(parse("123.456.789-09", value), VALIDBR_OK);
    EXPECT_THAT(value.digits, ElementsAre(1, 2, 3, 4, 5, 6, 7, 8, 9));
    EXPECT_THAT(value.verifier_digits, ElementsAre(0, 9));

    EXPECT_EQ(parse("26144223045", value), VALIDBR_OK);
    EXPECT_THAT(value.digits, ElementsAre(2, 6, 1, 4, 4, 2, 2, 3, 0));
    EXPECT_THAT(value.verifier_digits, ElementsAre(4, 5));
}

TEST(TestCpfInterface, ParseErrors)
{
    validbr_cpf value{};
    EXPECT_EQ(parse("123.456.789-0a", value), VALIDBR_ERR_INVALID_CHARACTER);
    EXPECT_EQ(parse("123.456.789-0", value), VALIDBR_ERR_INVALID_LENGTH);
    EXPECT_EQ(parse("", value), VALIDBR_ERR_INVALID_LENGTH);
    EXPECT_EQ(parse("123.456.789-10", value), VALIDBR_ERR_INVALID_VERIFIER_DIGIT);
    EXPECT_EQ(parse("111.111.111-11", value), VALIDBR_ERR_INVALID_VERIFIER_DIGIT);
}

TEST(TestCpfInterface, ParseOutputUntouchedOnError)
{
    validbr_cpf value{};
    ASSERT_EQ(parse("123.456.789-09", value), VALIDBR_OK);
    EXPECT_EQ(parse("261.442.230-46", value), VALIDBR_ERR_INVALID_VERIFIER_DIGIT);
    EXPECT_THAT(value.digits, ElementsAre(1, 2, 3, 4, 5, 6, 7, 8, 9));
}

TEST(TestCpfInterface, ParseNullArguments)
{
    validbr_cpf value{};
    EXPECT_EQ(validbr_parse_cpf(nullptr, 11, &value), VALIDBR_ERR_INVALID_ARGUMENT);
    EXPECT_EQ(validbr_parse_cpf("12345678909", 11, nullptr), VALIDBR_ERR_INVALID_ARGUMENT);
    // A null string of length zero is an empty string
    EXPECT_EQ(validbr_parse_cpf(nullptr, 0, &value), VALIDBR_ERR_INVALID_LENGTH);
}

TEST(TestCpfInterface, ParseNonTerminated)
{
    // Only the first length bytes are considered
    const char *str = "12345678909123";
    validbr_cpf value{};
    EXPECT_EQ(validbr_parse_cpf(str, 11, &value), VALIDBR_OK);
}

TEST(TestCpfInterface, Validate)
{
    EXPECT_TRUE(validbr_validate_cpf(STRL("123.456.789-09")));
    EXPECT_TRUE(validbr_validate_cpf(STRL("88761432032")));
    EXPECT_FALSE(validbr_validate_cpf(STRL("123.456.789-10")));
    EXPECT_FALSE(validbr_validate_cpf(STRL("000.000.000-00")));
    EXPECT_FALSE(validbr_validate_cpf(STRL("abc")));
    EXPECT_FALSE(validbr_validate_cpf(nullptr, 11));
}

TEST(TestCpfInterface, Format)
{
    validbr_cpf value{{4, 1, 4, 9, 0, 4, 2, 5, 7}, {8, 0}};
    std::array<char, VALIDBR_CPF_FORMATTED_SIZE> buffer{};
    EXPECT_EQ(validbr_format_cpf(&value, buffer.data(), buffer.size()), VALIDBR_OK);
    EXPECT_STR(buffer.data(), "414.904.257-80");
}

TEST(TestCpfInterface, FormatErrors)
{
    std::array<char, VALIDBR_CPF_FORMATTED_SIZE> buffer{};

    validbr_cpf value{{4, 1, 4, 9, 0, 4, 2, 5, 7}, {8, 0}};
    EXPECT_EQ(validbr_format_cpf(&value, buffer.data(), buffer.size() - 1),
        VALIDBR_ERR_INVALID_ARGUMENT);
    EXPECT_EQ(validbr_format_cpf(&value, nullptr, buffer.size()), VALIDBR_ERR_INVALID_ARGUMENT);
    EXPECT_EQ(validbr_format_cpf(nullptr, buffer.data(), buffer.size()),
        VALIDBR_ERR_INVALID_ARGUMENT);

    validbr_cpf inconsistent{{4, 1, 4, 9, 0, 4, 2, 5, 7}, {8, 1}};
    EXPECT_EQ(validbr_format_cpf(&inconsistent, buffer.data(), buffer.size()),
        VALIDBR_ERR_INVALID_VERIFIER_DIGIT);

    validbr_cpf out_of_bounds{{4, 1, 4, 9, 0, 4, 2, 5, 17}, {8, 0}};
    EXPECT_EQ(validbr_format_cpf(&out_of_bounds, buffer.data(), buffer.size()),
        VALIDBR_ERR_INVALID_ARGUMENT);
}

TEST(TestCpfInterface, ParseThenFormat)
{
    validbr_cpf value{};
    ASSERT_EQ(parse("310 126 650 54", value), VALIDBR_OK);

    std::array<char, VALIDBR_CPF_FORMATTED_SIZE> buffer{};
    ASSERT_EQ(validbr_format_cpf(&value, buffer.data(), buffer.size()), VALIDBR_OK);
    EXPECT_EQ(strlen(buffer.data()), 14);
    EXPECT_STR(buffer.data(), "310.126.650-54");
}

} // namespace
