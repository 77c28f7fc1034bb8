// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <array>
#include <string_view>

#include "utils.hpp"
#include "validbr.h"

#include "common/gtest_utils.hpp"

using ::testing::ElementsAre;

namespace {

VALIDBR_RET_CODE parse(std::string_view str, validbr_cnpj &output)
{
    return validbr_parse_cnpj(str.data(), str.size(), &output);
}

TEST(TestCnpjInterface, Parse)
{
    validbr_cnpj value{};
    EXPECT_EQ(parse("12.345.678/9012-30", value), VALIDBR_OK);
    EXPECT_THAT(value.digits, ElementsAre(1, 2, 3, 4, 5, 6, 7, 8));
    EXPECT_THAT(value.branch_digits, ElementsAre(9, 0, 1, 2));
    EXPECT_THAT(value.verifier_digits, ElementsAre(3, 0));
}

TEST(TestCnpjInterface, ParseErrors)
{
    validbr_cnpj value{};
    EXPECT_EQ(parse("12.345.678/0001+95", value), VALIDBR_ERR_INVALID_CHARACTER);
    EXPECT_EQ(parse("123.456.789-09", value), VALIDBR_ERR_INVALID_LENGTH);
    EXPECT_EQ(parse("80.906.404/0003-88", value), VALIDBR_ERR_INVALID_VERIFIER_DIGIT);
    EXPECT_EQ(parse("00.000.000/0000-00", value), VALIDBR_ERR_INVALID_VERIFIER_DIGIT);

    EXPECT_EQ(validbr_parse_cnpj(nullptr, 14, &value), VALIDBR_ERR_INVALID_ARGUMENT);
    EXPECT_EQ(validbr_parse_cnpj(STRL("12345678000195"), nullptr), VALIDBR_ERR_INVALID_ARGUMENT);
}

TEST(TestCnpjInterface, Validate)
{
    EXPECT_TRUE(validbr_validate_cnpj(STRL("12.345.678/0001-95")));
    EXPECT_TRUE(validbr_validate_cnpj(STRL("53871143000135")));
    EXPECT_FALSE(validbr_validate_cnpj(STRL("12.345.678/0001-00")));
    EXPECT_FALSE(validbr_validate_cnpj(STRL("12345678909")));
    EXPECT_FALSE(validbr_validate_cnpj(nullptr, 0));
}

TEST(TestCnpjInterface, Format)
{
    validbr_cnpj value{{1, 1, 2, 2, 2, 3, 3, 3}, {0, 0, 0, 2}, {6, 2}};
    std::array<char, VALIDBR_CNPJ_FORMATTED_SIZE> buffer{};
    EXPECT_EQ(validbr_format_cnpj(&value, buffer.data(), buffer.size()), VALIDBR_OK);
    EXPECT_STR(buffer.data(), "11.222.333/0002-62");
}

TEST(TestCnpjInterface, FormatErrors)
{
    std::array<char, VALIDBR_CNPJ_FORMATTED_SIZE> buffer{};

    validbr_cnpj value{{1, 1, 2, 2, 2, 3, 3, 3}, {0, 0, 0, 2}, {6, 2}};
    EXPECT_EQ(validbr_format_cnpj(&value, buffer.data(), 0), VALIDBR_ERR_INVALID_ARGUMENT);
    EXPECT_EQ(validbr_format_cnpj(&value, buffer.data(), buffer.size() - 1),
        VALIDBR_ERR_INVALID_ARGUMENT);

    validbr_cnpj inconsistent{{1, 1, 2, 2, 2, 3, 3, 3}, {0, 0, 0, 1}, {6, 2}};
    EXPECT_EQ(validbr_format_cnpj(&inconsistent, buffer.data(), buffer.size()),
        VALIDBR_ERR_INVALID_VERIFIER_DIGIT);

    validbr_cnpj out_of_bounds{{1, 1, 2, 2, 2, 3, 3, 3}, {0, 0, 0, 12}, {6, 2}};
    EXPECT_EQ(validbr_format_cnpj(&out_of_bounds, buffer.data(), buffer.size()),
        VALIDBR_ERR_INVALID_ARGUMENT);
}

} // namespace
