// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstdint>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <re2/re2.h>

#include "checksum/mod11_checksum.hpp"
#include "document/cnpj.hpp"
#include "document/common.hpp"
#include "exception.hpp"
#include "log.hpp"
#include "utils.hpp"

namespace validbr {

cnpj_branch::cnpj_branch(const digits_type &digits) : digits_(digits)
{
    if (!digits_in_range(digits)) {
        throw invalid_branch_number("cnpj: branch digits must be in the range 0..9");
    }
}

cnpj_branch cnpj_branch::from_number(unsigned number)
{
    if (number > max_number) {
        throw invalid_branch_number(
            fmt::format("cnpj: branch number {} is outside the range 0..{}", number, max_number));
    }

    digits_type digits{};
    for (std::size_t i = digit_count; i > 0; --i) {
        digits[i - 1] = static_cast<uint8_t>(number % 10);
        number /= 10;
    }
    return cnpj_branch{digits};
}

uint16_t cnpj_branch::number() const noexcept
{
    uint16_t value = 0;
    for (auto d : digits_) { value = static_cast<uint16_t>(value * 10 + d); }
    return value;
}

std::string cnpj_branch::to_string() const
{
    std::string output;
    output.reserve(digit_count);
    append_digits(output, digits_);
    return output;
}

cnpj::verifier_type compute_cnpj_verifier_digits(
    const cnpj::digits_type &digits, const cnpj::branch_type &branch_digits)
{
    return cnpj_checksum().compute(detail::concat(digits, branch_digits));
}

cnpj cnpj::parse(std::string_view str)
{
    try {
        auto all = detail::normalize<length>(document_type::cnpj, str);
        return make(detail::slice<0, digit_count>(all),
            detail::slice<digit_count, branch_count>(all),
            detail::slice<digit_count + branch_count, verifier_count>(all));
    } catch (const document_error &e) {
        VALIDBR_DEBUG("Rejected cnpj: {}", e.what());
        throw;
    }
}

cnpj cnpj::make(const digits_type &digits, const branch_type &branch_digits,
    const verifier_type &verifier_digits)
{
    if (!digits_in_range(digits) || !digits_in_range(branch_digits) ||
        !digits_in_range(verifier_digits)) {
        throw digits_out_of_bounds(document_type::cnpj);
    }

    detail::check_verifier_digits(document_type::cnpj, detail::concat(digits, branch_digits),
        compute_cnpj_verifier_digits(digits, branch_digits), verifier_digits);

    return cnpj{digits, branch_digits, verifier_digits};
}

cnpj cnpj::from_digits(const digits_type &digits, const branch_type &branch_digits)
{
    if (!digits_in_range(digits) || !digits_in_range(branch_digits)) {
        throw digits_out_of_bounds(document_type::cnpj);
    }
    auto verifier_digits = compute_cnpj_verifier_digits(digits, branch_digits);
    detail::check_verifier_digits(document_type::cnpj, detail::concat(digits, branch_digits),
        verifier_digits, verifier_digits);
    return cnpj{digits, branch_digits, verifier_digits};
}

bool cnpj::is_valid(std::string_view str) noexcept { return cnpj_checksum().validate(str); }

bool cnpj::is_canonical(std::string_view str)
{
    static const re2::RE2 canonical(R"(\d{2}\.\d{3}\.\d{3}/\d{4}-\d{2})");
    return re2::RE2::FullMatch(str, canonical);
}

std::string cnpj::to_string() const
{
    std::string output;
    output.reserve(formatted_length);
    for (std::size_t i = 0; i < digit_count; ++i) {
        if (i == 2 || i == 5) {
            output.push_back('.');
        }
        output.push_back(todigit(digits_[i]));
    }
    output.push_back('/');
    append_digits(output, branch_digits_);
    output.push_back('-');
    append_digits(output, verifier_digits_);
    return output;
}

std::string cnpj::to_digit_string() const
{
    std::string output;
    output.reserve(length);
    append_digits(output, digits_);
    append_digits(output, branch_digits_);
    append_digits(output, verifier_digits_);
    return output;
}

} // namespace validbr
