// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <string>
#include <string_view>

#include <re2/re2.h>

#include "checksum/mod11_checksum.hpp"
#include "document/common.hpp"
#include "document/cpf.hpp"
#include "exception.hpp"
#include "log.hpp"
#include "utils.hpp"

namespace validbr {

cpf::verifier_type compute_cpf_verifier_digits(const cpf::digits_type &digits)
{
    return cpf_checksum().compute(digits);
}

cpf cpf::parse(std::string_view str)
{
    try {
        auto all = detail::normalize<length>(document_type::cpf, str);
        return make(detail::slice<0, digit_count>(all), detail::slice<digit_count, verifier_count>(all));
    } catch (const document_error &e) {
        VALIDBR_DEBUG("Rejected cpf: {}", e.what());
        throw;
    }
}

cpf cpf::make(const digits_type &digits, const verifier_type &verifier_digits)
{
    if (!digits_in_range(digits) || !digits_in_range(verifier_digits)) {
        throw digits_out_of_bounds(document_type::cpf);
    }

    detail::check_verifier_digits(
        document_type::cpf, digits, compute_cpf_verifier_digits(digits), verifier_digits);

    return cpf{digits, verifier_digits};
}

cpf cpf::from_digits(const digits_type &digits)
{
    if (!digits_in_range(digits)) {
        throw digits_out_of_bounds(document_type::cpf);
    }
    auto verifier_digits = compute_cpf_verifier_digits(digits);
    detail::check_verifier_digits(document_type::cpf, digits, verifier_digits, verifier_digits);
    return cpf{digits, verifier_digits};
}

bool cpf::is_valid(std::string_view str) noexcept { return cpf_checksum().validate(str); }

bool cpf::is_canonical(std::string_view str)
{
    static const re2::RE2 canonical(R"(\d{3}\.\d{3}\.\d{3}-\d{2})");
    return re2::RE2::FullMatch(str, canonical);
}

std::string cpf::to_string() const
{
    std::string output;
    output.reserve(formatted_length);
    for (std::size_t i = 0; i < digit_count; ++i) {
        if (i == 3 || i == 6) {
            output.push_back('.');
        }
        output.push_back(todigit(digits_[i]));
    }
    output.push_back('-');
    append_digits(output, verifier_digits_);
    return output;
}

std::string cpf::to_digit_string() const
{
    std::string output;
    output.reserve(length);
    append_digits(output, digits_);
    append_digits(output, verifier_digits_);
    return output;
}

} // namespace validbr
