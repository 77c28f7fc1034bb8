// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string_view>
#include <vector>

#include "checksum/mod11_checksum.hpp"
#include "utils.hpp"

namespace validbr {

mod11_checksum::mod11_checksum(std::size_t body_length, uint8_t max_weight, bool reject_uniform)
    : body_length_(body_length), max_weight_(max_weight), reject_uniform_(reject_uniform)
{
    if (body_length == 0 || body_length > max_body_length) {
        throw std::invalid_argument("mod11 checksum body length out of range");
    }

    if (max_weight < 3) {
        throw std::invalid_argument("mod11 checksum max weight must be at least 3");
    }
}

std::vector<uint8_t> mod11_checksum::weights(std::size_t amount) const
{
    std::vector<uint8_t> table;
    table.reserve(amount);
    for (std::size_t i = 0; i < amount; ++i) { table.push_back(weight_at(amount - i - 1)); }
    return table;
}

unsigned mod11_checksum::weighted_sum(
    std::span<const uint8_t> digits, std::size_t distance_offset) const noexcept
{
    unsigned sum = 0;
    for (std::size_t i = 0; i < digits.size(); ++i) {
        auto distance = digits.size() - i - 1 + distance_offset;
        sum += static_cast<unsigned>(digits[i]) * weight_at(distance);
    }
    return sum;
}

uint8_t mod11_checksum::verifier_digit(std::span<const uint8_t> digits) const noexcept
{
    return reduce(weighted_sum(digits, 0));
}

std::array<uint8_t, mod11_checksum::check_digits> mod11_checksum::compute(
    std::span<const uint8_t> body) const noexcept
{
    auto first = reduce(weighted_sum(body, 0));
    // The first check digit sits at distance 0 for the second pass, so the body
    // shifts one weight to the left.
    auto second = reduce(weighted_sum(body, 1) + first * static_cast<unsigned>(weight_at(0)));
    return {first, second};
}

bool mod11_checksum::validate(std::string_view str) const noexcept
{
    std::array<uint8_t, max_body_length + check_digits> digits{};
    auto scan = scan_digits(str, {digits.data(), length()});
    if (scan.invalid.has_value() || scan.count != length()) {
        return false;
    }

    if (reject_uniform_ && is_uniform({digits.data(), scan.count})) {
        return false;
    }

    auto body = std::span<const uint8_t>{digits.data(), body_length_};
    auto expected = compute(body);
    return expected[0] == digits[body_length_] && expected[1] == digits[body_length_ + 1];
}

const mod11_checksum &cpf_checksum()
{
    static const mod11_checksum checksum{9, 11, true};
    return checksum;
}

const mod11_checksum &cnpj_checksum()
{
    static const mod11_checksum checksum{12, 9, true};
    return checksum;
}

} // namespace validbr
