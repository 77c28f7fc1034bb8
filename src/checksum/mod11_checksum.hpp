// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace validbr {

// Weighted modulo 11 checksum producing two trailing check digits.
//
// Weights are assigned from the rightmost digit leftwards, starting at 2 and
// increasing by one per position; once max_weight has been used the sequence
// restarts at 2. Each check digit is 11 - (sum % 11), or 0 when the remainder
// is 0 or 1. The second check digit covers the body and the first check digit.
//
// With reject_uniform, sequences made of a single repeated digit never
// validate, even when their check digits are consistent.
class mod11_checksum {
public:
    static constexpr std::size_t check_digits = 2;
    static constexpr std::size_t max_body_length = 16;

    mod11_checksum(std::size_t body_length, uint8_t max_weight, bool reject_uniform = false);
    mod11_checksum(const mod11_checksum &) = default;
    mod11_checksum &operator=(const mod11_checksum &) = default;
    mod11_checksum(mod11_checksum &&) = default;
    mod11_checksum &operator=(mod11_checksum &&) = default;
    ~mod11_checksum() = default;

    [[nodiscard]] std::size_t body_length() const noexcept { return body_length_; }
    [[nodiscard]] std::size_t length() const noexcept { return body_length_ + check_digits; }
    [[nodiscard]] uint8_t max_weight() const noexcept { return max_weight_; }
    [[nodiscard]] bool reject_uniform() const noexcept { return reject_uniform_; }

    // Weight table for the given amount of digits, in left to right order
    [[nodiscard]] std::vector<uint8_t> weights(std::size_t amount) const;

    // Check digit for an arbitrary digit sequence
    [[nodiscard]] uint8_t verifier_digit(std::span<const uint8_t> digits) const noexcept;

    // Both check digits for a body of exactly body_length() digits
    [[nodiscard]] std::array<uint8_t, check_digits> compute(
        std::span<const uint8_t> body) const noexcept;

    [[nodiscard]] bool validate(std::string_view str) const noexcept;

    static bool is_uniform(std::span<const uint8_t> digits) noexcept
    {
        for (auto d : digits) {
            if (d != digits.front()) {
                return false;
            }
        }
        return true;
    }

protected:
    [[nodiscard]] uint8_t weight_at(std::size_t distance) const noexcept
    {
        return static_cast<uint8_t>(2 + distance % (max_weight_ - 1U));
    }

    [[nodiscard]] unsigned weighted_sum(
        std::span<const uint8_t> digits, std::size_t distance_offset) const noexcept;

    static uint8_t reduce(unsigned sum) noexcept
    {
        auto remainder = sum % 11U;
        return remainder < 2 ? 0 : static_cast<uint8_t>(11U - remainder);
    }

    std::size_t body_length_;
    uint8_t max_weight_;
    bool reject_uniform_;
};

// CPF: 9 body digits, weights 10..2 and 11..2
const mod11_checksum &cpf_checksum();
// CNPJ: 12 body digits, weights cycling 2..9 from the right
const mod11_checksum &cnpj_checksum();

} // namespace validbr
