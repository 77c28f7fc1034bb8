// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

#include "checksum/mod11_checksum.hpp"
#include "exception.hpp"
#include "utils.hpp"

namespace validbr::detail {

template <std::size_t N> struct digit_buffer {
    std::array<uint8_t, N> digits{};
    // Number of digits found in the input, which may exceed N
    std::size_t count{0};
};

// Strips separators and converts the remaining characters to digits. An
// invalid character is reported regardless of how many digits precede it.
template <std::size_t N>
digit_buffer<N> extract_digits(document_type type, std::string_view str)
{
    digit_buffer<N> buffer;
    auto scan = scan_digits(str, buffer.digits);
    if (scan.invalid.has_value()) {
        throw invalid_character(type, str[*scan.invalid], *scan.invalid);
    }
    buffer.count = scan.count;
    return buffer;
}

template <std::size_t N>
std::array<uint8_t, N> normalize(document_type type, std::string_view str)
{
    auto buffer = extract_digits<N>(type, str);
    if (buffer.count != N) {
        throw invalid_length(type, N, buffer.count);
    }
    return buffer.digits;
}

template <std::size_t Offset, std::size_t Count, std::size_t N>
std::array<uint8_t, Count> slice(const std::array<uint8_t, N> &digits)
{
    static_assert(Offset + Count <= N);
    std::array<uint8_t, Count> output{};
    std::copy_n(digits.begin() + Offset, Count, output.begin());
    return output;
}

template <std::size_t N, std::size_t M>
std::array<uint8_t, N + M> concat(const std::array<uint8_t, N> &lhs, const std::array<uint8_t, M> &rhs)
{
    std::array<uint8_t, N + M> output{};
    std::copy(lhs.begin(), lhs.end(), output.begin());
    std::copy(rhs.begin(), rhs.end(), output.begin() + N);
    return output;
}

// Verifies the check digits found in the input against the computed ones and
// rejects single repeated digit sequences.
template <std::size_t N>
void check_verifier_digits(document_type type, const std::array<uint8_t, N> &body,
    const std::array<uint8_t, mod11_checksum::check_digits> &expected,
    const std::array<uint8_t, mod11_checksum::check_digits> &actual)
{
    std::vector<verifier_mismatch> mismatches;
    for (std::size_t i = 0; i < expected.size(); ++i) {
        if (expected[i] != actual[i]) {
            mismatches.push_back({i, expected[i], actual[i]});
        }
    }

    if (!mismatches.empty()) {
        throw invalid_verifier_digit(type, std::move(mismatches));
    }

    if (mod11_checksum::is_uniform(concat(body, actual))) {
        throw invalid_verifier_digit(type);
    }
}

} // namespace validbr::detail
