// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
// Convert numbers to strings
#define STR_HELPER(x) #x
#define STR(x) STR_HELPER(x)
// (string, length), only for literals
#define STRL(value) value, sizeof(value) - 1
// NOLINTEND(cppcoreguidelines-macro-usage)

namespace validbr {

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
inline bool isdigit(char c) { return static_cast<unsigned>(c) - '0' < 10; }
inline bool isspace(char c)
{
    return c == ' ' || c == '\f' || c == '\n' || c == '\r' || c == '\t' || c == '\v';
}
inline bool isseparator(char c) { return c == '.' || c == '-' || c == '/' || isspace(c); }
inline char todigit(uint8_t value) { return static_cast<char>('0' + value); }
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

template <std::size_t N> bool digits_in_range(const std::array<uint8_t, N> &digits)
{
    for (auto d : digits) {
        if (d > 9) {
            return false;
        }
    }
    return true;
}

template <std::size_t N> void append_digits(std::string &output, const std::array<uint8_t, N> &digits)
{
    for (auto d : digits) {
        output.push_back(todigit(d));
    }
}

struct digit_scan {
    // Digits found in the input, which may exceed the output size
    std::size_t count{0};
    // Position of the first character that is neither a digit nor a separator
    std::optional<std::size_t> invalid{std::nullopt};
};

// Strips separators and stores up to output.size() digits. Scanning stops at
// the first invalid character.
digit_scan scan_digits(std::string_view str, std::span<uint8_t> output) noexcept;

// Renders a byte for diagnostics, escaping anything that isn't printable ASCII
std::string printable(char c);

} // namespace validbr
