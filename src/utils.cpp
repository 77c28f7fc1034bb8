// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "utils.hpp"

namespace validbr {

digit_scan scan_digits(std::string_view str, std::span<uint8_t> output) noexcept
{
    digit_scan scan;
    for (std::size_t i = 0; i < str.size(); ++i) {
        const auto c = str[i];
        if (isdigit(c)) {
            if (scan.count < output.size()) {
                output[scan.count] = static_cast<uint8_t>(c - '0');
            }
            ++scan.count;
        } else if (!isseparator(c)) {
            scan.invalid = i;
            break;
        }
    }
    return scan;
}

std::string printable(char c)
{
    auto uc = static_cast<unsigned char>(c);
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
    if (uc >= 0x20 && uc < 0x7F) {
        return std::string{'\'', c, '\''};
    }

    static constexpr auto hex_chars = std::array<char, 17>{"0123456789abcdef"};
    return std::string{"\\x"} + hex_chars[(uc >> 4) & 0x0F] + hex_chars[uc & 0x0F];
}

} // namespace validbr
