// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace validbr {

// Individual taxpayer registry number, 9 identity digits followed by 2
// verifier digits. Instances are only created with consistent verifier digits.
class cpf {
public:
    static constexpr std::size_t digit_count = 9;
    static constexpr std::size_t verifier_count = 2;
    static constexpr std::size_t length = digit_count + verifier_count;
    // ###.###.###-##
    static constexpr std::size_t formatted_length = 14;

    using digits_type = std::array<uint8_t, digit_count>;
    using verifier_type = std::array<uint8_t, verifier_count>;

    cpf(const cpf &) = default;
    cpf(cpf &&) noexcept = default;
    cpf &operator=(const cpf &) = default;
    cpf &operator=(cpf &&) noexcept = default;
    ~cpf() = default;

    // Accepts the digits with or without separators (., -, / or whitespace).
    // Throws invalid_character, invalid_length or invalid_verifier_digit.
    static cpf parse(std::string_view str);

    // Builds a cpf from its digit groups, verifying the checksum.
    static cpf make(const digits_type &digits, const verifier_type &verifier_digits);

    // Builds a cpf computing the verifier digits from the identity digits.
    static cpf from_digits(const digits_type &digits);

    [[nodiscard]] static bool is_valid(std::string_view str) noexcept;
    // True only for the ###.###.###-## representation, regardless of checksum
    [[nodiscard]] static bool is_canonical(std::string_view str);

    [[nodiscard]] const digits_type &digits() const noexcept { return digits_; }
    [[nodiscard]] const verifier_type &verifier_digits() const noexcept
    {
        return verifier_digits_;
    }

    [[nodiscard]] std::string to_string() const;
    [[nodiscard]] std::string to_digit_string() const;

    bool operator==(const cpf &other) const noexcept = default;
    auto operator<=>(const cpf &other) const noexcept = default;

protected:
    cpf(const digits_type &digits, const verifier_type &verifier_digits) noexcept
        : digits_(digits), verifier_digits_(verifier_digits)
    {}

    digits_type digits_;
    verifier_type verifier_digits_;
};

cpf::verifier_type compute_cpf_verifier_digits(const cpf::digits_type &digits);

inline cpf parse_cpf(std::string_view str) { return cpf::parse(str); }

} // namespace validbr

template <> struct fmt::formatter<validbr::cpf> : fmt::formatter<std::string_view> {
    template <typename FormatContext> auto format(const validbr::cpf &v, FormatContext &ctx) const
    {
        return fmt::formatter<std::string_view>::format(v.to_string(), ctx);
    }
};

template <> struct std::hash<validbr::cpf> {
    std::size_t operator()(const validbr::cpf &v) const noexcept
    {
        std::size_t value = 0;
        for (auto d : v.digits()) { value = value * 10 + d; }
        for (auto d : v.verifier_digits()) { value = value * 10 + d; }
        return std::hash<std::size_t>{}(value);
    }
};
