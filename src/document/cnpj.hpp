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

// Establishment code of a CNPJ, the headquarters being 0001
class cnpj_branch {
public:
    static constexpr std::size_t digit_count = 4;
    static constexpr uint16_t max_number = 9999;

    using digits_type = std::array<uint8_t, digit_count>;

    // Throws invalid_branch_number if any digit is outside 0..9
    explicit cnpj_branch(const digits_type &digits);

    static cnpj_branch first() noexcept { return cnpj_branch{}; }
    // Throws invalid_branch_number if number > 9999
    static cnpj_branch from_number(unsigned number);

    [[nodiscard]] const digits_type &digits() const noexcept { return digits_; }
    [[nodiscard]] uint16_t number() const noexcept;
    [[nodiscard]] std::string to_string() const;

    bool operator==(const cnpj_branch &other) const noexcept = default;

protected:
    cnpj_branch() noexcept = default;

    digits_type digits_{0, 0, 0, 1};
};

// Legal entity registry number: 8 identity digits, 4 branch digits and 2
// verifier digits. Instances are only created with consistent verifier digits.
class cnpj {
public:
    static constexpr std::size_t digit_count = 8;
    static constexpr std::size_t branch_count = cnpj_branch::digit_count;
    static constexpr std::size_t verifier_count = 2;
    static constexpr std::size_t length = digit_count + branch_count + verifier_count;
    // ##.###.###/####-##
    static constexpr std::size_t formatted_length = 18;

    using digits_type = std::array<uint8_t, digit_count>;
    using branch_type = cnpj_branch::digits_type;
    using verifier_type = std::array<uint8_t, verifier_count>;

    cnpj(const cnpj &) = default;
    cnpj(cnpj &&) noexcept = default;
    cnpj &operator=(const cnpj &) = default;
    cnpj &operator=(cnpj &&) noexcept = default;
    ~cnpj() = default;

    // Accepts the digits with or without separators (., -, / or whitespace).
    // Throws invalid_character, invalid_length or invalid_verifier_digit.
    static cnpj parse(std::string_view str);

    static cnpj make(const digits_type &digits, const branch_type &branch_digits,
        const verifier_type &verifier_digits);

    static cnpj from_digits(const digits_type &digits, const branch_type &branch_digits);
    static cnpj from_digits(const digits_type &digits, const cnpj_branch &branch)
    {
        return from_digits(digits, branch.digits());
    }

    [[nodiscard]] static bool is_valid(std::string_view str) noexcept;
    // True only for the ##.###.###/####-## representation, regardless of checksum
    [[nodiscard]] static bool is_canonical(std::string_view str);

    [[nodiscard]] const digits_type &digits() const noexcept { return digits_; }
    [[nodiscard]] const branch_type &branch_digits() const noexcept { return branch_digits_; }
    [[nodiscard]] const verifier_type &verifier_digits() const noexcept
    {
        return verifier_digits_;
    }
    [[nodiscard]] cnpj_branch branch() const { return cnpj_branch{branch_digits_}; }

    [[nodiscard]] std::string to_string() const;
    [[nodiscard]] std::string to_digit_string() const;

    bool operator==(const cnpj &other) const noexcept = default;
    auto operator<=>(const cnpj &other) const noexcept = default;

protected:
    cnpj(const digits_type &digits, const branch_type &branch_digits,
        const verifier_type &verifier_digits) noexcept
        : digits_(digits), branch_digits_(branch_digits), verifier_digits_(verifier_digits)
    {}

    digits_type digits_;
    branch_type branch_digits_;
    verifier_type verifier_digits_;
};

cnpj::verifier_type compute_cnpj_verifier_digits(
    const cnpj::digits_type &digits, const cnpj::branch_type &branch_digits);

inline cnpj parse_cnpj(std::string_view str) { return cnpj::parse(str); }

} // namespace validbr

template <> struct fmt::formatter<validbr::cnpj> : fmt::formatter<std::string_view> {
    template <typename FormatContext> auto format(const validbr::cnpj &v, FormatContext &ctx) const
    {
        return fmt::formatter<std::string_view>::format(v.to_string(), ctx);
    }
};

template <> struct std::hash<validbr::cnpj> {
    std::size_t operator()(const validbr::cnpj &v) const noexcept
    {
        uint64_t value = 0;
        for (auto d : v.digits()) { value = value * 10 + d; }
        for (auto d : v.branch_digits()) { value = value * 10 + d; }
        for (auto d : v.verifier_digits()) { value = value * 10 + d; }
        return std::hash<uint64_t>{}(value);
    }
};
