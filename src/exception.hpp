// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace validbr {

enum class document_type : uint8_t { cpf, cnpj };

inline std::string_view document_type_to_str(document_type type)
{
    switch (type) {
    case document_type::cpf:
        return "cpf";
    case document_type::cnpj:
        return "cnpj";
    }
    return "unknown";
}

enum class error_code : uint8_t {
    invalid_character,
    invalid_length,
    invalid_verifier_digit,
    digits_out_of_bounds,
    invalid_branch_number,
};

inline std::string_view error_code_to_str(error_code code)
{
    switch (code) {
    case error_code::invalid_character:
        return "invalid_character";
    case error_code::invalid_length:
        return "invalid_length";
    case error_code::invalid_verifier_digit:
        return "invalid_verifier_digit";
    case error_code::digits_out_of_bounds:
        return "digits_out_of_bounds";
    case error_code::invalid_branch_number:
        return "invalid_branch_number";
    }
    return "unknown";
}

class document_error : public std::invalid_argument {
public:
    document_error(document_type type, error_code code, const std::string &what)
        : std::invalid_argument(what), type_(type), code_(code)
    {}

    [[nodiscard]] document_type type() const noexcept { return type_; }
    [[nodiscard]] error_code code() const noexcept { return code_; }

protected:
    document_type type_;
    error_code code_;
};

class invalid_character : public document_error {
public:
    invalid_character(document_type type, char character, std::size_t position);

    [[nodiscard]] char character() const noexcept { return character_; }
    [[nodiscard]] std::size_t position() const noexcept { return position_; }

protected:
    char character_;
    std::size_t position_;
};

class invalid_length : public document_error {
public:
    invalid_length(document_type type, std::size_t expected, std::size_t actual);

    [[nodiscard]] std::size_t expected() const noexcept { return expected_; }
    [[nodiscard]] std::size_t actual() const noexcept { return actual_; }

protected:
    std::size_t expected_;
    std::size_t actual_;
};

struct verifier_mismatch {
    // Index of the verifier digit, 0 for the first and 1 for the second
    std::size_t position;
    uint8_t expected;
    uint8_t actual;

    bool operator==(const verifier_mismatch &other) const = default;
};

class invalid_verifier_digit : public document_error {
public:
    invalid_verifier_digit(document_type type, std::vector<verifier_mismatch> mismatches);
    // A sequence of one repeated digit, never issued even where the checksum holds
    explicit invalid_verifier_digit(document_type type);

    [[nodiscard]] const std::vector<verifier_mismatch> &mismatches() const noexcept
    {
        return mismatches_;
    }
    [[nodiscard]] bool repeated_digits() const noexcept { return repeated_digits_; }

protected:
    std::vector<verifier_mismatch> mismatches_;
    bool repeated_digits_{false};
};

class digits_out_of_bounds : public document_error {
public:
    explicit digits_out_of_bounds(document_type type)
        : document_error(type, error_code::digits_out_of_bounds,
              std::string{document_type_to_str(type)} + ": digits must be in the range 0..9")
    {}
};

class invalid_branch_number : public document_error {
public:
    explicit invalid_branch_number(const std::string &what)
        : document_error(document_type::cnpj, error_code::invalid_branch_number, what)
    {}
};

class serialization_error : public std::runtime_error {
public:
    explicit serialization_error(const std::string &what) : std::runtime_error(what) {}
};

} // namespace validbr
