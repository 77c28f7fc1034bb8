// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstddef>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "exception.hpp"
#include "utils.hpp"

namespace validbr {

namespace {

std::string mismatch_message(document_type type, const std::vector<verifier_mismatch> &mismatches)
{
    std::string message =
        fmt::format("{}: invalid verifier digit", document_type_to_str(type));
    for (const auto &mismatch : mismatches) {
        fmt::format_to(std::back_inserter(message), ", position {} expected {} got {}",
            mismatch.position, mismatch.expected, mismatch.actual);
    }
    return message;
}

} // namespace

invalid_character::invalid_character(document_type type, char character, std::size_t position)
    : document_error(type, error_code::invalid_character,
          fmt::format("{}: invalid character {} at position {}", document_type_to_str(type),
              printable(character), position)),
      character_(character), position_(position)
{}

invalid_length::invalid_length(document_type type, std::size_t expected, std::size_t actual)
    : document_error(type, error_code::invalid_length,
          fmt::format("{}: invalid length: expected {} digits, got {}",
              document_type_to_str(type), expected, actual)),
      expected_(expected), actual_(actual)
{}

invalid_verifier_digit::invalid_verifier_digit(
    document_type type, std::vector<verifier_mismatch> mismatches)
    : document_error(
          type, error_code::invalid_verifier_digit, mismatch_message(type, mismatches)),
      mismatches_(std::move(mismatches))
{}

invalid_verifier_digit::invalid_verifier_digit(document_type type)
    : document_error(type, error_code::invalid_verifier_digit,
          fmt::format("{}: invalid verifier digit, repeated digit sequence",
              document_type_to_str(type))),
      repeated_digits_(true)
{}

} // namespace validbr
