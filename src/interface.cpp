// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <exception>
#include <iterator>
#include <string>
#include <string_view>

#include "document/cnpj.hpp"
#include "document/cpf.hpp"
#include "exception.hpp"
#include "log.hpp"
#include "validbr.h"
#include "version.hpp"

using namespace validbr;

// Log level compatibility
static_assert(static_cast<uint32_t>(log_level::trace) == VALIDBR_LOG_TRACE);
static_assert(static_cast<uint32_t>(log_level::debug) == VALIDBR_LOG_DEBUG);
static_assert(static_cast<uint32_t>(log_level::info) == VALIDBR_LOG_INFO);
static_assert(static_cast<uint32_t>(log_level::warn) == VALIDBR_LOG_WARN);
static_assert(static_cast<uint32_t>(log_level::error) == VALIDBR_LOG_ERROR);
static_assert(static_cast<uint32_t>(log_level::off) == VALIDBR_LOG_OFF);

// Layout compatibility
static_assert(sizeof(validbr_cpf::digits) == cpf::digit_count);
static_assert(sizeof(validbr_cpf::verifier_digits) == cpf::verifier_count);
static_assert(sizeof(validbr_cnpj::digits) == cnpj::digit_count);
static_assert(sizeof(validbr_cnpj::branch_digits) == cnpj::branch_count);
static_assert(sizeof(validbr_cnpj::verifier_digits) == cnpj::verifier_count);
static_assert(VALIDBR_CPF_FORMATTED_SIZE == cpf::formatted_length + 1);
static_assert(VALIDBR_CNPJ_FORMATTED_SIZE == cnpj::formatted_length + 1);

namespace {

validbr_log_cb binding_log_cb = nullptr;

void relay_log(log_level level, const char *function, const char *file, unsigned line,
    const char *message, uint64_t message_len)
{
    if (binding_log_cb != nullptr) {
        binding_log_cb(
            static_cast<VALIDBR_LOG_LEVEL>(level), function, file, line, message, message_len);
    }
}

VALIDBR_RET_CODE error_to_code(const document_error &e)
{
    switch (e.code()) {
    case error_code::invalid_character:
        return VALIDBR_ERR_INVALID_CHARACTER;
    case error_code::invalid_length:
        return VALIDBR_ERR_INVALID_LENGTH;
    case error_code::invalid_verifier_digit:
        return VALIDBR_ERR_INVALID_VERIFIER_DIGIT;
    case error_code::digits_out_of_bounds:
    case error_code::invalid_branch_number:
        return VALIDBR_ERR_INVALID_ARGUMENT;
    }
    return VALIDBR_ERR_INTERNAL;
}

template <std::size_t N> std::array<uint8_t, N> to_array(const uint8_t (&digits)[N])
{
    std::array<uint8_t, N> output{};
    std::copy(std::begin(digits), std::end(digits), output.begin());
    return output;
}

template <std::size_t N> void from_array(const std::array<uint8_t, N> &digits, uint8_t (&output)[N])
{
    std::copy(digits.begin(), digits.end(), std::begin(output));
}

VALIDBR_RET_CODE write_string(const std::string &str, char *buffer, size_t size)
{
    if (size <= str.size()) {
        VALIDBR_DEBUG("Output buffer too small, {} bytes needed, {} available", str.size() + 1,
            size);
        return VALIDBR_ERR_INVALID_ARGUMENT;
    }

    memcpy(buffer, str.data(), str.size());
    buffer[str.size()] = '\0';
    return VALIDBR_OK;
}

// Runs fn converting every exception into a return code, nothing is allowed to
// reach the C caller.
template <typename Fn> VALIDBR_RET_CODE guard(Fn &&fn)
{
    try {
        return fn();
    } catch (const document_error &e) {
        return error_to_code(e);
    } catch (const std::exception &e) {
        VALIDBR_ERROR("{}", e.what());
    } catch (...) {
        VALIDBR_ERROR("unknown exception");
    }
    return VALIDBR_ERR_INTERNAL;
}

} // namespace

extern "C" {

// NOLINTBEGIN(cppcoreguidelines-pro-bounds-array-to-pointer-decay)
VALIDBR_RET_CODE validbr_parse_cpf(const char *str, size_t length, validbr_cpf *output)
{
    if ((str == nullptr && length > 0) || output == nullptr) {
        VALIDBR_DEBUG("Tried to parse a cpf with a null pointer");
        return VALIDBR_ERR_INVALID_ARGUMENT;
    }

    return guard([&]() {
        auto value = cpf::parse({str, length});
        from_array(value.digits(), output->digits);
        from_array(value.verifier_digits(), output->verifier_digits);
        return VALIDBR_OK;
    });
}

VALIDBR_RET_CODE validbr_parse_cnpj(const char *str, size_t length, validbr_cnpj *output)
{
    if ((str == nullptr && length > 0) || output == nullptr) {
        VALIDBR_DEBUG("Tried to parse a cnpj with a null pointer");
        return VALIDBR_ERR_INVALID_ARGUMENT;
    }

    return guard([&]() {
        auto value = cnpj::parse({str, length});
        from_array(value.digits(), output->digits);
        from_array(value.branch_digits(), output->branch_digits);
        from_array(value.verifier_digits(), output->verifier_digits);
        return VALIDBR_OK;
    });
}

bool validbr_validate_cpf(const char *str, size_t length)
{
    if (str == nullptr) {
        return false;
    }
    return cpf::is_valid({str, length});
}

bool validbr_validate_cnpj(const char *str, size_t length)
{
    if (str == nullptr) {
        return false;
    }
    return cnpj::is_valid({str, length});
}

VALIDBR_RET_CODE validbr_format_cpf(const validbr_cpf *value, char *buffer, size_t size)
{
    if (value == nullptr || buffer == nullptr) {
        return VALIDBR_ERR_INVALID_ARGUMENT;
    }

    return guard([&]() {
        auto doc = cpf::make(to_array(value->digits), to_array(value->verifier_digits));
        return write_string(doc.to_string(), buffer, size);
    });
}

VALIDBR_RET_CODE validbr_format_cnpj(const validbr_cnpj *value, char *buffer, size_t size)
{
    if (value == nullptr || buffer == nullptr) {
        return VALIDBR_ERR_INVALID_ARGUMENT;
    }

    return guard([&]() {
        auto doc = cnpj::make(to_array(value->digits), to_array(value->branch_digits),
            to_array(value->verifier_digits));
        return write_string(doc.to_string(), buffer, size);
    });
}
// NOLINTEND(cppcoreguidelines-pro-bounds-array-to-pointer-decay)

const char *validbr_get_version() { return current_version; }

bool validbr_set_log_cb(validbr_log_cb cb, VALIDBR_LOG_LEVEL min_level)
{
    auto level = static_cast<log_level>(min_level);
    binding_log_cb = cb;
    validbr::logger::init(cb != nullptr ? relay_log : nullptr, level);
    VALIDBR_INFO("Sending log messages to binding, min level {}", log_level_to_str(level));
    return true;
}

} // extern "C"
