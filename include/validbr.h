// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#ifndef VALIDBR_H
#define VALIDBR_H

#ifdef __cplusplus
extern "C"
{
#endif

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#define VALIDBR_CPF_DIGITS 9
#define VALIDBR_CNPJ_DIGITS 8
#define VALIDBR_CNPJ_BRANCH_DIGITS 4
#define VALIDBR_VERIFIER_DIGITS 2

// Buffer sizes required by the format functions, including the NUL terminator
#define VALIDBR_CPF_FORMATTED_SIZE 15
#define VALIDBR_CNPJ_FORMATTED_SIZE 19

/**
 * @enum VALIDBR_RET_CODE
 *
 * Codes returned by every function of the interface which can fail.
 **/
typedef enum
{
    VALIDBR_ERR_INTERNAL               = -5,
    VALIDBR_ERR_INVALID_VERIFIER_DIGIT = -4,
    VALIDBR_ERR_INVALID_LENGTH         = -3,
    VALIDBR_ERR_INVALID_CHARACTER      = -2,
    VALIDBR_ERR_INVALID_ARGUMENT       = -1,
    VALIDBR_OK                         = 0,
} VALIDBR_RET_CODE;

/**
 * @enum VALIDBR_LOG_LEVEL
 *
 * Internal log levels, to be used when setting the minimum log level and cb.
 **/
typedef enum
{
    VALIDBR_LOG_TRACE,
    VALIDBR_LOG_DEBUG,
    VALIDBR_LOG_INFO,
    VALIDBR_LOG_WARN,
    VALIDBR_LOG_ERROR,
    VALIDBR_LOG_OFF,
} VALIDBR_LOG_LEVEL;

/**
 * @struct validbr_cpf
 *
 * Digit groups of a CPF, each element in the range 0..9.
 **/
typedef struct
{
    uint8_t digits[VALIDBR_CPF_DIGITS];
    uint8_t verifier_digits[VALIDBR_VERIFIER_DIGITS];
} validbr_cpf;

/**
 * @struct validbr_cnpj
 *
 * Digit groups of a CNPJ, each element in the range 0..9.
 **/
typedef struct
{
    uint8_t digits[VALIDBR_CNPJ_DIGITS];
    uint8_t branch_digits[VALIDBR_CNPJ_BRANCH_DIGITS];
    uint8_t verifier_digits[VALIDBR_VERIFIER_DIGITS];
} validbr_cnpj;

/**
 * @typedef validbr_log_cb
 *
 * Callback used to relay messages to the binding.
 *
 * @param level The logging level.
 * @param function The native function that emitted the message. (nonnull)
 * @param file The file of the native function that emmitted the message. (nonnull)
 * @param line The line where the message was emmitted.
 * @param message The logging message. NUL-terminated
 * @param message_len The length of the logging message (excluding NUL terminator).
 */
typedef void (*validbr_log_cb)(
    VALIDBR_LOG_LEVEL level, const char* function, const char* file, unsigned line,
    const char* message, uint64_t message_len);

/**
 * validbr_parse_cpf
 *
 * Parses and validates a CPF, with or without separators.
 *
 * @param str The text to parse. (nonnull unless length is 0)
 * @param length The length of str in bytes.
 * @param output Receives the digit groups on success. (nonnull)
 *
 * @return VALIDBR_OK on success or the error code describing the first failure.
 **/
VALIDBR_RET_CODE validbr_parse_cpf(const char *str, size_t length, validbr_cpf *output);

/**
 * validbr_parse_cnpj
 *
 * Parses and validates a CNPJ, with or without separators.
 *
 * @param str The text to parse. (nonnull unless length is 0)
 * @param length The length of str in bytes.
 * @param output Receives the digit groups on success. (nonnull)
 *
 * @return VALIDBR_OK on success or the error code describing the first failure.
 **/
VALIDBR_RET_CODE validbr_parse_cnpj(const char *str, size_t length, validbr_cnpj *output);

/**
 * validbr_validate_cpf
 *
 * @return Whether the text is a CPF with consistent verifier digits.
 **/
bool validbr_validate_cpf(const char *str, size_t length);

/**
 * validbr_validate_cnpj
 *
 * @return Whether the text is a CNPJ with consistent verifier digits.
 **/
bool validbr_validate_cnpj(const char *str, size_t length);

/**
 * validbr_format_cpf
 *
 * Writes the canonical ###.###.###-## representation of a CPF. The digit
 * groups are verified before formatting.
 *
 * @param value The CPF to format. (nonnull)
 * @param buffer Output buffer, NUL-terminated on success. (nonnull)
 * @param size Size of buffer, at least VALIDBR_CPF_FORMATTED_SIZE.
 *
 * @return VALIDBR_OK on success or the error code describing the failure.
 **/
VALIDBR_RET_CODE validbr_format_cpf(const validbr_cpf *value, char *buffer, size_t size);

/**
 * validbr_format_cnpj
 *
 * Writes the canonical ##.###.###/####-## representation of a CNPJ. The digit
 * groups are verified before formatting.
 *
 * @param value The CNPJ to format. (nonnull)
 * @param buffer Output buffer, NUL-terminated on success. (nonnull)
 * @param size Size of buffer, at least VALIDBR_CNPJ_FORMATTED_SIZE.
 *
 * @return VALIDBR_OK on success or the error code describing the failure.
 **/
VALIDBR_RET_CODE validbr_format_cnpj(const validbr_cnpj *value, char *buffer, size_t size);

/**
 * validbr_get_version
 *
 * Return the version of the library
 *
 * @return version Version string, note that this should not be freed
 **/
const char *validbr_get_version();

/**
 * validbr_set_log_cb
 *
 * Sets the callback to relay logging messages to the binding
 *
 * @param cb The callback to call, or NULL to stop relaying messages
 * @param min_level The minimum logging level for which to relay messages
 *
 * @return whether the operation succeeded or not
 *
 * @note This function is not thread-safe
 **/
bool validbr_set_log_cb(validbr_log_cb cb, VALIDBR_LOG_LEVEL min_level);

#ifdef __cplusplus
}
#endif /* __cplusplus */

#endif /*VALIDBR_H */
