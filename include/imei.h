// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#ifndef IMEI_H
#define IMEI_H

#ifdef __cplusplus
extern "C"
{
#endif

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

/**
 * @enum IMEI_RET_CODE
 *
 * Codes returned by imei_validate.
 **/
typedef enum
{
    IMEI_ERR_INVALID_ARGUMENT = -2,
    // The input is not a valid IMEI, regardless of the reason
    IMEI_ERR_INVALID          = -1,
    IMEI_OK                   = 0,
} IMEI_RET_CODE;

/**
 * @enum IMEI_ERR_REASON
 *
 * Detailed cause of a validation failure, as returned by
 * imei_validation_reason.
 **/
typedef enum
{
    IMEI_REASON_NONE              = 0,
    IMEI_REASON_INVALID_LENGTH    = 1,
    IMEI_REASON_INVALID_CHARACTER = 2,
    IMEI_REASON_INVALID_CHECKSUM  = 3,
} IMEI_ERR_REASON;

/**
 * @enum IMEI_LOG_LEVEL
 *
 * Internal logging levels, used when relaying messages through the callback.
 **/
typedef enum
{
    IMEI_LOG_TRACE,
    IMEI_LOG_DEBUG,
    IMEI_LOG_INFO,
    IMEI_LOG_WARN,
    IMEI_LOG_ERROR,
    IMEI_LOG_OFF,
} IMEI_LOG_LEVEL;

/**
 * @typedef imei_log_cb
 *
 * Callback that the library will call to relay messages to the binding.
 *
 * @param level The logging level.
 * @param function The native function that emitted the message. (nonnull)
 * @param file The file of the native function that emmitted the message. (nonnull)
 * @param line The line where the message was emmitted.
 * @param message The logging message, NUL-terminated. (nonnull)
 * @param message_len The length of the logging message (excluding NUL terminator).
 */
typedef void (*imei_log_cb)(
    IMEI_LOG_LEVEL level, const char* function, const char* file, unsigned line,
    const char* message, uint64_t message_len);

/**
 * imei_valid
 *
 * Checks whether the string is a valid IMEI: exactly 15 ASCII digits whose
 * Luhn checksum is a multiple of 10.
 *
 * @param str The string to check, not required to be NUL-terminated.
 * @param length The length of the string in bytes.
 *
 * @return True if the string is a valid IMEI, false otherwise, including
 *         when str is NULL.
 **/
bool imei_valid(const char *str, size_t length);

/**
 * imei_validate
 *
 * Same as imei_valid, but distinguishes invalid arguments.
 *
 * @param str The string to check, may only be NULL if length is 0.
 * @param length The length of the string in bytes.
 *
 * @return IMEI_OK if the string is a valid IMEI, IMEI_ERR_INVALID if it
 *         isn't and IMEI_ERR_INVALID_ARGUMENT if str is NULL with a
 *         non-zero length.
 **/
IMEI_RET_CODE imei_validate(const char *str, size_t length);

/**
 * imei_validation_reason
 *
 * Provides the reason for which a string isn't a valid IMEI.
 *
 * @param str The string to check, may only be NULL if length is 0.
 * @param length The length of the string in bytes.
 *
 * @return IMEI_REASON_NONE if the string is a valid IMEI, otherwise the
 *         first failed check.
 **/
IMEI_ERR_REASON imei_validation_reason(const char *str, size_t length);

/**
 * imei_compute_check_digit
 *
 * Computes the check digit of a 14-digit IMEI body.
 *
 * @param body The first 14 digits of an IMEI.
 * @param length The length of the body in bytes, must be 14.
 *
 * @return The check digit, in the range [0, 9], or -1 if the body isn't
 *         exactly 14 ASCII digits.
 **/
int imei_compute_check_digit(const char *body, size_t length);

/**
 * imei_get_version
 *
 * Return the version of the library
 *
 * @return version Version string, note that this should not be freed
 **/
const char *imei_get_version();

/**
 * imei_set_log_cb
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
bool imei_set_log_cb(imei_log_cb cb, IMEI_LOG_LEVEL min_level);

#ifdef __cplusplus
}
#endif /* __cplusplus */

#endif /*IMEI_H */
