// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#ifndef CCV_H
#define CCV_H

#ifdef __cplusplus
#include <cstddef>

namespace ccv{
class engine;
} // namespace ccv

using ccv_handle = ccv::engine *;

extern "C"
{
#endif

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

/** Longest card number, in digits, accepted or produced by the library. */
#define CCV_MAX_CARD_LENGTH 19

/**
 * @enum CCV_RET_CODE
 *
 * Codes returned by ccv_validate, ccv_generate and ccv_generate_with_entropy.
 **/
typedef enum
{
    CCV_ERR_INTERNAL           = -4,
    CCV_ERR_ENTROPY_EXHAUSTED  = -3,
    CCV_ERR_UNKNOWN_INDUSTRY   = -2,
    CCV_ERR_INVALID_ARGUMENT   = -1,
    CCV_OK                     = 0,
} CCV_RET_CODE;

/**
 * @enum CCV_LOG_LEVEL
 *
 * Internal log levels, to be used when setting the minimum log level and cb.
 **/
typedef enum
{
    CCV_LOG_TRACE,
    CCV_LOG_DEBUG,
    CCV_LOG_INFO,
    CCV_LOG_WARN,
    CCV_LOG_ERROR,
    CCV_LOG_OFF,
} CCV_LOG_LEVEL;

#ifndef __cplusplus
typedef struct _ccv_handle* ccv_handle;
#endif

typedef struct _ccv_config ccv_config;
typedef struct _ccv_result ccv_result;

/**
 * @struct ccv_config
 *
 * Configuration to be provided to the engine, zero-valued fields take their
 * default value.
 **/
struct _ccv_config
{
    struct _ccv_config_limits {
        /** Minimum number of digits of a card number to validate (default 7) */
        uint16_t min_length;
        /** Maximum number of digits of a card number (default 18) */
        uint16_t max_length;
    } limits;
    /** Bytes of random material drawn for each generated number (default 40) */
    uint16_t entropy_size;
};

/**
 * @struct ccv_result
 *
 * Outcome of a validation or generation. The structure owns no memory, the
 * string pointers reference static storage.
 **/
struct _ccv_result
{
    /** Whether the card number satisfies the Luhn check. */
    bool valid;
    /** Major industry label of the leading digit. (nonnull) */
    const char *major_industry;
    /** Issuer name, NULL when no issuer range matches. (nullable) */
    const char *issuer;
    /** NUL-terminated card number, digits only. */
    char card_number[CCV_MAX_CARD_LENGTH + 1];
    /** NUL-terminated account identifier digits, possibly empty. */
    char personal_digits[CCV_MAX_CARD_LENGTH + 1];
    /** Check digit computed over the card number. */
    char check_digit;
};

/**
 * @typedef ccv_log_cb
 *
 * Callback that the library will call to relay messages to the binding.
 *
 * @param level The logging level.
 * @param function The native function that emitted the message. (nonnull)
 * @param file The file of the native function that emmitted the message. (nonnull)
 * @param line The line where the message was emmitted.
 * @param message The size of the logging message. NUL-terminated
 * @param message_len The length of the logging message (excluding NUL terminator).
 */
typedef void (*ccv_log_cb)(
    CCV_LOG_LEVEL level, const char* function, const char* file, unsigned line,
    const char* message, uint64_t message_len);

/**
 * ccv_init
 *
 * Initialize a card engine instance.
 *
 * @param config Optional configuration of the engine. (nullable)
 *
 * @return Handle to the engine or NULL on invalid configuration.
 **/
ccv_handle ccv_init(const ccv_config *config);

/**
 * ccv_destroy
 *
 * Destroy an engine instance.
 *
 * @param handle Handle to the engine instance.
 */
void ccv_destroy(ccv_handle handle);

/**
 * ccv_validate
 *
 * Validate a card number against the Luhn check and classify its issuer and
 * major industry. Digit groups separated by single spaces or dashes are
 * accepted.
 *
 * @param handle Engine instance. (nonnull)
 * @param card_number Card number to validate, not necessarily NUL-terminated. (nonnull)
 * @param length Length of the card number.
 * @param result Structure to fill with the outcome. (nonnull)
 *
 * @return CCV_OK on success, a negative CCV_RET_CODE otherwise.
 *
 * @error CCV_ERR_INVALID_ARGUMENT The input is malformed or its length is
 *        outside of the configured limits.
 * @error CCV_ERR_UNKNOWN_INDUSTRY The leading digit has no major industry.
 * @error CCV_ERR_INTERNAL There was an unexpected error.
 **/
CCV_RET_CODE ccv_validate(ccv_handle handle, const char *card_number, size_t length,
    ccv_result *result);

/**
 * ccv_generate
 *
 * Generate a Luhn-valid card number starting with the given major identifier,
 * using the system random device. The length of the number is 14 for Diners
 * Club, 15 for American Express and 16 otherwise.
 *
 * @param handle Engine instance. (nonnull)
 * @param major_identifier Leading digits of the card number. (nonnull)
 * @param length Length of the major identifier.
 * @param result Structure to fill with the outcome. (nonnull)
 *
 * @return CCV_OK on success, a negative CCV_RET_CODE otherwise.
 *
 * @error CCV_ERR_INVALID_ARGUMENT The identifier is empty, contains non-digit
 *        characters or is too long for the resolved card length.
 * @error CCV_ERR_UNKNOWN_INDUSTRY The leading digit has no major industry.
 * @error CCV_ERR_ENTROPY_EXHAUSTED The random material ran out.
 * @error CCV_ERR_INTERNAL There was an unexpected error.
 **/
CCV_RET_CODE ccv_generate(ccv_handle handle, const char *major_identifier, size_t length,
    ccv_result *result);

/**
 * ccv_generate_with_entropy
 *
 * Same as ccv_generate, but random digits are consumed from the back of the
 * provided digit buffer rather than drawn from the system.
 *
 * @param entropy Decimal digits to consume. (nonnull)
 * @param entropy_length Number of digits available.
 **/
CCV_RET_CODE ccv_generate_with_entropy(ccv_handle handle, const char *major_identifier,
    size_t length, const char *entropy, size_t entropy_length, ccv_result *result);

/**
 * ccv_result_serialize
 *
 * Render a result as a JSON document.
 *
 * @param result The result to serialize. (nonnull)
 * @param buffer Output buffer. (nullable if size is 0)
 * @param size Size of the output buffer.
 *
 * @return The length of the whole document, excluding the NUL terminator. At
 *         most size - 1 bytes are written followed by a NUL terminator.
 **/
size_t ccv_result_serialize(const ccv_result *result, char *buffer, size_t size);

/**
 * ccv_get_version
 *
 * Return the version of the library
 *
 * @return version Version string, NUL-terminated
 **/
const char *ccv_get_version();

/**
 * ccv_set_log_cb
 *
 * Sets the callback to relay logging messages to the binding
 *
 * @param cb The callback to call, or NULL to stop relaying messages
 * @param min_level The minimum logging level for which to relay messages
 *
 * @return whether the operation succeeded or not
 **/
bool ccv_set_log_cb(ccv_log_cb cb, CCV_LOG_LEVEL min_level);

#ifdef __cplusplus
}
#endif /* __cplusplus */

#endif /* CCV_H */
