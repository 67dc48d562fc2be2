// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include "imei.h"
#include "log.hpp"
#include "validation_error.hpp"
#include "validator.hpp"
#include "version.hpp"

using namespace imei;

// Log level compatibility
static_assert(static_cast<uint32_t>(log_level::trace) == IMEI_LOG_TRACE);
static_assert(static_cast<uint32_t>(log_level::debug) == IMEI_LOG_DEBUG);
static_assert(static_cast<uint32_t>(log_level::info) == IMEI_LOG_INFO);
static_assert(static_cast<uint32_t>(log_level::warn) == IMEI_LOG_WARN);
static_assert(static_cast<uint32_t>(log_level::error) == IMEI_LOG_ERROR);
static_assert(static_cast<uint32_t>(log_level::off) == IMEI_LOG_OFF);

namespace {

std::optional<std::string_view> to_string_view(const char *str, size_t length)
{
    if (str == nullptr) {
        if (length > 0) {
            return std::nullopt;
        }
        return std::string_view{};
    }
    return std::string_view{str, length};
}

IMEI_ERR_REASON reason_to_code(validation_error::reason cause)
{
    switch (cause) {
    case validation_error::reason::invalid_length:
        return IMEI_REASON_INVALID_LENGTH;
    case validation_error::reason::invalid_character:
        return IMEI_REASON_INVALID_CHARACTER;
    case validation_error::reason::invalid_checksum:
        break;
    }
    return IMEI_REASON_INVALID_CHECKSUM;
}

} // namespace

extern "C" {

bool imei_valid(const char *str, size_t length)
{
    auto input = to_string_view(str, length);
    if (!input.has_value()) {
        IMEI_WARN("Tried to validate a null string of length {}", length);
        return false;
    }
    return valid(*input);
}

IMEI_RET_CODE imei_validate(const char *str, size_t length)
{
    auto input = to_string_view(str, length);
    if (!input.has_value()) {
        IMEI_WARN("Tried to validate a null string of length {}", length);
        return IMEI_ERR_INVALID_ARGUMENT;
    }
    return validate(*input).has_value() ? IMEI_ERR_INVALID : IMEI_OK;
}

IMEI_ERR_REASON imei_validation_reason(const char *str, size_t length)
{
    auto input = to_string_view(str, length);
    if (!input.has_value()) {
        IMEI_WARN("Tried to validate a null string of length {}", length);
        return IMEI_REASON_INVALID_LENGTH;
    }

    auto error = validate(*input);
    if (!error.has_value()) {
        return IMEI_REASON_NONE;
    }
    return reason_to_code(error->cause());
}

int imei_compute_check_digit(const char *body, size_t length)
{
    auto input = to_string_view(body, length);
    if (!input.has_value()) {
        IMEI_WARN("Tried to compute the check digit of a null string of length {}", length);
        return -1;
    }

    auto digit = compute_check_digit(*input);
    if (!digit.has_value()) {
        IMEI_DEBUG("Invalid IMEI body of length {}", length);
        return -1;
    }
    return static_cast<int>(*digit);
}

const char *imei_get_version() { return current_version.data(); }

bool imei_set_log_cb(imei_log_cb cb, IMEI_LOG_LEVEL min_level)
{
    auto level = static_cast<log_level>(min_level);
    imei::logger::init(cb, level);
    IMEI_INFO("Sending log messages to binding, min level {}", log_level_to_str(level));
    return true;
}
}
