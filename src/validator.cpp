// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstdint>
#include <optional>
#include <string_view>

#include "checksum/imei_checksum.hpp"
#include "validation_error.hpp"
#include "validator.hpp"

namespace imei {

bool valid(std::string_view str) noexcept
{
    return imei_checksum::check(str) == imei_check_result::valid;
}

std::optional<validation_error> validate(std::string_view str) noexcept
{
    switch (imei_checksum::check(str)) {
    case imei_check_result::valid:
        return std::nullopt;
    case imei_check_result::invalid_length:
        return validation_error{validation_error::reason::invalid_length};
    case imei_check_result::invalid_character:
        return validation_error{validation_error::reason::invalid_character};
    case imei_check_result::invalid_checksum:
        break;
    }
    return validation_error{validation_error::reason::invalid_checksum};
}

std::optional<uint8_t> compute_check_digit(std::string_view body) noexcept
{
    return imei_checksum::compute_check_digit(body);
}

} // namespace imei
