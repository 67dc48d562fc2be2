// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include "checksum/imei_checksum.hpp"
#include "utils.hpp"

namespace imei {

namespace {

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
constexpr uint32_t weigh(std::size_t index, uint32_t digit)
{
    if ((index + 1) % 2 == 0) {
        digit *= 2;
        if (digit > 9) {
            digit -= 9;
        }
    }
    return digit;
}
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

} // namespace

imei_check_result imei_checksum::check(std::string_view str) noexcept
{
    if (str.size() != imei_length) {
        return imei_check_result::invalid_length;
    }

    uint32_t sum = 0;
    for (std::size_t i = 0; i < str.size(); ++i) {
        auto digit = to_digit(str[i]);
        if (!digit.has_value()) {
            return imei_check_result::invalid_character;
        }

        sum += weigh(i, *digit);
    }

    return sum % 10U == 0U ? imei_check_result::valid : imei_check_result::invalid_checksum;
}

std::optional<uint8_t> imei_checksum::compute_check_digit(std::string_view body) noexcept
{
    if (body.size() != body_length) {
        return std::nullopt;
    }

    uint32_t sum = 0;
    for (std::size_t i = 0; i < body.size(); ++i) {
        auto digit = to_digit(body[i]);
        if (!digit.has_value()) {
            return std::nullopt;
        }

        sum += weigh(i, *digit);
    }

    return static_cast<uint8_t>((10U - (sum % 10U)) % 10U);
}

} // namespace imei
