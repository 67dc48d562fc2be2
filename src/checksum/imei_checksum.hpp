// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace imei {

enum class imei_check_result : uint8_t {
    valid,
    invalid_length,
    invalid_character,
    invalid_checksum
};

// Luhn checksum over exactly 15 ASCII digits, no separators allowed. Digits
// are weighted left to right, every second one (1-indexed) is doubled.
class imei_checksum {
public:
    static constexpr std::size_t imei_length = 15;
    static constexpr std::size_t body_length = imei_length - 1;

    // Stops at the first disqualifying character
    [[nodiscard]] static imei_check_result check(std::string_view str) noexcept;

    // Digit which, appended to a 14-digit body, yields a valid IMEI
    [[nodiscard]] static std::optional<uint8_t> compute_check_digit(std::string_view body) noexcept;
};

} // namespace imei
