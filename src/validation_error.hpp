// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstdint>
#include <ostream>
#include <string_view>

namespace imei {

// Raised for any input which isn't a valid IMEI. The reason is informative
// only, all instances denote the same failure and compare equal.
class validation_error {
public:
    enum class reason : uint8_t { invalid_length, invalid_character, invalid_checksum };

    constexpr validation_error() noexcept = default;
    constexpr explicit validation_error(reason cause) noexcept : cause_(cause) {}

    [[nodiscard]] constexpr reason cause() const noexcept { return cause_; }
    [[nodiscard]] static constexpr std::string_view message() noexcept { return "invalid IMEI"; }

    constexpr bool operator==(const validation_error & /*other*/) const noexcept { return true; }

protected:
    reason cause_{reason::invalid_checksum};
};

inline std::string_view reason_to_str(validation_error::reason cause)
{
    switch (cause) {
    case validation_error::reason::invalid_length:
        return "invalid length";
    case validation_error::reason::invalid_character:
        return "invalid character";
    case validation_error::reason::invalid_checksum:
        break;
    }

    return "invalid checksum";
}

inline std::ostream &operator<<(std::ostream &os, const validation_error &error)
{
    return os << error.message() << " (" << reason_to_str(error.cause()) << ")";
}

} // namespace imei
