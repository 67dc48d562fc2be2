// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include <fmt/format.h>

#include "checksum/imei_checksum.hpp"
#include "exception.hpp"
#include "validation_error.hpp"
#include "validator.hpp"

namespace imei {

// A string known to hold a valid IMEI. Instances can only be obtained
// through try_new or the checked constructors, both of which validate the
// exact text being stored. No move operations are declared, moving an
// instance copies the text so that the source remains valid. Only
// into_inner() gives the text away.
template <typename String> class basic_imei {
public:
    using string_type = String;
    using result_type = std::variant<basic_imei, validation_error>;

    static constexpr std::size_t length = imei_checksum::imei_length;
    static constexpr std::size_t tac_length = 8;
    static constexpr std::size_t serial_number_length = 6;

    // Throws invalid_imei, str is left untouched on failure
    explicit basic_imei(String &&str) : value_(checked(std::move(str))) {}
    explicit basic_imei(const String &str) : value_(checked(String{str})) {}

    basic_imei(const basic_imei &) = default;
    basic_imei &operator=(const basic_imei &) = default;
    ~basic_imei() = default;

    // On failure the input is not moved from
    static result_type try_new(String &&str)
    {
        auto error = validate(std::string_view{str});
        if (error.has_value()) {
            return *error;
        }
        return basic_imei{std::move(str), validated_tag{}};
    }

    static result_type try_new(const String &str)
    {
        auto error = validate(std::string_view{str});
        if (error.has_value()) {
            return *error;
        }
        return basic_imei{String{str}, validated_tag{}};
    }

    [[nodiscard]] std::string_view value() const noexcept { return value_; }
    [[nodiscard]] const String &get() const & noexcept { return value_; }
    // Consumes the wrapper, the instance must not be used afterwards
    [[nodiscard]] String into_inner() && noexcept { return std::move(value_); }

    [[nodiscard]] std::string_view type_allocation_code() const noexcept
    {
        return value().substr(0, tac_length);
    }
    [[nodiscard]] std::string_view serial_number() const noexcept
    {
        return value().substr(tac_length, serial_number_length);
    }
    [[nodiscard]] uint8_t check_digit() const noexcept
    {
        return static_cast<uint8_t>(value()[length - 1] - '0');
    }

    bool operator==(const basic_imei &other) const noexcept { return value() == other.value(); }
    auto operator<=>(const basic_imei &other) const noexcept { return value() <=> other.value(); }

protected:
    struct validated_tag {};

    basic_imei(String &&str, validated_tag /*unused*/) : value_(std::move(str)) {}

    static String &&checked(String &&str)
    {
        auto error = validate(std::string_view{str});
        if (error.has_value()) {
            throw invalid_imei(*error);
        }
        return std::move(str);
    }

    String value_;
};

using owned_imei = basic_imei<std::string>;
using imei_view = basic_imei<std::string_view>;

extern template class basic_imei<std::string>;
extern template class basic_imei<std::string_view>;

template <typename String>
std::ostream &operator<<(std::ostream &os, const basic_imei<String> &value)
{
    return os << value.value();
}

} // namespace imei

template <typename String>
struct fmt::formatter<imei::basic_imei<String>> : fmt::formatter<std::string_view> {
    // Use the parse method from the base class formatter
    template <typename FormatContext>
    auto format(const imei::basic_imei<String> &v, FormatContext &ctx) const
    {
        return fmt::formatter<std::string_view>::format(v.value(), ctx);
    }
};

namespace std {
template <typename String> struct hash<imei::basic_imei<String>> {
    std::size_t operator()(const imei::basic_imei<String> &v) const noexcept
    {
        return std::hash<std::string_view>{}(v.value());
    }
};
} // namespace std
