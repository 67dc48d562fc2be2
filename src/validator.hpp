// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "validation_error.hpp"

namespace imei {

[[nodiscard]] bool valid(std::string_view str) noexcept;

// std::nullopt when str is a valid IMEI
[[nodiscard]] std::optional<validation_error> validate(std::string_view str) noexcept;

[[nodiscard]] std::optional<uint8_t> compute_check_digit(std::string_view body) noexcept;

} // namespace imei
