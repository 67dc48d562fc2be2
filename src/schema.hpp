// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <string>
#include <string_view>

#include <rapidjson/document.h>

namespace imei {

constexpr std::string_view imei_pattern = "^[0-9]{15}$";
constexpr std::string_view imei_example = "522872587498800";

// JSON Schema (draft 4) describing the serialized form of basic_imei
rapidjson::Document json_schema();
std::string json_schema_string();

} // namespace imei
