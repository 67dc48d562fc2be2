// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <string>
#include <string_view>

#include <rapidjson/document.h>
#include <rapidjson/rapidjson.h>

#include "imei.hpp"

namespace imei {

// An IMEI is always encoded as a plain JSON string holding its digits
template <typename Writer, typename String>
bool serialize(const basic_imei<String> &value, Writer &writer)
{
    auto str = value.value();
    return writer.String(str.data(), static_cast<rapidjson::SizeType>(str.size()));
}

template <typename String>
rapidjson::Value to_json_value(
    const basic_imei<String> &value, rapidjson::Document::AllocatorType &alloc)
{
    auto str = value.value();
    return rapidjson::Value{str.data(), static_cast<rapidjson::SizeType>(str.size()), alloc};
}

std::string to_json(const owned_imei &value);
std::string to_json(const imei_view &value);

// Decoding goes through owned_imei::try_new, an invalid string results in
// a validation_error. Throws invalid_type if the value isn't a string and
// parsing_error if the text isn't valid JSON.
owned_imei::result_type imei_from_json(const rapidjson::Value &value);
owned_imei::result_type imei_from_json(std::string_view json);

} // namespace imei
