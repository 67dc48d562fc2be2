// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/error/error.h>
#include <rapidjson/rapidjson.h>
#include <rapidjson/writer.h>

#include <fmt/format.h>

#include "exception.hpp"
#include "imei.hpp"
#include "json_utils.hpp"
#include "log.hpp"

namespace imei {

namespace {

// Minimal rapidjson output stream writing into a std::string
class string_buffer {
public:
    using Ch = char;

    string_buffer() { buffer_.reserve(imei_checksum::imei_length + 2); }

    void Put(Ch c) { buffer_.push_back(c); }
    void Flush() {}

    std::string &get_string_ref() { return buffer_; }

protected:
    std::string buffer_;
};

template <typename String> std::string encode(const basic_imei<String> &value)
{
    string_buffer buffer;
    rapidjson::Writer<string_buffer> writer(buffer);
    serialize(value, writer);
    return std::move(buffer.get_string_ref());
}

std::string_view type_to_str(const rapidjson::Value &value)
{
    switch (value.GetType()) {
    case rapidjson::kNullType:
        return "null";
    case rapidjson::kFalseType:
    case rapidjson::kTrueType:
        return "bool";
    case rapidjson::kObjectType:
        return "object";
    case rapidjson::kArrayType:
        return "array";
    case rapidjson::kStringType:
        return "string";
    case rapidjson::kNumberType:
        break;
    }
    return "number";
}

} // namespace

std::string to_json(const owned_imei &value) { return encode(value); }

std::string to_json(const imei_view &value) { return encode(value); }

owned_imei::result_type imei_from_json(const rapidjson::Value &value)
{
    if (!value.IsString()) {
        throw invalid_type("string", std::string{type_to_str(value)});
    }

    std::string str{value.GetString(), value.GetStringLength()};
    auto result = owned_imei::try_new(std::move(str));
    if (std::holds_alternative<validation_error>(result)) {
        IMEI_DEBUG("Rejected JSON string: {}",
            reason_to_str(std::get<validation_error>(result).cause()));
    }
    return result;
}

owned_imei::result_type imei_from_json(std::string_view json)
{
    if (json.empty()) {
        throw parsing_error("empty JSON document");
    }

    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());
    if (doc.HasParseError()) {
        throw parsing_error(fmt::format("{} at offset {}",
            rapidjson::GetParseError_En(doc.GetParseError()), doc.GetErrorOffset()));
    }

    return imei_from_json(static_cast<const rapidjson::Value &>(doc));
}

} // namespace imei
