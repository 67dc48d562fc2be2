// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <string>
#include <string_view>

#include <rapidjson/document.h>
#include <rapidjson/rapidjson.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "checksum/imei_checksum.hpp"
#include "schema.hpp"

namespace imei {

namespace {

rapidjson::Value::StringRefType to_ref(std::string_view str)
{
    return {str.data(), static_cast<rapidjson::SizeType>(str.size())};
}

} // namespace

rapidjson::Document json_schema()
{
    rapidjson::Document doc;
    doc.SetObject();
    auto &alloc = doc.GetAllocator();

    rapidjson::Value examples{rapidjson::kArrayType};
    examples.PushBack(to_ref(imei_example), alloc);

    doc.AddMember("type", "string", alloc);
    doc.AddMember("description",
        "International Mobile Equipment Identity, 15 decimal digits protected by a Luhn "
        "check digit",
        alloc);
    doc.AddMember("pattern", to_ref(imei_pattern), alloc);
    doc.AddMember("minLength", static_cast<unsigned>(imei_checksum::imei_length), alloc);
    doc.AddMember("maxLength", static_cast<unsigned>(imei_checksum::imei_length), alloc);
    doc.AddMember("examples", examples, alloc);

    return doc;
}

std::string json_schema_string()
{
    auto doc = json_schema();

    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    doc.Accept(writer);

    return {buffer.GetString(), buffer.GetSize()};
}

} // namespace imei
