// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <stdexcept>
#include <string>

#include "validation_error.hpp"

namespace imei {

// Thrown by the checked constructor of basic_imei
class invalid_imei : public std::invalid_argument {
public:
    explicit invalid_imei(validation_error error)
        : std::invalid_argument(std::string{error.message()}), error_(error)
    {}

    [[nodiscard]] validation_error error() const noexcept { return error_; }

protected:
    validation_error error_;
};

class parsing_error : public std::runtime_error {
public:
    explicit parsing_error(const std::string &what) : std::runtime_error(what) {}
};

class invalid_type : public std::runtime_error {
public:
    explicit invalid_type(const std::string &expected, const std::string &obtained)
        : std::runtime_error("invalid type '" + obtained + "', expected '" + expected + "'")
    {}
};

} // namespace imei
