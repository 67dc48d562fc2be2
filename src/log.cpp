// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <string>

#include "log.hpp"

namespace imei {

// NOLINTBEGIN(cppcoreguidelines-avoid-non-const-global-variables)
logger::sink_type logger::sink_ = nullptr;
log_level logger::min_level_ = log_level::off;
// NOLINTEND(cppcoreguidelines-avoid-non-const-global-variables)

void logger::init(sink_type sink, log_level min_level)
{
    sink_ = sink;
    min_level_ = min_level;
}

void logger::log(log_level level, const char *function, const char *file, unsigned line,
    const std::string &message)
{
    if (sink_ == nullptr) {
        return;
    }
    sink_(static_cast<IMEI_LOG_LEVEL>(level), function, file, line, message.c_str(), message.size());
}

} // namespace imei
