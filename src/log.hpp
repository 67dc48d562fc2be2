// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstdint>
#include <exception>
#include <string>
#include <string_view>

#include <fmt/core.h> // IWYU pragma: keep

#include "imei.h"

namespace imei {

// Same values as IMEI_LOG_LEVEL
// NOLINTNEXTLINE(performance-enum-size)
enum class log_level : uint32_t { trace, debug, info, warn, error, off };

inline std::string_view log_level_to_str(log_level level)
{
    switch (level) {
    case log_level::trace:
        return "trace";
    case log_level::debug:
        return "debug";
    case log_level::info:
        return "info";
    case log_level::warn:
        return "warn";
    case log_level::error:
        return "error";
    case log_level::off:
        break;
    }
    return "off";
}

// Strips the directory, the result stays NUL-terminated
constexpr std::string_view source_file_name(std::string_view path)
{
    auto pos = path.find_last_of("/\\");
    return pos == std::string_view::npos ? path : path.substr(pos + 1);
}

// Process-wide sink, set through imei_set_log_cb
class logger {
public:
    using sink_type = imei_log_cb;

    static void init(sink_type sink, log_level min_level);

    static sink_type sink() noexcept { return sink_; }
    static log_level level() noexcept { return min_level_; }
    static bool enabled(log_level level) noexcept
    {
        return sink_ != nullptr && level >= min_level_;
    }

    static void log(log_level level, const char *function, const char *file, unsigned line,
        const std::string &message);

private:
    static sink_type sink_;
    static log_level min_level_;
};

} // namespace imei

// Nothing is formatted unless a sink accepts the level. Formatting failures
// drop the message.
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define IMEI_LOG(level, ...)                                                                       \
    do {                                                                                           \
        if (imei::logger::enabled(level)) {                                                        \
            try {                                                                                  \
                constexpr auto imei_log_file = imei::source_file_name(__FILE__);                   \
                imei::logger::log(                                                                 \
                    level, __func__, imei_log_file.data(), __LINE__, fmt::format(__VA_ARGS__));    \
            } catch (const std::exception &) {}                                                    \
        }                                                                                          \
    } while (false)

#define IMEI_TRACE(...) IMEI_LOG(imei::log_level::trace, __VA_ARGS__)
#define IMEI_DEBUG(...) IMEI_LOG(imei::log_level::debug, __VA_ARGS__)
#define IMEI_INFO(...) IMEI_LOG(imei::log_level::info, __VA_ARGS__)
#define IMEI_WARN(...) IMEI_LOG(imei::log_level::warn, __VA_ARGS__)
#define IMEI_ERROR(...) IMEI_LOG(imei::log_level::error, __VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
