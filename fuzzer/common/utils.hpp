// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstdint>
#include <cstdlib>
#include <string_view>

namespace imei_afl {

// Utility to convert raw bytes to string_view
inline std::string_view bytes_to_string_view(const uint8_t *data, size_t size)
{
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return std::string_view{reinterpret_cast<const char *>(data), size};
}

// Prevent compiler optimization of results
template <typename T> inline void prevent_optimization(T &value)
{
    asm volatile("" : "+m"(value) : : "memory");
}

// Crash so that the fuzzer records the input
// NOLINTNEXTLINE(readability-identifier-naming)
[[noreturn]] inline void fuzz_assert_failed() { std::abort(); }

} // namespace imei_afl
