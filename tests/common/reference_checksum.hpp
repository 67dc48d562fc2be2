// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.
#pragma once

#include <cstddef>
#include <string_view>

namespace imei::test {

// Reference implementation, scans the whole input before deciding and folds
// doubled digits by summing their decimal digits. The library must agree
// with it on every input.
inline bool full_scan_valid(std::string_view str)
{
    bool all_digits = true;
    unsigned sum = 0;
    for (std::size_t i = 0; i < str.size(); ++i) {
        const char c = str[i];
        if (c < '0' || c > '9') {
            all_digits = false;
            continue;
        }

        auto n = static_cast<unsigned>(c - '0');
        if (i % 2 == 1) {
            n = (n * 2) / 10 + (n * 2) % 10;
        }
        sum += n;
    }
    return str.size() == 15 && all_digits && sum % 10 == 0;
}

} // namespace imei::test
