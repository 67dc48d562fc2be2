// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <string>
#include <string_view>

#include "imei.hpp"

namespace imei {

template class basic_imei<std::string>;
template class basic_imei<std::string_view>;

} // namespace imei
