// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <unistd.h>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>

#include "../../common/utils.hpp"
#include "common/reference_checksum.hpp"
#include "imei.hpp"
#include "utils.hpp"

using namespace imei_afl;

namespace {

// Inputs longer than an IMEI only exercise the length check
constexpr std::size_t max_input_size = 4096;
constexpr unsigned persistent_iterations = 1000;

} // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size)
{
    auto input = bytes_to_string_view(data, size);

    auto expected = imei::test::full_scan_valid(input);
    if (imei::valid(input) != expected) {
        fuzz_assert_failed();
    }

    auto result = imei::owned_imei::try_new(std::string{input});
    if (std::holds_alternative<imei::owned_imei>(result) != expected) {
        fuzz_assert_failed();
    }

    if (expected) {
        auto inner = std::get<imei::owned_imei>(std::move(result)).into_inner();
        if (inner != input) {
            fuzz_assert_failed();
        }
    }

    if (input.size() == imei::imei_checksum::imei_length) {
        auto digit = imei::compute_check_digit(input.substr(0, imei::imei_checksum::body_length));
        if (digit.has_value()) {
            std::string candidate{input.substr(0, imei::imei_checksum::body_length)};
            candidate.push_back(imei::from_digit(*digit));
            if (!imei::valid(candidate)) {
                fuzz_assert_failed();
            }
            prevent_optimization(candidate);
        }
    }

    return 0;
}

// Replays the files given as arguments, otherwise runs in AFL++ persistent
// mode reading each input from stdin
int main(int argc, char **argv)
{
    if (argc > 1) {
        for (int i = 1; i < argc; ++i) {
            std::ifstream file(argv[i], std::ios::binary);
            if (!file) {
                fmt::print(stderr, "failed to open {}\n", argv[i]);
                return 1;
            }

            std::vector<uint8_t> data{
                std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
            LLVMFuzzerTestOneInput(data.data(), data.size());
            fmt::print("{}: {} bytes ok\n", argv[i], data.size());
        }
        return 0;
    }

    std::vector<uint8_t> buffer(max_input_size);
    while (__AFL_LOOP(persistent_iterations)) {
        auto len = read(STDIN_FILENO, buffer.data(), buffer.size());
        if (len < 0) {
            break;
        }
        LLVMFuzzerTestOneInput(buffer.data(), static_cast<std::size_t>(len));
    }

    return 0;
}
