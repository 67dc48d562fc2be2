// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <benchmark/benchmark.h>
#include <cstdint>
#include <random>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "imei.hpp"
#include "json_utils.hpp"
#include "utils.hpp"

namespace {

std::vector<std::string> generate_imeis(std::size_t count, bool valid)
{
    std::mt19937 gen{1729};
    std::uniform_int_distribution<unsigned> dist{0, 9};

    std::vector<std::string> output;
    output.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        std::string str;
        for (std::size_t j = 0; j < imei::imei_checksum::body_length; ++j) {
            str.push_back(imei::from_digit(static_cast<uint8_t>(dist(gen))));
        }

        auto digit = imei::compute_check_digit(str).value_or(0);
        if (!valid) {
            digit = static_cast<uint8_t>((digit + 1) % 10);
        }
        str.push_back(imei::from_digit(digit));
        output.emplace_back(std::move(str));
    }
    return output;
}

void bm_valid(benchmark::State &state)
{
    auto inputs = generate_imeis(1024, state.range(0) != 0);
    std::size_t i = 0;
    for (auto _ : state) {
        benchmark::DoNotOptimize(imei::valid(inputs[i++ % inputs.size()]));
    }
}

void bm_invalid_length(benchmark::State &state)
{
    std::string_view input{"4901542032375180"};
    for (auto _ : state) {
        benchmark::DoNotOptimize(input);
        benchmark::DoNotOptimize(imei::valid(input));
    }
}

void bm_try_new(benchmark::State &state)
{
    auto inputs = generate_imeis(1024, true);
    std::size_t i = 0;
    for (auto _ : state) {
        auto result = imei::owned_imei::try_new(inputs[i++ % inputs.size()]);
        benchmark::DoNotOptimize(result);
    }
}

void bm_from_json(benchmark::State &state)
{
    std::vector<std::string> inputs;
    for (auto &str : generate_imeis(1024, true)) {
        inputs.emplace_back(imei::to_json(imei::owned_imei{std::move(str)}));
    }

    std::size_t i = 0;
    for (auto _ : state) {
        auto result = imei::imei_from_json(std::string_view{inputs[i++ % inputs.size()]});
        benchmark::DoNotOptimize(result);
    }
}

} // namespace

BENCHMARK(bm_valid)->Arg(1)->Arg(0);
BENCHMARK(bm_invalid_length);
BENCHMARK(bm_try_new);
BENCHMARK(bm_from_json);

BENCHMARK_MAIN(); // NOLINT
