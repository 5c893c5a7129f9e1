/*
   Copyright 2026 The Addrcodec Authors

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

       http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
*/

#include <benchmark/benchmark.h>

#include <core/common/base.hpp>
#include <core/encoding/base58.hpp>

namespace addrcodec::enc::base58 {

static constexpr int64_t kMinInputSize{8};
static constexpr int64_t kMaxInputSize{512};
static constexpr int64_t kInputSizeMultiplier{4};

namespace {
    Bytes make_payload(size_t size) {
        Bytes payload(size, 0);
        uint8_t value{0x5a};
        for (auto& item : payload) {
            value = static_cast<uint8_t>(value * 33U + 7U);
            item = value;
        }
        return payload;
    }
}  // namespace

void bench_encode(benchmark::State& state) {
    const auto payload{make_payload(static_cast<size_t>(state.range()))};
    for ([[maybe_unused]] auto _ : state) {
        auto encoded{encode(payload)};
        benchmark::DoNotOptimize(encoded);
    }
    state.SetBytesProcessed(state.range() * static_cast<int64_t>(state.iterations()));
}

void bench_decode(benchmark::State& state) {
    const auto encoded{encode(make_payload(static_cast<size_t>(state.range())))};
    for ([[maybe_unused]] auto _ : state) {
        auto decoded{decode(encoded.value())};
        benchmark::DoNotOptimize(decoded);
    }
    state.SetBytesProcessed(state.range() * static_cast<int64_t>(state.iterations()));
}

void bench_encode_check(benchmark::State& state) {
    const auto payload{make_payload(static_cast<size_t>(state.range()))};
    for ([[maybe_unused]] auto _ : state) {
        auto encoded{encode_check(payload)};
        benchmark::DoNotOptimize(encoded);
    }
    state.SetBytesProcessed(state.range() * static_cast<int64_t>(state.iterations()));
}

void bench_decode_check(benchmark::State& state) {
    const auto encoded{encode_check(make_payload(static_cast<size_t>(state.range())))};
    for ([[maybe_unused]] auto _ : state) {
        auto decoded{decode_check(encoded.value())};
        benchmark::DoNotOptimize(decoded);
    }
    state.SetBytesProcessed(state.range() * static_cast<int64_t>(state.iterations()));
}

BENCHMARK(bench_encode)->RangeMultiplier(kInputSizeMultiplier)->Range(kMinInputSize, kMaxInputSize);
BENCHMARK(bench_decode)->RangeMultiplier(kInputSizeMultiplier)->Range(kMinInputSize, kMaxInputSize);
BENCHMARK(bench_encode_check)->RangeMultiplier(kInputSizeMultiplier)->Range(kMinInputSize, kMaxInputSize);
BENCHMARK(bench_decode_check)->RangeMultiplier(kInputSizeMultiplier)->Range(kMinInputSize, kMaxInputSize);

}  // namespace addrcodec::enc::base58
