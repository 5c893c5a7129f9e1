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

#include <string>

#include <benchmark/benchmark.h>

#include <core/common/base.hpp>
#include <core/common/cast.hpp>
#include <core/crypto/hash160.hpp>
#include <core/crypto/hash256.hpp>

namespace addrcodec::crypto {

static constexpr int64_t kMinInputSize{32};
static constexpr int64_t kMaxInputSize{64 * 1024};
static constexpr int64_t kInputSizeMultiplier{8};

const std::string alpha_string(static_cast<size_t>(kMaxInputSize), 'k');

template <typename Hasher>
void bench_hasher(benchmark::State& state) {
    static Hasher hasher;
    const ByteView data(byte_ptr_cast(alpha_string.data()), static_cast<size_t>(state.range()));
    for ([[maybe_unused]] auto _ : state) {
        hasher.init(data);
        auto hash{hasher.finalize()};
        benchmark::DoNotOptimize(hash);
    }
    state.SetBytesProcessed(state.range() * static_cast<int64_t>(state.iterations()));
}

BENCHMARK(bench_hasher<Sha256>)->RangeMultiplier(kInputSizeMultiplier)->Range(kMinInputSize, kMaxInputSize);
BENCHMARK(bench_hasher<Ripemd160>)->RangeMultiplier(kInputSizeMultiplier)->Range(kMinInputSize, kMaxInputSize);
BENCHMARK(bench_hasher<Hash256>)->RangeMultiplier(kInputSizeMultiplier)->Range(kMinInputSize, kMaxInputSize);
BENCHMARK(bench_hasher<Hash160>)->RangeMultiplier(kInputSizeMultiplier)->Range(kMinInputSize, kMaxInputSize);

}  // namespace addrcodec::crypto
