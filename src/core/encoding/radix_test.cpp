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

#include <algorithm>
#include <random>

#include <catch2/catch.hpp>

#include <core/encoding/hex.hpp>
#include <core/encoding/radix.hpp>

namespace addrcodec::enc::radix {

TEST_CASE("Radix to digits", "[encoding][radix]") {
    CHECK(to_digits(ByteView{}).empty());
    CHECK(to_digits(Bytes(10, 0)).empty());
    CHECK(to_digits(Bytes{0x00, 0x00, 0x01}) == Digits{1});
    CHECK(to_digits(Bytes{0x01, 0x00}) == Digits{24, 4});
    CHECK(to_digits(Bytes{0x61}) == Digits{39, 1});

    // Most significant bit set must not be read as a sign
    CHECK(to_digits(Bytes{0xff}) == Digits{23, 4});
    const auto digits{to_digits(Bytes(32, 0xff))};
    CHECK(std::ranges::all_of(digits, [](const auto digit) { return digit < kRadix; }));
}

TEST_CASE("Radix from digits", "[encoding][radix]") {
    auto result{from_digits({})};
    REQUIRE(result);
    CHECK(result.value().empty());

    result = from_digits({0, 0, 0});
    REQUIRE(result);
    CHECK(result.value().empty());

    result = from_digits({4, 24});
    REQUIRE(result);
    CHECK(result.value() == Bytes{0x01, 0x00});

    result = from_digits({4, 23});
    REQUIRE(result);
    CHECK(result.value() == Bytes{0xff});

    result = from_digits({1, 58});
    REQUIRE(result.has_error());
    CHECK(result.error() == Error::kIllegalBase58Digit);
}

TEST_CASE("Radix magnitude preservation", "[encoding][radix]") {
    std::mt19937 rng(1234);
    std::uniform_int_distribution<uint32_t> byte_dist(0, 255);
    for (size_t len{1}; len < 80; ++len) {
        Bytes input(len, 0);
        for (auto& byte : input) byte = static_cast<uint8_t>(byte_dist(rng));
        input[0] |= 0x01;  // No leading zeroes

        auto digits{to_digits(input)};
        std::ranges::reverse(digits);
        const auto restored{from_digits(digits)};
        REQUIRE(restored);
        INFO("Input " << hex::encode(input));
        CHECK(restored.value() == input);
    }
}
}  // namespace addrcodec::enc::radix
