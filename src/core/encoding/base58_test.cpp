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
#include <tuple>
#include <vector>

#include <catch2/catch.hpp>

#include <core/common/cast.hpp>
#include <core/encoding/base58.hpp>
#include <core/encoding/hex.hpp>

namespace addrcodec::enc::base58 {

namespace {
    // Vectors shared with other base58 implementations
    const std::vector<std::pair</*hex*/ std::string, /*base58*/ std::string>> tests{
        {"", ""},
        {"61", "2g"},
        {"626262", "a3gV"},
        {"636363", "aPEr"},
        {"73696d706c792061206c6f6e6720737472696e67", "2cFupjhnEsSn59qHXstmK2ffpLv2"},
        {"00eb15231dfceb60925886b67d065299925915aeb172c06647", "1NS17iag9jJgTHD1VXjvLCEnZuQ3rJDE9L"},
        {"516b6fcd0f", "ABnLTmg"},
        {"bf4f89001e670274dd", "3SEo3LWLoPntC"},
        {"572e4794", "3EFU7m"},
        {"ecac89cad93923c02321", "EJDM8drfXA6uyA"},
        {"10c8511e", "Rt5zm"},
        {"00000000000000000000", "1111111111"},
        {"000111d38e5fc9071ffcd20b4a763cc9ae4f252bb4e48fd66a835e252ada93ff480d6dd43dc62a641155a5",
         "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz"},
        {"000102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f202122232425262728292a2b2c2d2e2f3031323334353"
         "63738393a3b3c3d3e3f404142434445464748494a4b4c4d4e4f505152535455565758595a5b5c5d5e5f606162636465666768696a6b6c"
         "6d6e6f707172737475767778797a7b7c7d7e7f808182838485868788898a8b8c8d8e8f909192939495969798999a9b9c9d9e9fa0a1a2a"
         "3a4a5a6a7a8a9aaabacadaeafb0b1b2b3b4b5b6b7b8b9babbbcbdbebfc0c1c2c3c4c5c6c7c8c9cacbcccdcecfd0d1d2d3d4d5d6d7d8d9"
         "dadbdcdddedfe0e1e2e3e4e5e6e7e8e9eaebecedeeeff0f1f2f3f4f5f6f7f8f9fafbfcfdfeff",
         "1cWB5HCBdLjAuqGGReWE3R3CguuwSjw6RHn39s2yuDRTS5NsBgNiFpWgAnEx6VQi8csexkgYw3mdYrMHr8x9i7aEwP8kZ7vccXWqKDvGv3u1G"
         "xFKPuAkn8JCPPGDMf3vMMnbzm6Nh9zh1gcNsMvH3ZNLmP5fSG6DGbbi2tuwMWPthr4boWwCxf7ewSgNQeacyozhKDDQQ1qL5fQFUW52QKUZDZ"
         "5fw3KXNQJMcNTcaB723LchjeKun7MuGW5qyCBZYzA1KjofN1gYBV3NqyhQJ3Ns746GNuf9N2pQPmHz4xpnSrrfCvy6TVVz5d4PdrjeshsWQwp"
         "ZsZGzvbdAdN8MKV5QsBDY"}};

}  // namespace

TEST_CASE("Base58 encoding", "[encoding][base58]") {
    for (const auto& [input, expected_output] : tests) {
        const auto bytes{hex::decode(input)};
        REQUIRE(bytes);
        const auto output{encode(*bytes)};
        REQUIRE(output);
        CHECK(*output == expected_output);
    }

    CHECK(encode(string_view_to_byte_view("Hello World")).value() == "JxF12TrwUP45BMd");
    CHECK(encode(string_view_to_byte_view("Hello, Bitcoin!")).value() == "32UWxgjUxck1RSJ56gAYp");
    CHECK(encode(Bytes{0x00, 0x00, 0x00, 0x01}).value() == "1112");
    CHECK(encode(Bytes{0x00, 0x00, 0x01}).value() == "112");
    CHECK(encode(Bytes{0x01}).value() == "2");
    CHECK(encode(Bytes{0x00}).value() == "1");
}

TEST_CASE("Base58 decoding", "[encoding][base58]") {
    for (const auto& [expected_output, input] : tests) {
        const auto output{decode(input)};
        REQUIRE(output);
        const auto hexed{hex::encode(*output)};
        CHECK(hexed == expected_output);
    }

    const auto decoded{decode("112")};
    REQUIRE(decoded);
    CHECK(decoded.value() == Bytes{0x00, 0x00, 0x01});
}

TEST_CASE("Base58 decoding whitespaces", "[encoding][base58]") {
    SECTION("Empty or blank") {
        for (const std::string_view input : {"", " ", " \t\n\v\f\r "}) {
            const auto decoded{decode(input)};
            REQUIRE(decoded);
            CHECK(decoded.value().empty());
        }
    }

    SECTION("Leading and trailing") {
        for (const std::string_view input : {"  a3gV", "a3gV\n", "\t a3gV \r\n", "\va3gV\f"}) {
            INFO("Decoding [" << input << "]");
            const auto decoded{decode(input)};
            REQUIRE(decoded);
            CHECK(hex::encode(decoded.value()) == "626262");
        }

        // Leading ones are counted after whitespaces are skipped
        const auto decoded{decode("  112  ")};
        REQUIRE(decoded);
        CHECK(decoded.value() == Bytes{0x00, 0x00, 0x01});
    }

    SECTION("Embedded") {
        for (const std::string_view input : {"a3 gV", "a3gV x", "\ta3\ngV"}) {
            INFO("Decoding [" << input << "]");
            const auto decoded{decode(input)};
            REQUIRE(decoded.has_error());
            CHECK(decoded.error() == Error::kIllegalBase58Digit);
        }
    }
}

TEST_CASE("Base58 illegal digits", "[encoding][base58]") {
    for (const std::string_view input : {"0", "O", "I", "l", "a3gV0", "1+1", "\xc3\xa9"}) {
        INFO("Decoding [" << input << "]");
        const auto decoded{decode(input)};
        REQUIRE(decoded.has_error());
        CHECK(decoded.error() == Error::kIllegalBase58Digit);
        CHECK(decoded.error().message() == "IllegalBase58Digit");
    }
}

TEST_CASE("Base58 leading zeroes", "[encoding][base58]") {
    for (size_t zeroes{0}; zeroes < 12; ++zeroes) {
        Bytes input(zeroes, 0x00);
        input.append({0x2a, 0x00, 0x7f});
        const auto encoded{encode(input)};
        REQUIRE(encoded);
        const auto& text{encoded.value()};
        CHECK(text.find_first_not_of('1') == zeroes);

        const auto decoded{decode(text)};
        REQUIRE(decoded);
        CHECK(decoded.value() == input);
    }

    const Bytes all_zeroes(7, 0x00);
    CHECK(encode(all_zeroes).value() == "1111111");
    CHECK(decode("1111111").value() == all_zeroes);
}

TEST_CASE("Base58 alphabet closure", "[encoding][base58]") {
    Bytes input{};
    for (size_t i{0}; i < 512; ++i) {
        input.push_back(static_cast<uint8_t>((i * 131) ^ 0x5a));
        const auto encoded{encode(input)};
        REQUIRE(encoded);
        REQUIRE(encoded.value().find_first_of("0OIl") == std::string::npos);
        REQUIRE(std::ranges::all_of(encoded.value(),
                                    [](const char c) { return kBase58Digits.find(c) != std::string_view::npos; }));
    }
}

TEST_CASE("Base58 encode/decode with checksum", "[encoding][base58]") {
    for (const auto& [input, not_checksummed_output] : tests) {
        std::ignore = not_checksummed_output;
        const auto input_bytes{hex::decode(input)};
        REQUIRE(input_bytes);
        const auto checksum_encoded{encode_check(*input_bytes)};
        REQUIRE(checksum_encoded);

        const auto checksum_decoded{decode_check(*checksum_encoded)};
        REQUIRE(checksum_decoded);

        const auto hexed_checksum_decoded{hex::encode(*checksum_decoded)};
        CHECK(hexed_checksum_decoded == input);
    }

    CHECK(encode_check(string_view_to_byte_view("Hello, Bitcoin!")).value() == "EFiFWuRxVtH7xm4n2ZadEY73qw");

    // Empty payload still carries its checksum
    const auto empty_encoded{encode_check(ByteView{})};
    REQUIRE(empty_encoded);
    CHECK(empty_encoded.value() == "3QJmnh");
    const auto empty_decoded{decode_check(empty_encoded.value())};
    REQUIRE(empty_decoded);
    CHECK(empty_decoded.value().empty());
}

TEST_CASE("Base58 checksum failures", "[encoding][base58]") {
    SECTION("Too short") {
        for (const std::string_view input : {"", "1", "2g", "a3gV", "111"}) {
            INFO("Decoding [" << input << "]");
            const auto decoded{decode_check(input)};
            REQUIRE(decoded.has_error());
            CHECK(decoded.error() == Error::kInputTooNarrow);
        }
    }

    SECTION("Invalid digits are reported first") {
        const auto decoded{decode_check("EFiFWuRxVtH7xm4n2ZadEY73q0")};
        REQUIRE(decoded.has_error());
        CHECK(decoded.error() == Error::kIllegalBase58Digit);
    }

    SECTION("Corrupted last char") {
        const auto decoded{decode_check("1A1zP1eP5QGefi2DMPTfTL5SLmv7DivfNb")};
        REQUIRE(decoded.has_error());
        CHECK(decoded.error() == Error::kChecksumMismatch);
    }

    SECTION("Any single bit flip") {
        const auto raw{decode("EFiFWuRxVtH7xm4n2ZadEY73qw")};
        REQUIRE(raw);
        REQUIRE(raw.value().size() == 15 + kCheckSumLength);

        for (size_t bit{0}; bit < raw.value().size() * 8; ++bit) {
            Bytes tampered{raw.value()};
            tampered[bit / 8] ^= static_cast<uint8_t>(1U << (bit % 8));
            const auto reencoded{encode(tampered)};
            REQUIRE(reencoded);
            const auto decoded{decode_check(reencoded.value())};
            INFO("Flipped bit " << bit);
            REQUIRE(decoded.has_error());
            CHECK(decoded.error() == Error::kChecksumMismatch);
        }
    }
}

}  // namespace addrcodec::enc::base58
