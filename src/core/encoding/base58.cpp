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

#include "base58.hpp"

#include <algorithm>

#include <core/crypto/hash256.hpp>
#include <core/encoding/radix.hpp>

namespace addrcodec::enc::base58 {

namespace {
    //! \brief Returns the first kCheckSumLength bytes of the double Sha256 of data
    //! \remarks An empty return value means the digest could not be computed
    Bytes compute_checksum(ByteView data) noexcept {
        crypto::Hash256 hasher(data);
        auto digest{hasher.finalize()};
        if (digest.size() < kCheckSumLength) return {};
        digest.resize(kCheckSumLength);
        return digest;
    }
}  // namespace

outcome::result<std::string> encode(ByteView input) noexcept {
    if (input.empty()) return std::string{};

    const auto leading_zeroes{std::min(input.find_first_not_of(uint8_t{0x00}), input.size())};
    const auto digits{radix::to_digits(input)};

    std::string encoded(leading_zeroes, kBase58Digits[0]);
    encoded.reserve(leading_zeroes + digits.size());
    for (auto it{digits.rbegin()}; it != digits.rend(); ++it) {
        encoded.push_back(kBase58Digits[*it]);
    }
    return encoded;
}

outcome::result<std::string> encode_check(ByteView input) noexcept {
    const auto checksum{compute_checksum(input)};
    if (checksum.empty()) [[unlikely]]
        return Error::kUnexpectedError;
    Bytes buffer(input);
    buffer.append(checksum);
    return encode(buffer);
}

outcome::result<Bytes> decode(std::string_view input) noexcept {
    const auto start{input.find_first_not_of(kWhitespaces)};
    if (start == std::string_view::npos) return Bytes{};
    input.remove_prefix(start);

    radix::Digits digits{};
    digits.reserve(input.size());
    for (size_t i{0}; i < input.size(); ++i) {
        const auto pos{kBase58Digits.find(input[i])};
        if (pos == std::string_view::npos) [[unlikely]] {
            // Only trailing whitespaces are allowed past the last digit
            if (input.find_first_not_of(kWhitespaces, i) != std::string_view::npos) {
                return Error::kIllegalBase58Digit;
            }
            input = input.substr(0, i);
            break;
        }
        digits.push_back(static_cast<uint8_t>(pos));
    }

    const auto leading_ones{std::min(input.find_first_not_of(kBase58Digits[0]), input.size())};
    const auto magnitude{radix::from_digits(digits)};
    if (not magnitude) return magnitude.error();

    Bytes decoded(leading_ones, 0x00);
    decoded.append(magnitude.value());
    return decoded;
}

outcome::result<Bytes> decode_check(std::string_view input) noexcept {
    const auto decoded{decode(input)};
    if (not decoded) return decoded.error();
    if (decoded.value().size() < kCheckSumLength) return Error::kInputTooNarrow;

    // Split decoded into original value and its checksum
    const auto& decoded_value{decoded.value()};
    const ByteView original(decoded_value.data(), decoded_value.size() - kCheckSumLength);
    const ByteView checksum(&decoded_value[decoded_value.size() - kCheckSumLength], kCheckSumLength);

    const auto expected_checksum{compute_checksum(original)};
    if (expected_checksum.empty()) [[unlikely]]
        return Error::kUnexpectedError;
    if (not std::ranges::equal(expected_checksum, checksum)) return Error::kChecksumMismatch;
    return Bytes(original);
}
}  // namespace addrcodec::enc::base58
