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

#include "address.hpp"

#include <core/encoding/base58.hpp>

namespace addrcodec::addr {

outcome::result<std::string> from_hash(uint8_t version, const h160& hash) noexcept {
    Bytes payload{};
    payload.reserve(kPayloadLength);
    payload.push_back(version);
    payload.append(hash.view());
    return enc::base58::encode_check(payload);
}

outcome::result<DecodedAddress> to_hash(std::string_view text, uint8_t max_version) noexcept {
    const auto payload{enc::base58::decode_check(text)};
    if (not payload) return payload.error();

    const auto& data{payload.value()};
    if (data.empty()) return Error::kEmptyPayload;
    if (data.size() != kPayloadLength) return Error::kInvalidLength;
    if (data[0] > max_version) return Error::kInvalidVersion;

    return DecodedAddress{data[0], h160(ByteView(data).substr(1))};
}

bool is_valid(std::string_view text, uint8_t max_version) noexcept {
    return to_hash(text, max_version).has_value();
}

}  // namespace addrcodec::addr
