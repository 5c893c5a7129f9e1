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

#pragma once
#include <concepts>
#include <string>
#include <string_view>

#include <core/address/errors.hpp>
#include <core/common/base.hpp>
#include <core/common/outcome.hpp>
#include <core/crypto/hash160.hpp>
#include <core/encoding/errors.hpp>
#include <core/types/hash.hpp>

namespace addrcodec::addr {

//! \brief Version byte of public key hash addresses when none is configured
inline constexpr uint8_t kDefaultVersion{0x00};

//! \brief Size of the decoded payload: a version byte followed by a 160 bit hash
inline constexpr size_t kPayloadLength{1 + h160::size()};

//! \brief Any hasher reducing a public key to a 160 bit digest
template <typename T>
concept PublicKeyHasher = requires(T hasher, ByteView data) {
    T(data);
    { hasher.finalize() } -> std::same_as<Bytes>;
};

struct DecodedAddress {
    uint8_t version_{kDefaultVersion};  // Version byte found in the address
    h160 hash_{};                       // The public key hash
};

//! \brief Renders a public key hash as a base58check address prefixed by the version byte
[[nodiscard]] outcome::result<std::string> from_hash(uint8_t version, const h160& hash) noexcept;

//! \brief Parses an address back into its version byte and public key hash
//! \remarks Checksum and digit errors from the encoding layer are returned unchanged. Every version
//! less than or equal to max_version is accepted
[[nodiscard]] outcome::result<DecodedAddress> to_hash(std::string_view text,
                                                      uint8_t max_version = kDefaultVersion) noexcept;

//! \brief Whether text parses as an address with version not exceeding max_version
[[nodiscard]] bool is_valid(std::string_view text, uint8_t max_version = kDefaultVersion) noexcept;

//! \brief Derives the address of a public key
//! \remarks The key is not validated: any byte sequence is hashed as is
template <PublicKeyHasher Hasher = crypto::Hash160>
[[nodiscard]] outcome::result<std::string> from_public_key(ByteView public_key,
                                                           uint8_t version = kDefaultVersion) noexcept {
    Hasher hasher(public_key);
    const auto digest{hasher.finalize()};
    if (digest.size() != h160::size()) [[unlikely]]
        return enc::Error::kUnexpectedError;
    return from_hash(version, h160(digest));
}

}  // namespace addrcodec::addr
