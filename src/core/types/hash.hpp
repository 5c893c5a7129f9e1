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
#include <algorithm>
#include <array>
#include <compare>
#include <cstring>
#include <ranges>

#include <core/common/base.hpp>
#include <core/common/outcome.hpp>
#include <core/encoding/hex.hpp>

namespace addrcodec {

//! \brief A Hash is a fixed size sequence of bytes
template <uint32_t BITS>
class Hash {
  public:
    static_assert(BITS && (BITS & 7) == 0, "Must be a multiple of 8");
    enum : uint32_t {
        kSize = BITS / 8
    };

    using iterator_type = typename std::array<uint8_t, kSize>::iterator;
    using const_iterator_type = typename std::array<uint8_t, kSize>::const_iterator;

    Hash() = default;

    //! \brief Creates a Hash from given input
    //! \remarks If input is wider than kSize it is disregarded, otherwise it is left padded with zeroes
    explicit Hash(ByteView init) {
        if (init.size() > kSize) return;
        const auto offset{kSize - init.size()};
        if (!init.empty()) std::memcpy(&bytes_[offset], init.data(), init.size());
    }

    //! \brief Returns a hash loaded from a hex string
    //! \param input The hex string to de-hexify
    //! \param reverse If true, the bytes sequence is reversed after being de-hexified
    static outcome::result<Hash<BITS>> from_hex(std::string_view input, bool reverse = false) noexcept {
        auto parsed_bytes{enc::hex::decode(input)};
        if (!parsed_bytes) return parsed_bytes.error();
        if (reverse) [[unlikely]]
            std::ranges::reverse(parsed_bytes.value());
        return Hash<BITS>(ByteView(parsed_bytes.value()));
    }

    //! \brief Returns the hexadecimal representation of this hash
    //! \param reverse If true, the bytes sequence is reversed before being hexed
    //! \param with_prefix If true, the returned string will have the 0x prefix
    [[nodiscard]] std::string to_hex(bool reverse = false, bool with_prefix = false) const noexcept {
        if (reverse) [[unlikely]] {
            auto reversed{bytes_};
            std::ranges::reverse(reversed);
            return enc::hex::encode({reversed.data(), kSize}, with_prefix);
        }
        return enc::hex::encode({bytes_.data(), kSize}, with_prefix);
    }

    static constexpr size_t size() { return kSize; }

    //! \brief Returns the hash to its pristine state (i.e. all zeroes)
    void reset() { bytes_.fill(0); }

    [[nodiscard]] const uint8_t* data() const noexcept { return bytes_.data(); }

    //! \brief Returns a view over the bytes of this hash
    [[nodiscard]] ByteView view() const noexcept { return {bytes_.data(), kSize}; }

    iterator_type begin() noexcept { return bytes_.begin(); }
    iterator_type end() noexcept { return bytes_.end(); }
    const_iterator_type begin() const noexcept { return bytes_.cbegin(); }
    const_iterator_type end() const noexcept { return bytes_.cend(); }

    std::strong_ordering operator<=>(const Hash<BITS>& other) const {
        auto result(std::memcmp(bytes_.data(), other.bytes_.data(), kSize));
        if (result < 0) return std::strong_ordering::less;
        if (result > 0) return std::strong_ordering::greater;
        return std::strong_ordering::equal;
    };

    bool operator==(const Hash<BITS>& other) const { return *this <=> other == 0; }

    inline explicit operator bool() const noexcept {
        return std::ranges::any_of(bytes_, [](const auto& byte) { return byte > 0; });
    }

  private:
    std::array<uint8_t, kSize> bytes_{0};
};

using h160 = Hash<160>;
using h256 = Hash<256>;

}  // namespace addrcodec
