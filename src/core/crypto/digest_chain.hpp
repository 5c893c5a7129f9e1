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

#include <type_traits>
#include <variant>

#include <boost/noncopyable.hpp>

#include <core/common/base.hpp>
#include <core/crypto/md.hpp>

namespace addrcodec::crypto {

//! \brief A digest computed by feeding the output of an inner MessageDigest into an outer one and keeping
//! the leading Size bytes of the result
//! \remarks When Outer is void the inner digest is only truncated
template <typename Inner, typename Outer, size_t Size>
class DigestChain : private boost::noncopyable {
  public:
    static constexpr size_t kDigestSize{Size};

    DigestChain() = default;
    explicit DigestChain(ByteView data) : inner_(data) {}

    void init() noexcept { inner_.init(); }
    void init(ByteView data) noexcept { inner_.init(data); }
    void update(ByteView data) noexcept { inner_.update(data); }

    //! \brief Produces the chained digest
    //! \remarks Returns an empty sequence should any of the underlying digests fail
    [[nodiscard]] Bytes finalize() noexcept {
        Bytes digest{inner_.finalize()};
        if constexpr (not std::is_void_v<Outer>) {
            if (digest.empty()) return digest;
            outer_.init(digest);
            digest = outer_.finalize();
        }
        if (digest.size() < Size) return {};
        digest.resize(Size);
        return digest;
    }

    [[nodiscard]] size_t digest_size() const noexcept { return Size; }

    //! \brief Bytes fed to the inner digest since last init
    [[nodiscard]] size_t ingested_size() const noexcept { return inner_.ingested_size(); }

  private:
    Inner inner_;
    [[no_unique_address]] std::conditional_t<std::is_void_v<Outer>, std::monostate, Outer> outer_;
};

}  // namespace addrcodec::crypto
