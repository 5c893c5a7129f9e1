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

#include <core/crypto/digest_chain.hpp>
#include <core/crypto/md.hpp>

namespace addrcodec::crypto {

//! \brief Size in bytes of any 160-bit public key digest
inline constexpr size_t kHash160Size{20};

//! \brief Bitcoin's 160-bit public key hash: RIPEMD-160 of Sha256
using Hash160 = DigestChain<Sha256, Ripemd160, kHash160Size>;

//! \brief The leading 20 bytes of a single Sha256
//! \remarks Not interoperable with Bitcoin addresses: kept only to reproduce identities generated by
//! tools which adopted this digest in place of RIPEMD-160(SHA-256)
using TruncatedSha256 = DigestChain<Sha256, void, kHash160Size>;

}  // namespace addrcodec::crypto
