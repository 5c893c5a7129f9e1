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

inline constexpr size_t kHash256Size{32};

//! \brief Bitcoin's 256 bit hash: Sha256 of Sha256. Base58Check checksums are its leading bytes
using Hash256 = DigestChain<Sha256, Sha256, kHash256Size>;

}  // namespace addrcodec::crypto
