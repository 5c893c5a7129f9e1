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
#include <vector>

#include <core/common/base.hpp>
#include <core/common/outcome.hpp>
#include <core/encoding/errors.hpp>

namespace addrcodec::enc::radix {

//! \brief The target radix of conversions
inline constexpr uint32_t kRadix{58};

//! \brief A sequence of digit values in range [0, kRadix)
using Digits = std::vector<uint8_t>;

//! \brief Converts a big endian byte sequence into its base58 digits
//! \remarks Digits are returned least significant first. Leading zero bytes contribute no digits hence an empty
//! or all-zero input yields an empty sequence
[[nodiscard]] Digits to_digits(ByteView input);

//! \brief Converts a sequence of base58 digits, most significant first, into the minimal big endian bytes of the
//! value they represent
//! \remarks A zero value (including an empty sequence) yields an empty byte sequence
[[nodiscard]] outcome::result<Bytes> from_digits(const Digits& digits) noexcept;

}  // namespace addrcodec::enc::radix
