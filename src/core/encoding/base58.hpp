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
#include <string>
#include <string_view>

#include <core/common/base.hpp>
#include <core/common/outcome.hpp>
#include <core/encoding/errors.hpp>

namespace addrcodec::enc::base58 {

//! \brief All alphanumeric characters except for "0", "I", "O", and "l". Digit value is the index
inline constexpr std::string_view kBase58Digits{"123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz"};

//! \brief How many bytes of the double Sha256 digest are appended as checksum
inline constexpr size_t kCheckSumLength{4};

//! \brief Chars tolerated before and after a base58 string
inline constexpr std::string_view kWhitespaces{" \t\n\v\f\r"};

//! \brief Returns a string of ascii chars with the base58 representation of input
//! \remark If provided an empty input the return string is empty as well. Each leading zero byte
//! is rendered as a leading '1'
[[nodiscard]] outcome::result<std::string> encode(ByteView input) noexcept;

//! \brief Returns a string of ascii chars with the base58 representation of input appended with the first
//! kCheckSumLength bytes of its double Sha256 digest
//! \remark An empty input still gets its checksum
[[nodiscard]] outcome::result<std::string> encode_check(ByteView input) noexcept;

//! \brief Returns a string of bytes with the decoded base58 payload
//! \remark Leading whitespaces are skipped and trailing ones tolerated. Any other char outside the alphabet
//! yields kIllegalBase58Digit. Empty (or whitespace only) input decodes to empty bytes
[[nodiscard]] outcome::result<Bytes> decode(std::string_view input) noexcept;

//! \brief Returns the payload of a base58 string whose last kCheckSumLength bytes are the checksum of the
//! preceding ones
[[nodiscard]] outcome::result<Bytes> decode_check(std::string_view input) noexcept;

}  // namespace addrcodec::enc::base58
