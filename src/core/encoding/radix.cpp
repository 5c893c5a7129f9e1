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

#include "radix.hpp"

#include <algorithm>

#include <boost/multiprecision/cpp_int.hpp>

namespace addrcodec::enc::radix {

/*
 * Both directions go through an arbitrary precision unsigned integer: the input
 * is loaded with shifts (or multiply-and-add) and then drained with repeated
 * divisions by the output radix. An unsigned magnitude never carries a sign
 * byte so no input can be misread as negative.
 */

Digits to_digits(ByteView input) {
    using boost::multiprecision::cpp_int;
    cpp_int value{0};
    for (const auto byte : input) {
        value <<= 8;  // Mul by 256
        value += byte;
    }

    Digits digits{};
    digits.reserve(input.size() * 138 / 100 + 1);  // 138% is the max ratio between input and output size
    while (value != 0) {
        const cpp_int rem{value % kRadix};
        value /= kRadix;
        digits.push_back(rem.convert_to<uint8_t>());
    }
    return digits;
}

outcome::result<Bytes> from_digits(const Digits& digits) noexcept {
    using boost::multiprecision::cpp_int;
    cpp_int value{0};
    for (const auto digit : digits) {
        if (digit >= kRadix) [[unlikely]]
            return Error::kIllegalBase58Digit;
        value *= kRadix;
        value += digit;
    }

    Bytes bytes{};
    while (value != 0) {
        const cpp_int low{value & 0xff};
        bytes.push_back(low.convert_to<uint8_t>());
        value >>= 8;
    }
    std::ranges::reverse(bytes);
    return bytes;
}
}  // namespace addrcodec::enc::radix
