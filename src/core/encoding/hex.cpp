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

#include "hex.hpp"

#include <array>

namespace addrcodec::enc::hex {

namespace {
    constexpr std::string_view kHexDigits{"0123456789abcdef"};

    // Maps an ascii char to its nibble value. 0xff marks a non hex char
    constexpr std::array<uint8_t, 256> make_unhex_table() {
        std::array<uint8_t, 256> table{};
        table.fill(0xff);
        for (uint8_t i{0}; i < 10; ++i) table['0' + i] = i;
        for (uint8_t i{0}; i < 6; ++i) {
            table['a' + i] = static_cast<uint8_t>(10 + i);
            table['A' + i] = static_cast<uint8_t>(10 + i);
        }
        return table;
    }

    constexpr std::array<uint8_t, 256> kUnhexTable{make_unhex_table()};
}  // namespace

std::string reverse_hex(std::string_view input) noexcept {
    if (has_prefix(input)) input.remove_prefix(2);
    std::string padded{};
    if (input.length() & 1) {
        padded.reserve(input.length() + 1);
        padded.push_back('0');
        padded.append(input);
        input = padded;
    }

    std::string ret{};
    ret.reserve(input.length());
    for (auto pos{input.length()}; pos > 0; pos -= 2) {
        ret.append(input.substr(pos - 2, 2));
    }
    return ret;
}

ByteView zeroless_view(ByteView data) {
    const auto pos{data.find_first_not_of(uint8_t{0x0})};
    if (pos == ByteView::npos) return {};
    return data.substr(pos);
}

std::string encode(ByteView bytes, bool with_prefix) noexcept {
    std::string out(bytes.length() * 2 + (with_prefix ? 2 : 0), '\0');
    auto dest{out.data()};
    if (with_prefix) {
        *dest++ = '0';
        *dest++ = 'x';
    }
    for (const auto byte : bytes) {
        *dest++ = kHexDigits[byte >> 4];
        *dest++ = kHexDigits[byte & 0x0f];
    }
    return out;
}

outcome::result<unsigned> decode_digit(char input) noexcept {
    const auto value{kUnhexTable[static_cast<uint8_t>(input)]};
    if (value == 0xff) return Error::kIllegalHexDigit;
    return static_cast<unsigned>(value);
}

outcome::result<Bytes> decode(std::string_view source) noexcept {
    if (has_prefix(source)) source.remove_prefix(2);
    if (source.empty()) return Bytes{};

    const bool odd{(source.length() & 1) != 0};
    Bytes out((source.length() + 1) / 2, 0);
    auto dest{out.begin()};

    if (odd) {
        const auto lo{decode_digit(source.front())};
        if (not lo) return lo.error();
        *dest++ = static_cast<uint8_t>(lo.value());
        source.remove_prefix(1);
    }

    while (not source.empty()) {
        const auto hi{decode_digit(source[0])};
        if (not hi) return hi.error();
        const auto lo{decode_digit(source[1])};
        if (not lo) return lo.error();
        *dest++ = static_cast<uint8_t>((hi.value() << 4) | lo.value());
        source.remove_prefix(2);
    }
    return out;
}
}  // namespace addrcodec::enc::hex
