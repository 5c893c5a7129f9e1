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
#include <cstdint>
#include <string>

#include <boost/system/error_code.hpp>
#include <magic_enum.hpp>

#include <core/common/outcome.hpp>

namespace addrcodec::addr {

enum class Error {
    kSuccess,         // Not actually an error
    kEmptyPayload,    // Checksum verified but there is no payload at all
    kInvalidLength,   // Payload is not made of a version byte followed by a 160 bit hash
    kInvalidVersion,  // Version byte exceeds the maximum accepted
};

class ErrorCategory final : public boost::system::error_category {
  public:
    virtual ~ErrorCategory() noexcept = default;
    const char* name() const noexcept override { return "AddressError"; }
    std::string message(int err_code) const override {
        std::string desc{"Unknown error"};
        if (const auto enumerator = magic_enum::enum_cast<addr::Error>(err_code); enumerator.has_value()) {
            desc.assign(std::string(magic_enum::enum_name<addr::Error>(*enumerator)));
            desc.erase(0, 1);  // Remove the constant `k` prefix
        }
        return desc;
    }
    boost::system::error_condition default_error_condition(int err_code) const noexcept override {
        const auto enumerator = magic_enum::enum_cast<addr::Error>(err_code);
        if (not enumerator.has_value()) {
            return {err_code, *this};  // No conversion
        }
        switch (*enumerator) {
            using enum Error;
            case kSuccess:
                return make_error_condition(boost::system::errc::success);
            case kEmptyPayload:
            case kInvalidLength:
                return make_error_condition(boost::system::errc::invalid_argument);
            case kInvalidVersion:
                return make_error_condition(boost::system::errc::argument_out_of_domain);
            default:
                return {err_code, *this};
        }
    }
};

// Overload the global make_error_code() free function with our
// custom enum. It will be found via ADL by the compiler if needed.
inline boost::system::error_code make_error_code(addr::Error err_code) {
    static addr::ErrorCategory category{};
    return {static_cast<int>(err_code), category};
}
}  // namespace addrcodec::addr

namespace boost::system {
// Tell the C++ 11 STL metaprogramming that our enums are registered with the
// error code system
template <>
struct is_error_code_enum<addrcodec::addr::Error> : public std::true_type {};
}  // namespace boost::system
