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

#include <catch2/catch.hpp>

#include <core/address/errors.hpp>
#include <core/encoding/errors.hpp>

namespace addrcodec::addr {

TEST_CASE("Address errors", "[address][errors]") {
    for (auto enumerator : magic_enum::enum_values<addr::Error>()) {
        const auto code{static_cast<int>(enumerator)};
        if (code == 0) continue;
        const auto label{std::string(magic_enum::enum_name(enumerator)).erase(0, 1)};

        INFO("Testing error code [" << code << ":" << label << "]");
        const boost::system::error_code error{make_error_code(enumerator)};
        CHECK(error.message() == label);
        CHECK(std::string(error.category().name()) == "AddressError");
    }

    CHECK(ErrorCategory().message(0) == "Success");
    CHECK(ErrorCategory().message(255) == "Unknown error");

    // Same numeric value from another domain does not compare equal
    const boost::system::error_code address_error{Error::kEmptyPayload};
    const boost::system::error_code encoding_error{enc::Error::kIllegalHexDigit};
    REQUIRE(address_error.value() == encoding_error.value());
    CHECK(address_error != encoding_error);
}
}  // namespace addrcodec::addr
