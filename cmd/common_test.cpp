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

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include <catch2/catch.hpp>

#include "common.hpp"

namespace addrcodec::cmd {

TEST_CASE("Chain options", "[cmd]") {
    CodecSettings settings{};
    CLI::App app;
    add_chain_options(app, settings);

    SECTION("Defaults to mainnet") {
        app.parse("", false);
        const auto config{resolve_chain_config(settings)};
        CHECK(config.identifier_ == kMainNetConfig.identifier_);
        CHECK(config.pubkey_address_version_ == 0x00);
        CHECK(config.max_address_version_ == 0x00);
    }

    SECTION("Known chain by name") {
        app.parse("--chain TestNet", false);
        const auto config{resolve_chain_config(settings)};
        CHECK(config.identifier_ == kTestNetConfig.identifier_);
        CHECK(config.pubkey_address_version_ == 0x6f);
    }

    SECTION("Address version override raises the max") {
        app.parse("--addr.version 5", false);
        const auto config{resolve_chain_config(settings)};
        CHECK(config.pubkey_address_version_ == 5);
        CHECK(config.max_address_version_ == 5);
    }

    SECTION("Explicit max version wins") {
        app.parse("--addr.version 5 --addr.maxversion 3", false);
        const auto config{resolve_chain_config(settings)};
        CHECK(config.pubkey_address_version_ == 5);
        CHECK(config.max_address_version_ == 3);
    }

    SECTION("Address version out of range") {
        CHECK_THROWS_AS(app.parse("--addr.version 256", false), CLI::ValidationError);
    }

    SECTION("Program version flag is not an address override") {
        CHECK_THROWS_AS(app.parse("--version 5", false), CLI::ExtrasError);
        CHECK_FALSE(settings.version.has_value());
    }
}

TEST_CASE("Chain config file", "[cmd]") {
    const auto path{std::filesystem::temp_directory_path() / "addrcodec_chain_test.json"};
    {
        std::ofstream file(path, std::ios::trunc);
        file << R"({"chainId": 9, "pubKeyAddressVersion": 30})";
    }

    CodecSettings settings{};
    settings.chain_config_file = path.string();
    const auto config{resolve_chain_config(settings)};
    CHECK(config.identifier_ == 9);
    CHECK(config.pubkey_address_version_ == 30);
    CHECK(config.max_address_version_ == 30);

    {
        std::ofstream file(path, std::ios::trunc);
        file << R"({"chainId": 9, "pubKeyAddressVersion": 300})";
    }
    CHECK_THROWS_AS(resolve_chain_config(settings), std::invalid_argument);
    std::filesystem::remove(path);

    settings.chain_config_file.clear();
    settings.network_id = 0xffff;
    CHECK_THROWS_AS(resolve_chain_config(settings), std::invalid_argument);
}

TEST_CASE("Hex validator", "[cmd]") {
    HexValidator any_size{};
    HexValidator hash_size{20};

    std::string value{"0x62e907b15cbf27d5425399ebf6f0fb50ebb88f18"};
    CHECK(any_size(value).empty());
    CHECK(hash_size(value).empty());

    value = "62e907b1";
    CHECK(any_size(value).empty());
    CHECK_FALSE(hash_size(value).empty());

    value = "62e9zz";
    CHECK_FALSE(any_size(value).empty());
}

}  // namespace addrcodec::cmd
