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

#include <iostream>
#include <string>
#include <tuple>
#include <typeinfo>

#include <CLI/CLI.hpp>
#include <boost/format.hpp>

#include <core/address/address.hpp>
#include <core/chain/config.hpp>
#include <core/common/base.hpp>
#include <core/common/cast.hpp>
#include <core/crypto/hash160.hpp>
#include <core/encoding/base58.hpp>
#include <core/encoding/hex.hpp>

#include <infra/common/log.hpp>

#include "common.hpp"

using namespace addrcodec;

namespace {

//! \brief Logs a codec failure and returns the process exit code
int report_error(const std::string& action, const boost::system::error_code& error) {
    std::ignore = log::Error(action, {"category", error.category().name(), "error", error.message()});
    return 1;
}

//! \brief Loads the subcommand input either as raw text or as hex
outcome::result<Bytes> load_input(const std::string& input, bool is_text) {
    if (is_text) return Bytes(string_view_to_byte_view(input));
    return enc::hex::decode(input);
}

int do_encode(const std::string& input, bool is_text, bool with_checksum) {
    const auto data{load_input(input, is_text)};
    if (not data) return report_error("Invalid input", data.error());

    LOG_TRACE << "Encoding " << data.value().size() << " bytes" << (with_checksum ? " with checksum" : "");
    const auto encoded{with_checksum ? enc::base58::encode_check(data.value()) : enc::base58::encode(data.value())};
    if (not encoded) return report_error("Unable to encode", encoded.error());
    std::cout << encoded.value() << std::endl;
    return 0;
}

int do_decode(const std::string& input, bool as_text, bool with_checksum) {
    const auto decoded{with_checksum ? enc::base58::decode_check(input) : enc::base58::decode(input)};
    if (not decoded) return report_error("Unable to decode", decoded.error());
    if (as_text) {
        std::cout << byte_view_to_string_view(decoded.value()) << std::endl;
    } else {
        std::cout << enc::hex::encode(decoded.value()) << std::endl;
    }
    return 0;
}

int do_address(const std::string& hash_hex, const ChainConfig& config) {
    const auto hash{h160::from_hex(hash_hex)};
    if (not hash) return report_error("Invalid hash160", hash.error());
    const auto address{addr::from_hash(config.pubkey_address_version_, hash.value())};
    if (not address) return report_error("Unable to build address", address.error());
    std::cout << address.value() << std::endl;
    return 0;
}

int do_pubkey(const std::string& input, bool is_text, bool placeholder_hash, const ChainConfig& config) {
    const auto public_key{load_input(input, is_text)};
    if (not public_key) return report_error("Invalid public key", public_key.error());

    const auto address{placeholder_hash
                           ? addr::from_public_key<crypto::TruncatedSha256>(public_key.value(),
                                                                            config.pubkey_address_version_)
                           : addr::from_public_key(public_key.value(), config.pubkey_address_version_)};
    if (not address) return report_error("Unable to build address", address.error());
    std::cout << address.value() << std::endl;
    return 0;
}

int do_inspect(const std::string& address, const ChainConfig& config) {
    const auto decoded{addr::to_hash(address, config.max_address_version_)};
    if (not decoded) {
        std::cout << (boost::format("%-10s : %s\n") % "Valid" % "false");
        return report_error("Invalid address", decoded.error());
    }

    const auto& [version, hash]{decoded.value()};
    std::cout << (boost::format("%-10s : %s\n") % "Valid" % "true")
              << (boost::format("%-10s : %s\n") % "Version" % enc::hex::encode(version, /*with_prefix=*/true))
              << (boost::format("%-10s : %s\n") % "Hash160" % hash.to_hex())
              << (boost::format("%-10s : %s\n") % "Chain" % lookup_known_chain_name(config.identifier_));
    return 0;
}

//! \brief Replays a full encode/decode walkthrough on fixed inputs
int do_demo(bool placeholder_hash, const ChainConfig& config) {
    static constexpr std::string_view kSampleText{"Hello, Bitcoin!"};
    static constexpr std::string_view kSamplePublicKey{"sample public key data for testing"};

    const auto sample{string_view_to_byte_view(kSampleText)};
    std::cout << "Original: " << kSampleText << "\n";

    const auto encoded{enc::base58::encode(sample)};
    if (not encoded) return report_error("Encode error", encoded.error());
    std::cout << "Base58 Encoded: " << encoded.value() << "\n";

    const auto decoded{enc::base58::decode(encoded.value())};
    if (not decoded) return report_error("Decode error", decoded.error());
    std::cout << "Decoded: " << byte_view_to_string_view(decoded.value()) << "\n";

    const auto encoded_check{enc::base58::encode_check(sample)};
    if (not encoded_check) return report_error("EncodeCheck error", encoded_check.error());
    std::cout << "Base58Check Encoded: " << encoded_check.value() << "\n";

    const auto decoded_check{enc::base58::decode_check(encoded_check.value())};
    if (not decoded_check) return report_error("DecodeCheck error", decoded_check.error());
    std::cout << "Decoded Check: " << byte_view_to_string_view(decoded_check.value()) << "\n";

    const auto public_key{string_view_to_byte_view(kSamplePublicKey)};
    const auto address{placeholder_hash
                           ? addr::from_public_key<crypto::TruncatedSha256>(public_key, config.pubkey_address_version_)
                           : addr::from_public_key(public_key, config.pubkey_address_version_)};
    if (not address) return report_error("Address error", address.error());
    std::cout << "Generated Address: " << address.value() << "\n";
    std::cout << "Address is valid: " << std::boolalpha
              << addr::is_valid(address.value(), config.max_address_version_) << "\n";

    const auto hash{addr::to_hash(address.value(), config.max_address_version_)};
    if (not hash) return report_error("Address to Hash160 error", hash.error());
    std::cout << "Hash160 from address: " << hash.value().hash_.to_hex() << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    const auto* build_info(get_buildinfo());
    CLI::App app_main(std::string(build_info->project_name).append(" address tool"));
    app_main.get_formatter()->column_width(50);
    app_main.require_subcommand(1);  // At least 1 subcommand is required
    app_main.fallthrough();          // Global options allowed after the subcommand
    cmd::CodecSettings settings{};

    cmd::add_chain_options(app_main, settings);
    cmd::add_logging_options(app_main, settings.log);

    /*
     * Subcommands
     */
    std::string input{};
    bool is_text{false};
    bool with_checksum{false};
    bool placeholder_hash{false};

    auto* cmd_encode = app_main.add_subcommand("encode", "Encode bytes to base58");
    cmd_encode->add_option("input", input, "Hex bytes (or text with --text) to encode")->required();
    cmd_encode->add_flag("--text", is_text, "Input is raw text instead of hex");
    cmd_encode->add_flag("--check", with_checksum, "Append a 4 bytes checksum (base58check)");

    auto* cmd_decode = app_main.add_subcommand("decode", "Decode base58 text to bytes");
    cmd_decode->add_option("input", input, "Base58 text to decode")->required();
    cmd_decode->add_flag("--text", is_text, "Print decoded bytes as raw text instead of hex");
    cmd_decode->add_flag("--check", with_checksum, "Verify and strip a 4 bytes checksum (base58check)");

    auto* cmd_address = app_main.add_subcommand("address", "Build the address of a public key hash");
    cmd_address->add_option("hash160", input, "Hex of the 20 bytes public key hash")
        ->required()
        ->check(cmd::HexValidator(crypto::kHash160Size));

    auto* cmd_pubkey = app_main.add_subcommand("pubkey", "Build the address of a public key");
    cmd_pubkey->add_option("input", input, "Hex bytes (or text with --text) of the public key")->required();
    cmd_pubkey->add_flag("--text", is_text, "Input is raw text instead of hex");
    cmd_pubkey->add_flag("--placeholder-hash", placeholder_hash,
                         "Hash public key with truncated Sha256 instead of RIPEMD160(Sha256)");

    auto* cmd_inspect = app_main.add_subcommand("inspect", "Validate an address and print its content");
    cmd_inspect->add_option("address", input, "Address to inspect")->required();

    auto* cmd_chains = app_main.add_subcommand("chains", "List known chains parameters");

    auto* cmd_demo = app_main.add_subcommand("demo", "Run a walkthrough of all codec operations");
    cmd_demo->add_flag("--placeholder-hash", placeholder_hash,
                       "Hash public key with truncated Sha256 instead of RIPEMD160(Sha256)");

    /*
     * Parse arguments and validate
     */
    CLI11_PARSE(app_main, argc, argv);

    try {
        log::init(settings.log);
        log::set_thread_name("main");
        LOG_DEBUG << "Using " << get_buildinfo_string();

        const auto chain_config{cmd::resolve_chain_config(settings)};
        LOG_DEBUG << "Chain config " << chain_config;

        // Execute the requested subcommand
        if (*cmd_encode) return do_encode(input, is_text, with_checksum);
        if (*cmd_decode) return do_decode(input, is_text, with_checksum);
        if (*cmd_address) return do_address(input, chain_config);
        if (*cmd_pubkey) return do_pubkey(input, is_text, placeholder_hash, chain_config);
        if (*cmd_inspect) return do_inspect(input, chain_config);
        if (*cmd_demo) return do_demo(placeholder_hash, chain_config);
        if (*cmd_chains) {
            for (const auto& [name, identifier] : get_known_chains_map()) {
                std::cout << *lookup_known_chain(identifier)->second << std::endl;
            }
            return 0;
        }

    } catch (const std::exception& ex) {
        LOG_CRITICAL << "Unexpected " << typeid(ex).name() << " : " << ex.what();
    }
    return 1;
}
