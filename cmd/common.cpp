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

#include "common.hpp"

#include <fstream>
#include <map>
#include <stdexcept>

#include <absl/strings/str_cat.h>
#include <magic_enum.hpp>
#include <nlohmann/json.hpp>

#include <core/encoding/hex.hpp>

namespace addrcodec::cmd {

void add_logging_options(CLI::App& cli, log::Settings& log_settings) {
    std::map<std::string, log::Level, std::less<>> level_mapping;
    for (const auto enumerator : magic_enum::enum_values<log::Level>()) {
        level_mapping.try_emplace(log::level_label(enumerator), enumerator);
    }

    auto& log_opts = *cli.add_option_group("Log", "Logging options");
    log_opts.add_option("--log.verbosity", log_settings.log_verbosity, "Sets log verbosity")
        ->capture_default_str()
        ->transform(CLI::Transformer(level_mapping, CLI::ignore_case))
        ->default_val(log_settings.log_verbosity);
    log_opts.add_option("--log.timezone", log_settings.log_timezone, "Sets log timezone. If not specified UTC is used")
        ->capture_default_str();
    log_opts.add_flag("--log.stdout", log_settings.log_std_out, "Outputs to std::out instead of std::err");
    log_opts.add_flag("--log.nocolor", log_settings.log_nocolor, "Disable colors on log lines");
    log_opts.add_flag("--log.threads", log_settings.log_threads, "Prints thread ids");
    log_opts.add_option("--log.file", log_settings.log_file, "Tee all log lines to given file name");
}

void add_chain_options(CLI::App& cli, CodecSettings& settings) {
    auto& chain_opts = *cli.add_option_group("Chain", "Chain options");
    auto* chain_opt = chain_opts
                          .add_option("--chain", settings.network_id,
                                      "Name or ID of the chain whose address parameters apply (default \"mainnet\")")
                          ->capture_default_str()
                          ->transform(CLI::Transformer(get_known_chains_map(), CLI::ignore_case));

    chain_opts
        .add_option("--chain.config", settings.chain_config_file,
                    "JSON file with custom chain parameters (chainId, pubKeyAddressVersion, maxAddressVersion)")
        ->check(CLI::ExistingFile)
        ->excludes(chain_opt);

    chain_opts.add_option("--addr.version", settings.version, "Overrides the address version byte")
        ->check(CLI::Range(0U, 255U));
    chain_opts
        .add_option("--addr.maxversion", settings.max_version, "Overrides the maximum accepted address version byte")
        ->check(CLI::Range(0U, 255U));
}

ChainConfig resolve_chain_config(const CodecSettings& settings) {
    ChainConfig ret{};
    if (not settings.chain_config_file.empty()) {
        std::ifstream file(settings.chain_config_file);
        if (not file.is_open()) {
            throw std::invalid_argument(absl::StrCat("Unable to open ", settings.chain_config_file));
        }
        const auto json{nlohmann::json::parse(file, /*cb=*/nullptr, /*allow_exceptions=*/false)};
        const auto parsed{ChainConfig::from_json(json)};
        if (not parsed.has_value()) {
            throw std::invalid_argument(absl::StrCat("Invalid chain config in ", settings.chain_config_file));
        }
        ret = *parsed;
    } else {
        const auto known_chain{lookup_known_chain(settings.network_id)};
        if (not known_chain.has_value()) {
            throw std::invalid_argument(absl::StrCat("Unknown chain id ", settings.network_id));
        }
        ret = *known_chain->second;
    }

    if (settings.version.has_value()) {
        ret.pubkey_address_version_ = static_cast<uint8_t>(*settings.version);
        // A custom version alone would be refused by the chain max
        if (not settings.max_version.has_value() and ret.max_address_version_ < ret.pubkey_address_version_) {
            ret.max_address_version_ = ret.pubkey_address_version_;
        }
    }
    if (settings.max_version.has_value()) {
        ret.max_address_version_ = static_cast<uint8_t>(*settings.max_version);
    }
    return ret;
}

HexValidator::HexValidator(std::optional<size_t> expected_size) {
    description(expected_size.has_value() ? absl::StrCat("an hex string of ", *expected_size, " bytes")
                                          : std::string("an hex string"));
    func_ = [expected_size](const std::string& value) -> std::string {
        const auto parsed{enc::hex::decode(value)};
        if (parsed.has_error()) {
            return absl::StrCat("Value \"", value, "\" is not a valid hex string: ", parsed.error().message());
        }
        if (expected_size.has_value() and parsed.value().size() != *expected_size) {
            return absl::StrCat("Value \"", value, "\" is ", parsed.value().size(), " bytes long. Expected ",
                                *expected_size);
        }
        return {};
    };
}

}  // namespace addrcodec::cmd
