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

#include <algorithm>
#include <ranges>
#include <vector>

#include <boost/algorithm/string/predicate.hpp>

#include <core/chain/config.hpp>

namespace addrcodec {

namespace {
    const std::vector<std::pair<std::string, const ChainConfig*>> kKnownChainConfigs{
        {"mainnet", &kMainNetConfig},
        {"testnet", &kTestNetConfig},
        {"regtest", &kRegTestConfig},
    };
}

nlohmann::json ChainConfig::to_json() const noexcept {
    nlohmann::json ret;
    ret["chainId"] = identifier_;
    ret["chainName"] = lookup_known_chain_name(identifier_);
    ret["pubKeyAddressVersion"] = pubkey_address_version_;
    ret["maxAddressVersion"] = max_address_version_;
    return ret;
}

std::optional<ChainConfig> ChainConfig::from_json(const nlohmann::json& json) noexcept {
    if (json.is_discarded() or not json.is_object()) return std::nullopt;

    // Fetches an integer member provided it fits in [0, max]
    const auto get_bounded = [&json](const char* key, int64_t max) -> std::optional<int64_t> {
        if (not json.contains(key) or not json[key].is_number_integer()) return std::nullopt;
        const auto value{json[key].get<int64_t>()};
        if (value < 0 or value > max) return std::nullopt;
        return value;
    };

    const auto identifier{get_bounded("chainId", UINT32_MAX)};
    const auto version{get_bounded("pubKeyAddressVersion", UINT8_MAX)};
    if (not identifier or not version) return std::nullopt;

    ChainConfig config{};
    config.identifier_ = static_cast<uint32_t>(*identifier);
    config.pubkey_address_version_ = static_cast<uint8_t>(*version);
    config.max_address_version_ = config.pubkey_address_version_;

    // Optional: defaults to the address version
    if (json.contains("maxAddressVersion")) {
        const auto max_version{get_bounded("maxAddressVersion", UINT8_MAX)};
        if (not max_version) return std::nullopt;
        config.max_address_version_ = static_cast<uint8_t>(*max_version);
    }
    return config;
}

std::ostream& operator<<(std::ostream& out, const ChainConfig& obj) { return out << obj.to_json(); }

std::optional<std::pair<const std::string, const ChainConfig*>> lookup_known_chain(const uint32_t identifier) noexcept {
    auto iterator{std::ranges::find_if(kKnownChainConfigs,
                                       [&identifier](const std::pair<std::string, const ChainConfig*>& pair) -> bool {
                                           return pair.second->identifier_ == identifier;
                                       })};

    if (iterator == kKnownChainConfigs.end()) {
        return std::nullopt;
    }
    return std::pair(*iterator);
}

std::optional<std::pair<const std::string, const ChainConfig*>> lookup_known_chain(
    const std::string_view identifier) noexcept {
    auto iterator{std::ranges::find_if(kKnownChainConfigs,
                                       [&identifier](const std::pair<std::string, const ChainConfig*>& pair) -> bool {
                                           return boost::iequals(pair.first, identifier);
                                       })};

    if (iterator == kKnownChainConfigs.end()) {
        return std::nullopt;
    }
    return std::pair(*iterator);
}

std::string lookup_known_chain_name(uint32_t identifier) noexcept {
    const auto chain{lookup_known_chain(identifier)};
    if (not chain.has_value()) return "unknown";
    return chain.value().first;
}

std::map<std::string, uint32_t> get_known_chains_map() noexcept {
    std::map<std::string, uint32_t> ret;
    std::ranges::for_each(kKnownChainConfigs, [&ret](const std::pair<std::string, const ChainConfig*>& pair) -> void {
        ret[pair.first] = pair.second->identifier_;
    });
    return ret;
}

}  // namespace addrcodec
