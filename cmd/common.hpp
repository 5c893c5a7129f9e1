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
#include <optional>
#include <string>

#include <CLI/CLI.hpp>

#include <core/chain/config.hpp>

#include <infra/common/log.hpp>

namespace addrcodec::cmd {

//! \brief Settings shared by all addrtool subcommands
struct CodecSettings {
    log::Settings log{};                             // Logging settings
    uint32_t network_id{kMainNetConfig.identifier_};  // Identifier of a known chain
    std::string chain_config_file{};                 // Optional JSON file overriding the known chain
    std::optional<uint32_t> version{};               // Overrides the chain address version
    std::optional<uint32_t> max_version{};           // Overrides the chain max accepted version
};

//! \brief Set up options to populate log settings after cli.parse()
void add_logging_options(CLI::App& cli, log::Settings& log_settings);

//! \brief Set up options selecting the chain parameters after cli.parse()
void add_chain_options(CLI::App& cli, CodecSettings& settings);

//! \brief Returns the effective chain config: the selected known chain (or the one loaded from file)
//! with command line overrides applied
//! \throws std::invalid_argument when the chain cannot be resolved
ChainConfig resolve_chain_config(const CodecSettings& settings);

//! \brief Validates an hex string, optionally of an exact number of bytes
struct HexValidator : public CLI::Validator {
    explicit HexValidator(std::optional<size_t> expected_size = std::nullopt);
};

}  // namespace addrcodec::cmd
