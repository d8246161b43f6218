// Copyright 2025 The Sigmgr Authors
// SPDX-License-Identifier: Apache-2.0

#include "common.hpp"

#include <fstream>
#include <map>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include <sigmgr/core/common/base.hpp>

#include "hex_option.hpp"

namespace sigmgr::cmd::common {

void add_logging_options(CLI::App& cli, log::Settings& log_settings) {
    std::map<std::string, log::Level> level_mapping{
        {"critical", log::Level::kCritical},
        {"error", log::Level::kError},
        {"warning", log::Level::kWarning},
        {"info", log::Level::kInfo},
        {"debug", log::Level::kDebug},
        {"trace", log::Level::kTrace},
    };
    auto& log_opts = *cli.add_option_group("Log", "Logging options");
    log_opts.add_option("--log.verbosity", log_settings.log_verbosity, "Sets log verbosity")
        ->check(CLI::Range(log::Level::kCritical, log::Level::kTrace))
        ->transform(CLI::Transformer(level_mapping, CLI::ignore_case))
        ->default_val(log::Level::kWarning);
    log_opts.add_flag("--log.stdout", log_settings.log_std_out, "Outputs to std::out instead of std::err");
    log_opts.add_flag("--log.nocolor", log_settings.log_nocolor, "Disable colors on log lines");
    log_opts.add_flag("--log.utc", log_settings.log_utc, "Prints log timings in UTC");
    log_opts.add_option("--log.file", log_settings.log_file, "Tee all log lines to given file name");
}

void add_option_config_file(CLI::App& cli, std::optional<std::filesystem::path>& config_file) {
    cli.add_option("--config", config_file, "Path to a JSON file holding programId, secp256k1ProgramId and instructionsSysvarId")
        ->check(CLI::ExistingFile);
}

void add_option_program_id(CLI::App& cli, std::string& program_id) {
    cli.add_option("--program-id", program_id, "Identity of the signer group program as hex")
        ->check(HexBytesValidator{kIdentityLength, /*allow_empty=*/true});
}

ProgramConfig read_program_config(const std::filesystem::path& config_file) {
    std::ifstream in{config_file};
    if (!in) {
        throw std::runtime_error("Could not open file " + config_file.string());
    }
    const auto json = nlohmann::json::parse(in, /*cb=*/nullptr, /*allow_exceptions=*/false);
    std::optional<ProgramConfig> config{ProgramConfig::from_json(json)};
    if (!config) {
        throw std::runtime_error("Invalid program config in " + config_file.string());
    }
    return *config;
}

}  // namespace sigmgr::cmd::common
