// Copyright 2025 The Sigmgr Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <CLI/CLI.hpp>

#include <sigmgr/core/program/config.hpp>
#include <sigmgr/infra/common/log.hpp>

namespace sigmgr::cmd::common {

//! \brief Set up options to populate log settings after cli.parse()
void add_logging_options(CLI::App& cli, log::Settings& log_settings);

//! \brief Set up option for the path of a JSON program config file
void add_option_config_file(CLI::App& cli, std::optional<std::filesystem::path>& config_file);

//! \brief Set up option for the program identity, overriding the one in the config file
void add_option_program_id(CLI::App& cli, std::string& program_id);

//! \brief Reads a program config from a JSON file
//! \throws std::runtime_error if the file cannot be read or does not hold a valid config
ProgramConfig read_program_config(const std::filesystem::path& config_file);

}  // namespace sigmgr::cmd::common
