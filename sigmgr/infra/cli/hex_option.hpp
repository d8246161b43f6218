// Copyright 2025 The Sigmgr Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

#include <CLI/CLI.hpp>

namespace sigmgr::cmd::common {

//! \brief Accepts a 0x-prefixed or bare hex string encoding exactly the given number of bytes
struct HexBytesValidator : public CLI::Validator {
    explicit HexBytesValidator(size_t size, bool allow_empty = false);
};

//! \brief Set up a required option holding a 32-byte identity as hex
void add_option_identity(CLI::App& cli, const std::string& name, std::string& identity, const std::string& description);

}  // namespace sigmgr::cmd::common
