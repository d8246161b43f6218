// Copyright 2025 The Sigmgr Authors
// SPDX-License-Identifier: Apache-2.0

#include "hex_option.hpp"

#include <optional>

#include <sigmgr/core/common/base.hpp>
#include <sigmgr/core/common/util.hpp>

namespace sigmgr::cmd::common {

HexBytesValidator::HexBytesValidator(size_t size, bool allow_empty) {
    name_ = "HEX" + std::to_string(size);
    func_ = [size, allow_empty](const std::string& value) -> std::string {
        if (value.empty() && allow_empty) {
            return {};
        }
        const std::optional<Bytes> bytes{from_hex(value)};
        if (!bytes) {
            return "Value " + value + " is not a valid hex string";
        }
        if (bytes->size() != size) {
            return "Value " + value + " must encode " + std::to_string(size) + " bytes";
        }
        return {};
    };
}

void add_option_identity(CLI::App& cli, const std::string& name, std::string& identity, const std::string& description) {
    cli.add_option(name, identity, description)
        ->required()
        ->check(HexBytesValidator{kIdentityLength});
}

}  // namespace sigmgr::cmd::common
