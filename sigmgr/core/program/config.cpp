// Copyright 2025 The Sigmgr Authors
// SPDX-License-Identifier: Apache-2.0

#include "config.hpp"

#include <string>

namespace sigmgr {

static constexpr const char* kProgramId{"programId"};
static constexpr const char* kSecp256k1ProgramIdKey{"secp256k1ProgramId"};
static constexpr const char* kInstructionsSysvarIdKey{"instructionsSysvarId"};

static bool read_identity_member(const nlohmann::json& json, const char* key, Identity& target) {
    if (!json.contains(key)) {
        return true;
    }
    const auto& value{json[key]};
    if (!value.is_string()) {
        return false;
    }
    const std::optional<Identity> identity{hex_to_identity(value.get<std::string>())};
    if (!identity) {
        return false;
    }
    target = *identity;
    return true;
}

nlohmann::json ProgramConfig::to_json() const noexcept {
    nlohmann::json ret;
    ret[kProgramId] = identity_to_hex(program_id);
    ret[kSecp256k1ProgramIdKey] = identity_to_hex(secp256k1_program_id);
    ret[kInstructionsSysvarIdKey] = identity_to_hex(instructions_sysvar_id);
    return ret;
}

std::optional<ProgramConfig> ProgramConfig::from_json(const nlohmann::json& json) noexcept {
    if (json.is_discarded() || !json.is_object() || !json.contains(kProgramId)) {
        return std::nullopt;
    }

    ProgramConfig config{};
    if (!read_identity_member(json, kProgramId, config.program_id) ||
        !read_identity_member(json, kSecp256k1ProgramIdKey, config.secp256k1_program_id) ||
        !read_identity_member(json, kInstructionsSysvarIdKey, config.instructions_sysvar_id)) {
        return std::nullopt;
    }
    return config;
}

std::ostream& operator<<(std::ostream& out, const ProgramConfig& config) {
    return out << config.to_json();
}

}  // namespace sigmgr
