// Copyright 2025 The Sigmgr Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <ostream>

#include <nlohmann/json.hpp>

#include <sigmgr/core/types/identity.hpp>

namespace sigmgr {

using namespace evmc::literals;

//! Well-known identity of the secp256k1 recovery co-processor (KeccakSecp256k11111111111111111111111111111)
inline constexpr Identity kSecp256k1ProgramId{
    0x04c6fc20f050ccf05584d7211c9f8cf59ec14785bb166a1e2830e81220000000_bytes32};

//! Well-known identity of the instructions introspection account (Sysvar1nstructions1111111111111111111111111)
inline constexpr Identity kInstructionsSysvarId{
    0x06a7d517187bd16635dad40455fdc2c0c124c68f215675a5dbbacb5f08000000_bytes32};

//! \brief Identities injected into the program at construction
struct ProgramConfig {
    //! \brief Identity of this program: record accounts must be owned by it
    Identity program_id{};

    //! \brief Identity of the co-processor whose output ValidateSignature cross-checks
    Identity secp256k1_program_id{kSecp256k1ProgramId};

    //! \brief Identity of the account exposing the instructions of the current batch
    Identity instructions_sysvar_id{kInstructionsSysvarId};

    nlohmann::json to_json() const noexcept;

    //! \brief Parses a config from JSON
    //! \return std::nullopt if programId is missing or any identity is not 32-byte hex
    static std::optional<ProgramConfig> from_json(const nlohmann::json& json) noexcept;

    friend bool operator==(const ProgramConfig&, const ProgramConfig&) = default;
};

std::ostream& operator<<(std::ostream& out, const ProgramConfig& config);

}  // namespace sigmgr
