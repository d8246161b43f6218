// Copyright 2025 The Sigmgr Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>

#include <evmc/evmc.hpp>

#include <sigmgr/core/program/config.hpp>
#include <sigmgr/core/types/account.hpp>
#include <sigmgr/core/types/signature_data.hpp>

// Client-side builders. Accounts are listed in the order the processor binds them.

namespace sigmgr {

//! Accounts: [signer_group (writable), owner]
Instruction make_init_signer_group(const ProgramConfig& config, const Identity& signer_group, const Identity& owner);

//! Accounts: [valid_signer (writable), signer_group, owner (signer)]
Instruction make_init_valid_signer(const ProgramConfig& config, const Identity& valid_signer,
                                   const Identity& signer_group, const Identity& owner,
                                   const evmc::address& eth_address);

//! Accounts: [valid_signer (writable), signer_group, owner (signer)]
Instruction make_clear_valid_signer(const ProgramConfig& config, const Identity& valid_signer,
                                    const Identity& signer_group, const Identity& owner);

//! Accounts: [valid_signer, signer_group, instructions sysvar]
Instruction make_validate_signature(const ProgramConfig& config, const Identity& valid_signer,
                                    const Identity& signer_group, const SignatureData& signature_data);

//! \brief Builds the co-processor instruction proving that eth_address signed the message
//! \param instruction_index position of the returned instruction within its batch
//! \return std::nullopt if the message is too long for the co-processor
std::optional<Instruction> make_secp256k1_instruction(const ProgramConfig& config, const evmc::address& eth_address,
                                                      const SignatureData& signature_data, uint8_t instruction_index);

}  // namespace sigmgr
