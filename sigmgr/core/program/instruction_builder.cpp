// Copyright 2025 The Sigmgr Authors
// SPDX-License-Identifier: Apache-2.0

#include "instruction_builder.hpp"

#include <sigmgr/core/program/instruction.hpp>
#include <sigmgr/core/types/secp256k1_instruction.hpp>

namespace sigmgr {

Instruction make_init_signer_group(const ProgramConfig& config, const Identity& signer_group, const Identity& owner) {
    return Instruction{
        .program_id = config.program_id,
        .accounts = {
            {.key = signer_group, .is_signer = false, .is_writable = true},
            {.key = owner, .is_signer = false, .is_writable = false},
        },
        .data = encode(InitSignerGroup{}),
    };
}

Instruction make_init_valid_signer(const ProgramConfig& config, const Identity& valid_signer,
                                   const Identity& signer_group, const Identity& owner,
                                   const evmc::address& eth_address) {
    return Instruction{
        .program_id = config.program_id,
        .accounts = {
            {.key = valid_signer, .is_signer = false, .is_writable = true},
            {.key = signer_group, .is_signer = false, .is_writable = false},
            {.key = owner, .is_signer = true, .is_writable = false},
        },
        .data = encode(InitValidSigner{.eth_address = eth_address}),
    };
}

Instruction make_clear_valid_signer(const ProgramConfig& config, const Identity& valid_signer,
                                    const Identity& signer_group, const Identity& owner) {
    return Instruction{
        .program_id = config.program_id,
        .accounts = {
            {.key = valid_signer, .is_signer = false, .is_writable = true},
            {.key = signer_group, .is_signer = false, .is_writable = false},
            {.key = owner, .is_signer = true, .is_writable = false},
        },
        .data = encode(ClearValidSigner{}),
    };
}

Instruction make_validate_signature(const ProgramConfig& config, const Identity& valid_signer,
                                    const Identity& signer_group, const SignatureData& signature_data) {
    return Instruction{
        .program_id = config.program_id,
        .accounts = {
            {.key = valid_signer, .is_signer = false, .is_writable = false},
            {.key = signer_group, .is_signer = false, .is_writable = false},
            {.key = config.instructions_sysvar_id, .is_signer = false, .is_writable = false},
        },
        .data = encode(ValidateSignature{.signature_data = signature_data}),
    };
}

std::optional<Instruction> make_secp256k1_instruction(const ProgramConfig& config, const evmc::address& eth_address,
                                                      const SignatureData& signature_data, uint8_t instruction_index) {
    std::optional<Bytes> data{secp256k1_instruction::build_data(eth_address, signature_data, instruction_index)};
    if (!data) {
        return std::nullopt;
    }
    return Instruction{
        .program_id = config.secp256k1_program_id,
        .accounts = {},
        .data = std::move(*data),
    };
}

}  // namespace sigmgr
