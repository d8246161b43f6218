// Copyright 2025 The Sigmgr Authors
// SPDX-License-Identifier: Apache-2.0

#include "instruction_builder.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sigmgr/core/program/instruction.hpp>
#include <sigmgr/core/types/secp256k1_instruction.hpp>

namespace sigmgr {

static constexpr auto kProgram{0x5aee45e62e23555c3cdcedda5ed5f8c436c9898a2f263ed4e035c7b9e4dbc08c_bytes32};
static constexpr auto kGroup{0x0000000000000000000000000000000000000000000000000000000000000001_bytes32};
static constexpr auto kOwner{0x0000000000000000000000000000000000000000000000000000000000000002_bytes32};
static constexpr auto kSigner{0x0000000000000000000000000000000000000000000000000000000000000003_bytes32};
static constexpr auto kAddress{0x1111111111111111111111111111111111111111_address};

TEST_CASE("Build InitSignerGroup") {
    const ProgramConfig config{.program_id = kProgram};
    const Instruction instruction{make_init_signer_group(config, kGroup, kOwner)};
    CHECK(instruction.program_id == kProgram);
    REQUIRE(instruction.accounts.size() == 2);
    CHECK(instruction.accounts[0] == AccountMeta{.key = kGroup, .is_signer = false, .is_writable = true});
    CHECK(instruction.accounts[1] == AccountMeta{.key = kOwner, .is_signer = false, .is_writable = false});
    CHECK(decode_instruction(instruction.data) == SignerInstruction{InitSignerGroup{}});
}

TEST_CASE("Build InitValidSigner and ClearValidSigner") {
    const ProgramConfig config{.program_id = kProgram};

    const Instruction init{make_init_valid_signer(config, kSigner, kGroup, kOwner, kAddress)};
    REQUIRE(init.accounts.size() == 3);
    CHECK(init.accounts[0] == AccountMeta{.key = kSigner, .is_signer = false, .is_writable = true});
    CHECK(init.accounts[1].key == kGroup);
    CHECK(init.accounts[2] == AccountMeta{.key = kOwner, .is_signer = true, .is_writable = false});
    CHECK(decode_instruction(init.data) == SignerInstruction{InitValidSigner{.eth_address = kAddress}});

    const Instruction clear{make_clear_valid_signer(config, kSigner, kGroup, kOwner)};
    CHECK(clear.accounts == init.accounts);
    CHECK(decode_instruction(clear.data) == SignerInstruction{ClearValidSigner{}});
}

TEST_CASE("Build ValidateSignature") {
    const ProgramConfig config{.program_id = kProgram};
    const SignatureData signature_data{.recovery_id = 0, .message = Bytes{'h', 'i'}};

    const Instruction instruction{make_validate_signature(config, kSigner, kGroup, signature_data)};
    REQUIRE(instruction.accounts.size() == 3);
    CHECK_FALSE(instruction.accounts[0].is_writable);
    CHECK(instruction.accounts[2].key == kInstructionsSysvarId);
    CHECK(decode_instruction(instruction.data) == SignerInstruction{ValidateSignature{.signature_data = signature_data}});
}

TEST_CASE("Build co-processor instruction") {
    const ProgramConfig config{.program_id = kProgram};
    const SignatureData signature_data{.recovery_id = 0, .message = Bytes{'h', 'i'}};

    const std::optional<Instruction> instruction{make_secp256k1_instruction(config, kAddress, signature_data, 0)};
    REQUIRE(instruction);
    CHECK(instruction->program_id == kSecp256k1ProgramId);
    CHECK(instruction->accounts.empty());
    CHECK(instruction->data.size() == secp256k1_instruction::kMessageOffset + 2);

    SignatureData too_long;
    too_long.message.resize(secp256k1_instruction::kMaxMessageSize + 1);
    CHECK_FALSE(make_secp256k1_instruction(config, kAddress, too_long, 0));
}

}  // namespace sigmgr
