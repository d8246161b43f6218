// Copyright 2025 The Sigmgr Authors
// SPDX-License-Identifier: Apache-2.0

#include "processor.hpp"

#include <sigmgr/core/common/overloaded.hpp>
#include <sigmgr/core/execution/instructions_sysvar.hpp>
#include <sigmgr/core/types/secp256k1_instruction.hpp>
#include <sigmgr/core/types/secp_signature_offsets.hpp>
#include <sigmgr/core/types/signer_group.hpp>
#include <sigmgr/core/types/valid_signer.hpp>

namespace sigmgr {

namespace {

    // Loads a record from an account owned by the program
    template <class Record>
    ProgramError load_record(const Identity& program_id, const AccountInfo& account, Record& record) noexcept {
        if (account.owner != program_id) {
            return ProgramError::kIncorrectProgramId;
        }
        if (const DecodingResult res{decode(account.data, record)}; !res) {
            return record_error(res.error());
        }
        return ProgramError::kOk;
    }

    // Returns size bytes at offset of the data of the instruction at given index in the batch
    tl::expected<Bytes, ProgramError> extract(ByteView sysvar, uint8_t instruction_index, size_t offset, size_t size) {
        const auto instruction{load_instruction_at(sysvar, instruction_index)};
        if (!instruction) {
            return tl::unexpected{ProgramError::kMalformedOffsets};
        }
        const Bytes& data{instruction->data};
        if (offset > data.size() || size > data.size() - offset) {
            return tl::unexpected{ProgramError::kMalformedOffsets};
        }
        return data.substr(offset, size);
    }

}  // namespace

ProgramError Processor::process(const Identity& program_id, std::span<AccountInfo> accounts, ByteView data) const {
    if (program_id != config_.program_id) {
        return ProgramError::kIncorrectProgramId;
    }

    const auto instruction{decode_instruction(data)};
    if (!instruction) {
        return request_error(instruction.error());
    }

    return std::visit(
        Overloaded{
            [&](const InitSignerGroup&) {
                if (accounts.size() < InitSignerGroupAccounts::kCount) {
                    return ProgramError::kNotEnoughAccountKeys;
                }
                return init_signer_group({.signer_group = accounts[0], .owner = accounts[1]});
            },
            [&](const InitValidSigner& x) {
                if (accounts.size() < InitValidSignerAccounts::kCount) {
                    return ProgramError::kNotEnoughAccountKeys;
                }
                return init_valid_signer({.valid_signer = accounts[0], .signer_group = accounts[1], .owner = accounts[2]},
                                         x.eth_address);
            },
            [&](const ClearValidSigner&) {
                if (accounts.size() < ClearValidSignerAccounts::kCount) {
                    return ProgramError::kNotEnoughAccountKeys;
                }
                return clear_valid_signer({.valid_signer = accounts[0], .signer_group = accounts[1], .owner = accounts[2]});
            },
            [&](const ValidateSignature& x) {
                if (accounts.size() < ValidateSignatureAccounts::kCount) {
                    return ProgramError::kNotEnoughAccountKeys;
                }
                return validate_signature(
                    {.valid_signer = accounts[0], .signer_group = accounts[1], .instructions_sysvar = accounts[2]},
                    x.signature_data);
            },
        },
        *instruction);
}

ProgramError Processor::init_signer_group(const InitSignerGroupAccounts& accounts) const {
    SignerGroup group;
    if (const ProgramError err{load_record(config_.program_id, accounts.signer_group, group)}; err != ProgramError::kOk) {
        return err;
    }
    if (group.is_initialized()) {
        return ProgramError::kAlreadyInitialized;
    }

    group.version = SignerGroup::kCurrentVersion;
    group.owner = accounts.owner.key;
    encode(accounts.signer_group.data, group);
    return ProgramError::kOk;
}

ProgramError Processor::init_valid_signer(const InitValidSignerAccounts& accounts,
                                          const evmc::address& eth_address) const {
    ValidSigner signer;
    if (const ProgramError err{load_record(config_.program_id, accounts.valid_signer, signer)}; err != ProgramError::kOk) {
        return err;
    }
    SignerGroup group;
    if (const ProgramError err{load_record(config_.program_id, accounts.signer_group, group)}; err != ProgramError::kOk) {
        return err;
    }

    if (!group.is_initialized()) {
        return ProgramError::kUninitializedGroup;
    }
    if (signer.is_initialized()) {
        return ProgramError::kAlreadySignerInitialized;
    }
    if (group.owner != accounts.owner.key) {
        return ProgramError::kWrongOwner;
    }
    if (!accounts.owner.is_signer) {
        return ProgramError::kSignatureMissing;
    }

    signer.version = ValidSigner::kCurrentVersion;
    signer.signer_group = accounts.signer_group.key;
    signer.eth_address = eth_address;
    encode(accounts.valid_signer.data, signer);
    return ProgramError::kOk;
}

ProgramError Processor::clear_valid_signer(const ClearValidSignerAccounts& accounts) const {
    ValidSigner signer;
    if (const ProgramError err{load_record(config_.program_id, accounts.valid_signer, signer)}; err != ProgramError::kOk) {
        return err;
    }
    SignerGroup group;
    if (const ProgramError err{load_record(config_.program_id, accounts.signer_group, group)}; err != ProgramError::kOk) {
        return err;
    }

    if (!group.is_initialized()) {
        return ProgramError::kUninitializedGroup;
    }
    if (group.owner != accounts.owner.key) {
        return ProgramError::kWrongOwner;
    }
    if (!accounts.owner.is_signer) {
        return ProgramError::kSignatureMissing;
    }
    // An unregistered signer has no group to match
    if (signer.is_initialized() && signer.signer_group != accounts.signer_group.key) {
        return ProgramError::kWrongSignerGroup;
    }

    signer.version = 0;
    encode(accounts.valid_signer.data, signer);
    return ProgramError::kOk;
}

ProgramError Processor::validate_signature(const ValidateSignatureAccounts& accounts,
                                           const SignatureData& signature_data) const {
    ValidSigner signer;
    if (const ProgramError err{load_record(config_.program_id, accounts.valid_signer, signer)}; err != ProgramError::kOk) {
        return err;
    }
    SignerGroup group;
    if (const ProgramError err{load_record(config_.program_id, accounts.signer_group, group)}; err != ProgramError::kOk) {
        return err;
    }

    if (!signer.is_initialized()) {
        return ProgramError::kUninitializedSigner;
    }
    if (signer.signer_group != accounts.signer_group.key) {
        return ProgramError::kWrongSignerGroup;
    }

    // Locate the co-processor instruction
    if (accounts.instructions_sysvar.key != config_.instructions_sysvar_id) {
        return ProgramError::kInvalidInstructionsSysvar;
    }
    const ByteView sysvar{accounts.instructions_sysvar.data};
    const auto current_index{load_current_index(sysvar)};
    if (!current_index) {
        return ProgramError::kInvalidInstructionsSysvar;
    }
    if (*current_index == 0) {
        return ProgramError::kSecpInstructionMissing;
    }
    const auto secp_instruction{load_instruction_at(sysvar, *current_index - 1u)};
    if (!secp_instruction) {
        return ProgramError::kInvalidInstructionsSysvar;
    }
    if (secp_instruction->program_id != config_.secp256k1_program_id) {
        return ProgramError::kSecpInstructionMissing;
    }

    // Only the first descriptor is considered
    const Bytes& secp_data{secp_instruction->data};
    if (secp_data.size() < secp256k1_instruction::kAddressOffset || secp_data[0] == 0) {
        return ProgramError::kMalformedOffsets;
    }
    SecpSignatureOffsets offsets;
    if (!decode(ByteView{secp_data}.substr(secp256k1_instruction::kOffsetsStart), offsets)) {
        return ProgramError::kMalformedOffsets;
    }

    const auto signature{extract(sysvar, offsets.signature_instruction_index, offsets.signature_offset,
                                 kSignatureLength)};
    if (!signature) {
        return signature.error();
    }
    const auto eth_address{extract(sysvar, offsets.eth_address_instruction_index, offsets.eth_address_offset,
                                   kAddressLength)};
    if (!eth_address) {
        return eth_address.error();
    }
    const auto message{extract(sysvar, offsets.message_instruction_index, offsets.message_data_offset,
                               offsets.message_data_size)};
    if (!message) {
        return message.error();
    }

    if (ByteView{*signature} != ByteView{signature_data.signature} ||
        ByteView{*eth_address} != ByteView{signer.eth_address.bytes} ||
        *message != signature_data.message) {
        return ProgramError::kSignatureMismatch;
    }
    return ProgramError::kOk;
}

}  // namespace sigmgr
