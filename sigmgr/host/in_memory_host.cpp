// Copyright 2025 The Sigmgr Authors
// SPDX-License-Identifier: Apache-2.0

#include "in_memory_host.hpp"

#include <map>
#include <string>
#include <utility>
#include <vector>

#include <sigmgr/core/execution/instructions_sysvar.hpp>
#include <sigmgr/core/program/instruction.hpp>
#include <sigmgr/infra/common/ensure.hpp>
#include <sigmgr/infra/common/log.hpp>

namespace sigmgr {

void InMemoryHost::create_account(const Identity& key, size_t size) {
    put_account(key, config_.program_id, Bytes(size, 0));
}

void InMemoryHost::put_account(const Identity& key, const Identity& owner, Bytes data) {
    ensure(!accounts_.contains(key), [&]() { return "account already exists: " + identity_to_hex(key); });
    accounts_.emplace(key, StoredAccount{.owner = owner, .data = std::move(data)});
}

std::optional<Bytes> InMemoryHost::account_data(const Identity& key) const {
    const auto it{accounts_.find(key)};
    if (it == accounts_.end()) {
        return std::nullopt;
    }
    return it->second.data;
}

ExecutionResult InMemoryHost::execute(std::span<const Instruction> batch) {
    std::optional<Bytes> sysvar{serialize_instructions(batch)};
    if (!sysvar) {
        SIGMGR_WARN_M("Batch rejected", {"instructions", std::to_string(batch.size())});
        return {.error = ProgramError::kBatchTooLarge, .failed_instruction = std::nullopt};
    }

    Accounts working{accounts_};
    for (size_t i{0}; i < batch.size(); ++i) {
        store_current_index(*sysvar, static_cast<uint16_t>(i));
        const ProgramError error{run_instruction(batch[i], *sysvar, working)};
        if (error != ProgramError::kOk) {
            SIGMGR_DEBUG_M("Batch aborted", {"index", std::to_string(i), "error", std::string{to_string(error)}});
            return {.error = error, .failed_instruction = i};
        }
    }

    accounts_ = std::move(working);
    SIGMGR_TRACE_M("Batch committed", {"instructions", std::to_string(batch.size())});
    return {};
}

ProgramError InMemoryHost::run_instruction(const Instruction& instruction, ByteView sysvar, Accounts& working) const {
    if (instruction.program_id == config_.secp256k1_program_id) {
        SIGMGR_TRACE_M("Co-processor instruction accepted", {"data", std::to_string(instruction.data.size())});
        return ProgramError::kOk;
    }
    if (instruction.program_id != config_.program_id) {
        return ProgramError::kIncorrectProgramId;
    }

    if (log::test_verbosity(log::Level::kDebug)) {
        const auto decoded{decode_instruction(instruction.data)};
        SIGMGR_DEBUG_M("Instruction", {"name", decoded ? std::string{instruction_name(*decoded)} : "<invalid>"});
    }

    // A key listed more than once gets the union of the privileges of its metas
    std::map<Identity, AccountMeta> privileges;
    for (const AccountMeta& meta : instruction.accounts) {
        AccountMeta& granted{privileges.try_emplace(meta.key, meta).first->second};
        granted.is_signer |= meta.is_signer;
        granted.is_writable |= meta.is_writable;
    }

    std::vector<AccountInfo> infos;
    infos.reserve(instruction.accounts.size());
    for (const AccountMeta& meta : instruction.accounts) {
        const AccountMeta& granted{privileges.at(meta.key)};
        AccountInfo info{.key = meta.key, .is_signer = granted.is_signer, .is_writable = granted.is_writable};
        if (meta.key == config_.instructions_sysvar_id) {
            info.data = sysvar;
        } else if (const auto it{working.find(meta.key)}; it != working.end()) {
            info.owner = it->second.owner;
            info.data = it->second.data;
        }
        SIGMGR_TRACE_M("Account", {"info", info.to_string()});
        infos.push_back(std::move(info));
    }

    const ProgramError error{processor_.process(instruction.program_id, infos, instruction.data)};
    if (error != ProgramError::kOk) {
        return error;
    }

    // Changes are relative to the state before the instruction
    std::map<Identity, const Bytes*> written;
    for (const AccountInfo& info : infos) {
        const auto it{working.find(info.key)};
        if (it == working.end() || it->second.data == info.data) {
            continue;
        }
        if (!info.is_writable) {
            return ProgramError::kReadonlyDataModified;
        }
        const auto [prev, inserted]{written.emplace(info.key, &info.data)};
        if (!inserted && *prev->second != info.data) {
            return ProgramError::kConflictingWrites;
        }
    }
    for (const auto& [key, data] : written) {
        working.at(key).data = *data;
    }
    return ProgramError::kOk;
}

}  // namespace sigmgr
