// Copyright 2025 The Sigmgr Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <map>
#include <optional>
#include <span>

#include <sigmgr/core/common/bytes.hpp>
#include <sigmgr/core/program/config.hpp>
#include <sigmgr/core/program/error.hpp>
#include <sigmgr/core/program/processor.hpp>
#include <sigmgr/core/types/account.hpp>

namespace sigmgr {

//! \brief Outcome of a batch: on failure, the index of the rejected instruction and its error
struct ExecutionResult {
    ProgramError error{ProgramError::kOk};
    std::optional<size_t> failed_instruction;

    bool ok() const noexcept { return error == ProgramError::kOk; }
};

//! \brief Keyed account storage executing batches of instructions atomically
//! \details Instructions for the secp256k1 co-processor are accepted as already verified.
//! Accounts referenced by a batch but never created are seen as empty and not owned by the program.
class InMemoryHost {
  public:
    explicit InMemoryHost(const ProgramConfig& config) : config_{config}, processor_{config} {}

    //! \brief Allocates a zero-filled account owned by the program
    //! \throws std::logic_error if an account with the same key already exists
    void create_account(const Identity& key, size_t size);

    //! \brief Allocates an account with arbitrary owner and content
    //! \throws std::logic_error if an account with the same key already exists
    void put_account(const Identity& key, const Identity& owner, Bytes data);

    std::optional<Bytes> account_data(const Identity& key) const;

    //! \brief Runs all instructions in order, committing every write on success and none on failure
    ExecutionResult execute(std::span<const Instruction> batch);

    const ProgramConfig& config() const noexcept { return config_; }

  private:
    struct StoredAccount {
        Identity owner{};
        Bytes data;
    };
    using Accounts = std::map<Identity, StoredAccount>;

    ProgramError run_instruction(const Instruction& instruction, ByteView sysvar, Accounts& working) const;

    ProgramConfig config_;
    Processor processor_;
    Accounts accounts_;
};

}  // namespace sigmgr
