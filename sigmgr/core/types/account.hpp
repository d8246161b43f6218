// Copyright 2025 The Sigmgr Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>
#include <vector>

#include <sigmgr/core/common/bytes.hpp>
#include <sigmgr/core/types/identity.hpp>

namespace sigmgr {

//! \brief Reference to an account from an instruction, with the privileges granted to it
struct AccountMeta {
    Identity key{};
    bool is_signer{false};
    bool is_writable{false};

    friend bool operator==(const AccountMeta&, const AccountMeta&) = default;
};

//! \brief A single request of a batch, addressed to a program
struct Instruction {
    Identity program_id{};
    std::vector<AccountMeta> accounts;
    Bytes data;

    friend bool operator==(const Instruction&, const Instruction&) = default;
};

//! \brief View of an account as handed by the host to a program for one instruction
struct AccountInfo {
    Identity key{};
    //! Program allowed to modify data
    Identity owner{};
    //! Whether the batch carries a valid signature by key
    bool is_signer{false};
    bool is_writable{false};
    Bytes data;

    std::string to_string() const;
};

}  // namespace sigmgr
