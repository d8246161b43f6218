// Copyright 2025 The Sigmgr Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <span>

#include <evmc/evmc.hpp>

#include <sigmgr/core/common/bytes.hpp>
#include <sigmgr/core/program/config.hpp>
#include <sigmgr/core/program/error.hpp>
#include <sigmgr/core/program/instruction.hpp>
#include <sigmgr/core/types/account.hpp>
#include <sigmgr/core/types/signature_data.hpp>

namespace sigmgr {

struct InitSignerGroupAccounts {
    static constexpr size_t kCount{2};

    AccountInfo& signer_group;
    const AccountInfo& owner;
};

struct InitValidSignerAccounts {
    static constexpr size_t kCount{3};

    AccountInfo& valid_signer;
    const AccountInfo& signer_group;
    const AccountInfo& owner;
};

using ClearValidSignerAccounts = InitValidSignerAccounts;

struct ValidateSignatureAccounts {
    static constexpr size_t kCount{3};

    const AccountInfo& valid_signer;
    const AccountInfo& signer_group;
    const AccountInfo& instructions_sysvar;
};

//! \brief State-transition function of the signer group program
//! \details Every operation checks everything before writing anything: on any error the accounts are left untouched.
class Processor {
  public:
    explicit Processor(const ProgramConfig& config) : config_{config} {}

    //! \brief Decodes a request, binds its positional accounts and applies it
    ProgramError process(const Identity& program_id, std::span<AccountInfo> accounts, ByteView data) const;

    //! \brief Sets version and owner of an uninitialized signer group. The owner is assigned, not authenticated.
    ProgramError init_signer_group(const InitSignerGroupAccounts& accounts) const;

    //! \brief Registers eth_address under the signer group, on behalf of its owner
    ProgramError init_valid_signer(const InitValidSignerAccounts& accounts, const evmc::address& eth_address) const;

    //! \brief Revokes a valid signer, on behalf of the group owner. Only the version is reset.
    ProgramError clear_valid_signer(const ClearValidSignerAccounts& accounts) const;

    //! \brief Checks that the co-processor instruction right before this one recovered the registered address
    //! from the claimed signature over the claimed message
    //! \remarks Never writes
    ProgramError validate_signature(const ValidateSignatureAccounts& accounts,
                                    const SignatureData& signature_data) const;

    const ProgramConfig& config() const noexcept { return config_; }

  private:
    ProgramConfig config_;
};

}  // namespace sigmgr
