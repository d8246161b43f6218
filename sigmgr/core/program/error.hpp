// Copyright 2025 The Sigmgr Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string_view>

#include <sigmgr/core/common/decoding_result.hpp>

namespace sigmgr {

// Outcome of processing one instruction. Any value other than kOk aborts the whole batch.
enum class [[nodiscard]] ProgramError {
    kOk,  // All checks passed, writes may be committed

    kInvalidOperation,  // Request data is empty, has an unknown tag or a short payload

    // Account binding
    kNotEnoughAccountKeys,  // Fewer accounts than the operation requires
    kIncorrectProgramId,    // Instruction or record account belongs to another program
    kInvalidAccountData,    // Record account data has the wrong size

    // Signer group
    kAlreadyInitialized,  // SignerGroup version != 0

    // Valid signer
    kAlreadySignerInitialized,  // ValidSigner version != 0
    kUninitializedGroup,        // SignerGroup version == 0
    kUninitializedSigner,       // ValidSigner version == 0
    kWrongOwner,                // Claimed owner differs from SignerGroup owner
    kSignatureMissing,          // Claimed owner did not sign the batch
    kWrongSignerGroup,          // ValidSigner registered under another group

    // Signature validation
    kInvalidInstructionsSysvar,  // Introspection account is not the configured one or is unreadable
    kSecpInstructionMissing,     // No co-processor instruction right before the current one
    kMalformedOffsets,           // Offsets descriptor missing, truncated or pointing out of range
    kSignatureMismatch,          // Co-processor output differs from the claimed signature or address or message

    // Host
    kReadonlyDataModified,  // Instruction changed the data of an account not marked writable
    kConflictingWrites,     // Copies of an account listed more than once were changed differently
    kBatchTooLarge,         // Batch cannot be exposed through the instructions sysvar
};

std::string_view to_string(ProgramError error) noexcept;

//! \brief Maps a request decoding failure to the processor outcome
inline ProgramError request_error(DecodingError) noexcept { return ProgramError::kInvalidOperation; }

//! \brief Maps a record decoding failure to the processor outcome
inline ProgramError record_error(DecodingError) noexcept { return ProgramError::kInvalidAccountData; }

}  // namespace sigmgr
