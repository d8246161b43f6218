// Copyright 2025 The Sigmgr Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <limits>
#include <optional>

#include <evmc/evmc.hpp>

#include <sigmgr/core/common/base.hpp>
#include <sigmgr/core/common/bytes.hpp>
#include <sigmgr/core/types/secp_signature_offsets.hpp>
#include <sigmgr/core/types/signature_data.hpp>

// Data layout of the secp256k1 co-processor instruction:
// [count: u8][count x SecpSignatureOffsets]
// then, for a single signature: [eth_address: 20][signature: 64][recovery_id: 1][message]

namespace sigmgr::secp256k1_instruction {

inline constexpr size_t kCountSize{1};
inline constexpr size_t kOffsetsStart{kCountSize};
inline constexpr size_t kAddressOffset{kOffsetsStart + SecpSignatureOffsets::kSerializedSize};
inline constexpr size_t kSignatureOffset{kAddressOffset + kAddressLength};
inline constexpr size_t kRecoveryIdOffset{kSignatureOffset + kSignatureLength};
inline constexpr size_t kMessageOffset{kRecoveryIdOffset + 1};
inline constexpr size_t kMaxMessageSize{std::numeric_limits<uint16_t>::max()};

//! \brief Builds co-processor data for one signature, with every offset pointing into the same instruction
//! \param instruction_index index within the batch of the instruction that will carry the data
//! \return std::nullopt if the message does not fit a 16-bit size
std::optional<Bytes> build_data(const evmc::address& eth_address, const SignatureData& signature_data,
                                uint8_t instruction_index);

}  // namespace sigmgr::secp256k1_instruction
