// Copyright 2025 The Sigmgr Authors
// SPDX-License-Identifier: Apache-2.0

#include "secp256k1_instruction.hpp"

namespace sigmgr::secp256k1_instruction {

std::optional<Bytes> build_data(const evmc::address& eth_address, const SignatureData& signature_data,
                                uint8_t instruction_index) {
    if (signature_data.message.size() > kMaxMessageSize) {
        return std::nullopt;
    }

    const SecpSignatureOffsets offsets{
        .signature_offset = kSignatureOffset,
        .signature_instruction_index = instruction_index,
        .eth_address_offset = kAddressOffset,
        .eth_address_instruction_index = instruction_index,
        .message_data_offset = kMessageOffset,
        .message_data_size = static_cast<uint16_t>(signature_data.message.size()),
        .message_instruction_index = instruction_index,
    };

    Bytes data;
    data.reserve(kMessageOffset + signature_data.message.size());
    data.push_back(1);
    encode(data, offsets);
    data.append(eth_address.bytes, kAddressLength);
    data.append(signature_data.signature.data(), kSignatureLength);
    data.push_back(signature_data.recovery_id);
    data.append(signature_data.message);
    return data;
}

}  // namespace sigmgr::secp256k1_instruction
