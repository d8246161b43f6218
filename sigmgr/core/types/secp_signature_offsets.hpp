// Copyright 2025 The Sigmgr Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>

#include <sigmgr/core/common/bytes.hpp>
#include <sigmgr/core/common/decoding_result.hpp>

namespace sigmgr {

//! \brief Descriptor locating the secp256k1 co-processor's inputs/outputs within the batch
//! \details Serialized layout (11 bytes):
//! [signature_offset: 2][signature_instruction_index: 1]
//! [eth_address_offset: 2][eth_address_instruction_index: 1]
//! [message_data_offset: 2][message_data_size: 2][message_instruction_index: 1]
//! Each 16-bit field is split as (value % 256, value / 256).
struct SecpSignatureOffsets {
    static constexpr size_t kSerializedSize{11};

    uint16_t signature_offset{0};
    uint8_t signature_instruction_index{0};
    uint16_t eth_address_offset{0};
    uint8_t eth_address_instruction_index{0};
    uint16_t message_data_offset{0};
    uint16_t message_data_size{0};
    uint8_t message_instruction_index{0};

    friend bool operator==(const SecpSignatureOffsets&, const SecpSignatureOffsets&) = default;
};

//! \brief Appends the 11-byte serialized form of the descriptor to `to`
void encode(Bytes& to, const SecpSignatureOffsets& offsets);

//! \brief Reads a descriptor from the first 11 bytes of `from`
//! \remarks Trailing bytes are allowed since the descriptor is embedded in the co-processor data
DecodingResult decode(ByteView from, SecpSignatureOffsets& to) noexcept;

}  // namespace sigmgr
