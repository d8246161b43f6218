// Copyright 2025 The Sigmgr Authors
// SPDX-License-Identifier: Apache-2.0

#include "secp_signature_offsets.hpp"

namespace sigmgr {

namespace {

    // Remainder first, quotient second
    void append_split(Bytes& to, uint16_t value) {
        if (value >= 256) {
            to.push_back(static_cast<uint8_t>(value % 256));
            to.push_back(static_cast<uint8_t>(value / 256));
        } else {
            to.push_back(static_cast<uint8_t>(value));
            to.push_back(0);
        }
    }

    uint16_t read_split(ByteView from, size_t pos) noexcept {
        return static_cast<uint16_t>(from[pos] + from[pos + 1] * 256);
    }

}  // namespace

void encode(Bytes& to, const SecpSignatureOffsets& offsets) {
    append_split(to, offsets.signature_offset);
    to.push_back(offsets.signature_instruction_index);
    append_split(to, offsets.eth_address_offset);
    to.push_back(offsets.eth_address_instruction_index);
    append_split(to, offsets.message_data_offset);
    append_split(to, offsets.message_data_size);
    to.push_back(offsets.message_instruction_index);
}

DecodingResult decode(ByteView from, SecpSignatureOffsets& to) noexcept {
    if (from.size() < SecpSignatureOffsets::kSerializedSize) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }
    to.signature_offset = read_split(from, 0);
    to.signature_instruction_index = from[2];
    to.eth_address_offset = read_split(from, 3);
    to.eth_address_instruction_index = from[5];
    to.message_data_offset = read_split(from, 6);
    to.message_data_size = read_split(from, 8);
    to.message_instruction_index = from[10];
    return {};
}

}  // namespace sigmgr
