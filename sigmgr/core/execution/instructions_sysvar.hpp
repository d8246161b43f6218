// Copyright 2025 The Sigmgr Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <span>

#include <tl/expected.hpp>

#include <sigmgr/core/common/bytes.hpp>
#include <sigmgr/core/common/decoding_result.hpp>
#include <sigmgr/core/types/account.hpp>

/*
Serialized form of a batch, exposed to programs through the instructions sysvar account:

u16 LE  number of instructions n
u16 LE  byte offset of instruction i, for i < n
for each instruction:
    u16 LE  number of accounts
    per account: u8 flags (bit 0 signer, bit 1 writable), 32-byte key
    32-byte program id
    u16 LE  data length, data
u16 LE  index of the currently executing instruction
*/

namespace sigmgr {

inline constexpr uint8_t kAccountSignerFlag{0x01};
inline constexpr uint8_t kAccountWritableFlag{0x02};

//! \brief Serializes a batch, with the current instruction index set to 0
//! \return std::nullopt if the batch, an account list or an instruction data does not fit 16-bit sizes
std::optional<Bytes> serialize_instructions(std::span<const Instruction> instructions);

//! \brief Overwrites the trailing current instruction index
//! \pre data.size() >= 2
void store_current_index(Bytes& data, uint16_t index);

tl::expected<uint16_t, DecodingError> load_current_index(ByteView data) noexcept;

//! \brief Reads back the instruction at given index of the batch
//! \return kOutOfRange if index is not below the number of instructions, kInputTooShort on truncated data
tl::expected<Instruction, DecodingError> load_instruction_at(ByteView data, size_t index);

}  // namespace sigmgr
