// Copyright 2025 The Sigmgr Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <string_view>
#include <variant>

#include <evmc/evmc.hpp>
#include <tl/expected.hpp>

#include <sigmgr/core/common/bytes.hpp>
#include <sigmgr/core/common/decoding_result.hpp>
#include <sigmgr/core/types/signature_data.hpp>

// Request wire format: [tag: u8][payload]
//  0 InitSignerGroup    no payload
//  1 InitValidSigner    eth_address (20)
//  2 ClearValidSigner   no payload
//  3 ValidateSignature  signature (64) recovery_id (1) message (rest of the buffer)
// Fixed payloads may be followed by extra bytes, which are ignored.

namespace sigmgr {

enum class InstructionTag : uint8_t {
    kInitSignerGroup = 0,
    kInitValidSigner = 1,
    kClearValidSigner = 2,
    kValidateSignature = 3,
};

struct InitSignerGroup {
    friend bool operator==(const InitSignerGroup&, const InitSignerGroup&) = default;
};

struct InitValidSigner {
    evmc::address eth_address{};

    friend bool operator==(const InitValidSigner&, const InitValidSigner&) = default;
};

struct ClearValidSigner {
    friend bool operator==(const ClearValidSigner&, const ClearValidSigner&) = default;
};

struct ValidateSignature {
    SignatureData signature_data;

    friend bool operator==(const ValidateSignature&, const ValidateSignature&) = default;
};

using SignerInstruction = std::variant<InitSignerGroup, InitValidSigner, ClearValidSigner, ValidateSignature>;

InstructionTag tag_of(const SignerInstruction& instruction) noexcept;

std::string_view instruction_name(const SignerInstruction& instruction) noexcept;

//! \brief Appends the wire form of the request to `to`
void encode(Bytes& to, const SignerInstruction& instruction);

Bytes encode(const SignerInstruction& instruction);

//! \brief Decodes a request
//! \return kInputTooShort for an empty buffer or a truncated payload, kUnknownTag for a tag above 3
tl::expected<SignerInstruction, DecodingError> decode_instruction(ByteView from);

}  // namespace sigmgr
