// Copyright 2025 The Sigmgr Authors
// SPDX-License-Identifier: Apache-2.0

#include "instruction.hpp"

#include <algorithm>

#include <magic_enum.hpp>

#include <sigmgr/core/common/base.hpp>
#include <sigmgr/core/common/overloaded.hpp>

namespace sigmgr {

namespace {

    constexpr size_t kSignaturePrefixSize{kSignatureLength + 1};

    tl::expected<SignerInstruction, DecodingError> decode_init_valid_signer(ByteView payload) {
        if (payload.size() < kAddressLength) {
            return tl::unexpected{DecodingError::kInputTooShort};
        }
        InitValidSigner instruction;
        std::copy_n(payload.data(), kAddressLength, instruction.eth_address.bytes);
        return instruction;
    }

    tl::expected<SignerInstruction, DecodingError> decode_validate_signature(ByteView payload) {
        if (payload.size() < kSignaturePrefixSize) {
            return tl::unexpected{DecodingError::kInputTooShort};
        }
        ValidateSignature instruction;
        SignatureData& data{instruction.signature_data};
        std::copy_n(payload.data(), kSignatureLength, data.signature.begin());
        data.recovery_id = payload[kSignatureLength];
        data.message = payload.substr(kSignaturePrefixSize);
        return instruction;
    }

}  // namespace

InstructionTag tag_of(const SignerInstruction& instruction) noexcept {
    return std::visit(
        Overloaded{
            [](const InitSignerGroup&) { return InstructionTag::kInitSignerGroup; },
            [](const InitValidSigner&) { return InstructionTag::kInitValidSigner; },
            [](const ClearValidSigner&) { return InstructionTag::kClearValidSigner; },
            [](const ValidateSignature&) { return InstructionTag::kValidateSignature; },
        },
        instruction);
}

std::string_view instruction_name(const SignerInstruction& instruction) noexcept {
    // enumerator name without its k prefix
    return magic_enum::enum_name(tag_of(instruction)).substr(1);
}

void encode(Bytes& to, const SignerInstruction& instruction) {
    to.push_back(static_cast<uint8_t>(tag_of(instruction)));
    std::visit(
        Overloaded{
            [](const InitSignerGroup&) {},
            [&](const InitValidSigner& x) { to.append(x.eth_address.bytes, kAddressLength); },
            [](const ClearValidSigner&) {},
            [&](const ValidateSignature& x) {
                to.append(x.signature_data.signature.data(), kSignatureLength);
                to.push_back(x.signature_data.recovery_id);
                to.append(x.signature_data.message);
            },
        },
        instruction);
}

Bytes encode(const SignerInstruction& instruction) {
    Bytes out;
    encode(out, instruction);
    return out;
}

tl::expected<SignerInstruction, DecodingError> decode_instruction(ByteView from) {
    if (from.empty()) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }
    const ByteView payload{from.substr(1)};
    switch (from[0]) {
        case static_cast<uint8_t>(InstructionTag::kInitSignerGroup):
            return InitSignerGroup{};
        case static_cast<uint8_t>(InstructionTag::kInitValidSigner):
            return decode_init_valid_signer(payload);
        case static_cast<uint8_t>(InstructionTag::kClearValidSigner):
            return ClearValidSigner{};
        case static_cast<uint8_t>(InstructionTag::kValidateSignature):
            return decode_validate_signature(payload);
        default:
            return tl::unexpected{DecodingError::kUnknownTag};
    }
}

}  // namespace sigmgr
