// Copyright 2025 The Sigmgr Authors
// SPDX-License-Identifier: Apache-2.0

#include "instruction.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sigmgr/core/common/util.hpp>

namespace sigmgr {

using namespace evmc::literals;

static ValidateSignature sample_validate_signature() {
    ValidateSignature instruction{.signature_data = {.recovery_id = 1, .message = *from_hex("68656c6c6f")}};
    for (size_t i{0}; i < instruction.signature_data.signature.size(); ++i) {
        instruction.signature_data.signature[i] = static_cast<uint8_t>(i);
    }
    return instruction;
}

TEST_CASE("Instruction round trip") {
    const std::vector<SignerInstruction> instructions{
        InitSignerGroup{},
        InitValidSigner{.eth_address = 0x1111111111111111111111111111111111111111_address},
        ClearValidSigner{},
        sample_validate_signature(),
        ValidateSignature{},
    };
    for (const auto& instruction : instructions) {
        const Bytes encoded{encode(instruction)};
        const auto decoded{decode_instruction(encoded)};
        REQUIRE(decoded);
        CHECK(*decoded == instruction);
    }
}

TEST_CASE("Instruction wire format") {
    CHECK(to_hex(encode(InitSignerGroup{})) == "00");
    CHECK(to_hex(encode(ClearValidSigner{})) == "02");
    CHECK(to_hex(encode(InitValidSigner{.eth_address = 0x6295ee1b4f6dd65047762f924ecd367c17eabf8f_address})) ==
          "016295ee1b4f6dd65047762f924ecd367c17eabf8f");

    const Bytes encoded{encode(sample_validate_signature())};
    REQUIRE(encoded.size() == 1 + 64 + 1 + 5);
    CHECK(encoded[0] == 3);
    CHECK(encoded[1] == 0);
    CHECK(encoded[64] == 63);
    CHECK(encoded[65] == 1);
    CHECK(to_hex(ByteView{encoded}.substr(66)) == "68656c6c6f");
}

TEST_CASE("Instruction encoding appends") {
    Bytes out{*from_hex("ff")};
    encode(out, ClearValidSigner{});
    CHECK(to_hex(out) == "ff02");
}

TEST_CASE("Instruction names") {
    CHECK(instruction_name(InitSignerGroup{}) == "InitSignerGroup");
    CHECK(instruction_name(InitValidSigner{}) == "InitValidSigner");
    CHECK(instruction_name(ClearValidSigner{}) == "ClearValidSigner");
    CHECK(instruction_name(ValidateSignature{}) == "ValidateSignature");
}

TEST_CASE("Instruction decoding errors") {
    CHECK(decode_instruction(ByteView{}).error() == DecodingError::kInputTooShort);
    CHECK(decode_instruction(*from_hex("04")).error() == DecodingError::kUnknownTag);
    CHECK(decode_instruction(*from_hex("ff")).error() == DecodingError::kUnknownTag);

    // 19 bytes of address
    CHECK(decode_instruction(*from_hex("0111111111111111111111111111111111111111")).error() ==
          DecodingError::kInputTooShort);

    // signature without recovery id
    Bytes validate(1 + 64, 0);
    validate[0] = 3;
    CHECK(decode_instruction(validate).error() == DecodingError::kInputTooShort);
}

TEST_CASE("Instruction decoding tolerates trailing bytes") {
    const auto group{decode_instruction(*from_hex("00ffff"))};
    REQUIRE(group);
    CHECK(std::holds_alternative<InitSignerGroup>(*group));

    const auto signer{decode_instruction(*from_hex("011111111111111111111111111111111111111111aa"))};
    REQUIRE(signer);
    CHECK(std::get<InitValidSigner>(*signer).eth_address == 0x1111111111111111111111111111111111111111_address);

    const auto clear{decode_instruction(*from_hex("0201"))};
    REQUIRE(clear);
    CHECK(std::holds_alternative<ClearValidSigner>(*clear));
}

TEST_CASE("ValidateSignature message is the rest of the buffer") {
    Bytes data(1 + 65, 0);
    data[0] = 3;
    const auto empty_message{decode_instruction(data)};
    REQUIRE(empty_message);
    CHECK(std::get<ValidateSignature>(*empty_message).signature_data.message.empty());

    data.append(*from_hex("00010203"));
    const auto with_message{decode_instruction(data)};
    REQUIRE(with_message);
    CHECK(to_hex(std::get<ValidateSignature>(*with_message).signature_data.message) == "00010203");
}

}  // namespace sigmgr
