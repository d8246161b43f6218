// Copyright 2025 The Sigmgr Authors
// SPDX-License-Identifier: Apache-2.0

#include "in_memory_host.hpp"

#include <stdexcept>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include <sigmgr/core/common/util.hpp>
#include <sigmgr/core/program/instruction_builder.hpp>
#include <sigmgr/core/types/signer_group.hpp>
#include <sigmgr/core/types/valid_signer.hpp>
#include <sigmgr/infra/crypto/ethereum_signer.hpp>
#include <sigmgr/infra/test_util/log.hpp>

namespace sigmgr {

static constexpr auto kProgram{0x5aee45e62e23555c3cdcedda5ed5f8c436c9898a2f263ed4e035c7b9e4dbc08c_bytes32};
static constexpr auto kGroup{0x00000000000000000000000000000000000000000000000000000000000000a1_bytes32};
static constexpr auto kOwner{0x00000000000000000000000000000000000000000000000000000000000000b1_bytes32};
static constexpr auto kIntruder{0x00000000000000000000000000000000000000000000000000000000000000b2_bytes32};
static constexpr auto kSigner{0x00000000000000000000000000000000000000000000000000000000000000c1_bytes32};

class HostFixture {
  public:
    HostFixture() {
        host_.create_account(kGroup, SignerGroup::kSize);
        host_.create_account(kSigner, ValidSigner::kSize);
    }

    void register_signer() {
        const std::vector<Instruction> batch{
            make_init_signer_group(config_, kGroup, kOwner),
            make_init_valid_signer(config_, kSigner, kGroup, kOwner, eth_signer_.address()),
        };
        REQUIRE(host_.execute(batch).ok());
    }

    std::vector<Instruction> validation_batch(const SignatureData& signed_data, const SignatureData& claimed) const {
        std::optional<Instruction> secp{make_secp256k1_instruction(config_, eth_signer_.address(), signed_data, 0)};
        REQUIRE(secp);
        return {*secp, make_validate_signature(config_, kSigner, kGroup, claimed)};
    }

    ValidSigner signer_record() const {
        const std::optional<Bytes> data{host_.account_data(kSigner)};
        REQUIRE(data);
        ValidSigner record;
        REQUIRE(decode(*data, record));
        return record;
    }

  protected:
    test_util::SetLogVerbosityGuard log_guard_{log::Level::kNone};
    ProgramConfig config_{.program_id = kProgram};
    InMemoryHost host_{config_};
    EthereumSigner eth_signer_{*from_hex("0x4646464646464646464646464646464646464646464646464646464646464646")};
};

TEST_CASE_METHOD(HostFixture, "Host validates a genuine signature") {
    register_signer();

    const SignatureData hello{eth_signer_.sign(*from_hex("68656c6c6f"))};
    REQUIRE(recover_address(hello) == eth_signer_.address());

    CHECK(host_.execute(validation_batch(hello, hello)).ok());

    SignatureData tampered{hello};
    tampered.message.back() = 'O';
    const ExecutionResult result{host_.execute(validation_batch(hello, tampered))};
    CHECK(result.error == ProgramError::kSignatureMismatch);
    CHECK(result.failed_instruction == 1);
}

TEST_CASE_METHOD(HostFixture, "Host rejects a signature by another key") {
    register_signer();
    register_signer();

    EthereumSigner other{*from_hex("0x0000000000000000000000000000000000000000000000000000000000000001")};
    const SignatureData signed_by_other{other.sign(*from_hex("68656c6c6f"))};
    std::optional<Instruction> secp{make_secp256k1_instruction(config_, other.address(), signed_by_other, 0)};
    REQUIRE(secp);
    const std::vector<Instruction> batch{*secp, make_validate_signature(config_, kSigner, kGroup, signed_by_other)};
    CHECK(host_.execute(batch).error == ProgramError::kSignatureMismatch);
}

TEST_CASE_METHOD(HostFixture, "Host batch is atomic") {
    const Bytes group_before{*host_.account_data(kGroup)};
    const Bytes signer_before{*host_.account_data(kSigner)};

    const std::vector<Instruction> batch{
        make_init_signer_group(config_, kGroup, kOwner),
        make_init_valid_signer(config_, kSigner, kGroup, kOwner, eth_signer_.address()),
        make_clear_valid_signer(config_, kSigner, kGroup, kIntruder),
    };
    const ExecutionResult result{host_.execute(batch)};
    CHECK(result.error == ProgramError::kWrongOwner);
    CHECK(result.failed_instruction == 2);

    CHECK(host_.account_data(kGroup) == group_before);
    CHECK(host_.account_data(kSigner) == signer_before);

    // the same batch without the failing instruction commits
    REQUIRE(host_.execute(std::span{batch}.first(2)).ok());
    CHECK(signer_record().is_initialized());
}

TEST_CASE_METHOD(HostFixture, "Host lifecycle") {
    register_signer();
    const ValidSigner record{signer_record()};
    CHECK(record.signer_group == kGroup);
    CHECK(record.eth_address == eth_signer_.address());

    const std::vector<Instruction> clear{make_clear_valid_signer(config_, kSigner, kGroup, kOwner)};
    REQUIRE(host_.execute(clear).ok());
    CHECK_FALSE(signer_record().is_initialized());

    const SignatureData hello{eth_signer_.sign(*from_hex("68656c6c6f"))};
    const ExecutionResult result{host_.execute(validation_batch(hello, hello))};
    CHECK(result.error == ProgramError::kUninitializedSigner);
    CHECK(result.failed_instruction == 1);
}

TEST_CASE_METHOD(HostFixture, "Host signer flags come from the batch") {
    const std::vector<Instruction> init_group{make_init_signer_group(config_, kGroup, kOwner)};
    REQUIRE(host_.execute(init_group).ok());

    Instruction unsigned_init{make_init_valid_signer(config_, kSigner, kGroup, kOwner, eth_signer_.address())};
    unsigned_init.accounts[2].is_signer = false;
    CHECK(host_.execute(std::vector<Instruction>{unsigned_init}).error == ProgramError::kSignatureMissing);
}

TEST_CASE_METHOD(HostFixture, "Host rejects writes to read-only accounts") {
    Instruction readonly_init{make_init_signer_group(config_, kGroup, kOwner)};
    readonly_init.accounts[0].is_writable = false;
    const ExecutionResult result{host_.execute(std::vector<Instruction>{readonly_init})};
    CHECK(result.error == ProgramError::kReadonlyDataModified);
    CHECK(host_.account_data(kGroup) == Bytes(SignerGroup::kSize, 0));
}

TEST_CASE_METHOD(HostFixture, "Host binds a key listed twice to the same account") {
    // the group account is its own owner
    Instruction self_owned{make_init_signer_group(config_, kGroup, kGroup)};
    REQUIRE(self_owned.accounts.size() == 2);

    SECTION("both copies writable") {
        self_owned.accounts[1].is_writable = true;
    }
    SECTION("second copy read-only") {
        REQUIRE_FALSE(self_owned.accounts[1].is_writable);
    }

    REQUIRE(host_.execute(std::vector<Instruction>{self_owned}).ok());

    const std::optional<Bytes> data{host_.account_data(kGroup)};
    REQUIRE(data);
    SignerGroup group;
    REQUIRE(decode(*data, group));
    CHECK(group.is_initialized());
    CHECK(group.owner == kGroup);
}

TEST_CASE_METHOD(HostFixture, "Host program routing") {
    Instruction foreign{make_init_signer_group(config_, kGroup, kOwner)};
    foreign.program_id = kIntruder;
    const ExecutionResult result{host_.execute(std::vector<Instruction>{foreign})};
    CHECK(result.error == ProgramError::kIncorrectProgramId);
    CHECK(result.failed_instruction == 0);

    // a lone co-processor instruction has nothing to validate
    const SignatureData hello{eth_signer_.sign(*from_hex("68656c6c6f"))};
    std::optional<Instruction> secp{make_secp256k1_instruction(config_, eth_signer_.address(), hello, 0)};
    REQUIRE(secp);
    CHECK(host_.execute(std::vector<Instruction>{*secp}).ok());

    CHECK(host_.execute(std::vector<Instruction>{}).ok());
}

TEST_CASE_METHOD(HostFixture, "Host accounts") {
    CHECK_THROWS_AS(host_.create_account(kGroup, SignerGroup::kSize), std::logic_error);
    CHECK_FALSE(host_.account_data(kOwner));

    // records not owned by the program are rejected
    host_.put_account(kIntruder, kOwner, Bytes(SignerGroup::kSize, 0));
    const std::vector<Instruction> batch{make_init_signer_group(config_, kIntruder, kOwner)};
    CHECK(host_.execute(batch).error == ProgramError::kIncorrectProgramId);
}

TEST_CASE_METHOD(HostFixture, "Host validation without co-processor") {
    register_signer();
    const SignatureData hello{eth_signer_.sign(*from_hex("68656c6c6f"))};
    const std::vector<Instruction> batch{make_validate_signature(config_, kSigner, kGroup, hello)};
    const ExecutionResult result{host_.execute(batch)};
    CHECK(result.error == ProgramError::kSecpInstructionMissing);
    CHECK(result.failed_instruction == 0);
}

}  // namespace sigmgr
