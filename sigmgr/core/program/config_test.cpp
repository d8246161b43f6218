// Copyright 2025 The Sigmgr Authors
// SPDX-License-Identifier: Apache-2.0

#include "config.hpp"

#include <sstream>

#include <catch2/catch_test_macros.hpp>

namespace sigmgr {

static constexpr auto kProgram{0x5aee45e62e23555c3cdcedda5ed5f8c436c9898a2f263ed4e035c7b9e4dbc08c_bytes32};

TEST_CASE("ProgramConfig defaults") {
    const ProgramConfig config{.program_id = kProgram};
    CHECK(config.secp256k1_program_id == kSecp256k1ProgramId);
    CHECK(config.instructions_sysvar_id == kInstructionsSysvarId);
}

TEST_CASE("ProgramConfig JSON") {
    const ProgramConfig config{.program_id = kProgram};
    const nlohmann::json json = config.to_json();
    CHECK(json["programId"] == "0x5aee45e62e23555c3cdcedda5ed5f8c436c9898a2f263ed4e035c7b9e4dbc08c");
    CHECK(json["secp256k1ProgramId"] == "0x04c6fc20f050ccf05584d7211c9f8cf59ec14785bb166a1e2830e81220000000");
    CHECK(json["instructionsSysvarId"] == "0x06a7d517187bd16635dad40455fdc2c0c124c68f215675a5dbbacb5f08000000");
    CHECK(ProgramConfig::from_json(json) == config);
}

TEST_CASE("ProgramConfig from JSON with defaults") {
    const auto json = nlohmann::json::parse(R"({
        "programId": "5aee45e62e23555c3cdcedda5ed5f8c436c9898a2f263ed4e035c7b9e4dbc08c"
    })");
    const std::optional<ProgramConfig> config{ProgramConfig::from_json(json)};
    REQUIRE(config);
    CHECK(config->program_id == kProgram);
    CHECK(config->secp256k1_program_id == kSecp256k1ProgramId);
    CHECK(config->instructions_sysvar_id == kInstructionsSysvarId);
}

TEST_CASE("ProgramConfig from JSON overriding identities") {
    const auto json = nlohmann::json::parse(R"({
        "programId": "0x0000000000000000000000000000000000000000000000000000000000000001",
        "secp256k1ProgramId": "0x0000000000000000000000000000000000000000000000000000000000000002",
        "instructionsSysvarId": "0x0000000000000000000000000000000000000000000000000000000000000003"
    })");
    const std::optional<ProgramConfig> config{ProgramConfig::from_json(json)};
    REQUIRE(config);
    CHECK(config->program_id == 0x0000000000000000000000000000000000000000000000000000000000000001_bytes32);
    CHECK(config->secp256k1_program_id == 0x0000000000000000000000000000000000000000000000000000000000000002_bytes32);
    CHECK(config->instructions_sysvar_id == 0x0000000000000000000000000000000000000000000000000000000000000003_bytes32);
}

TEST_CASE("ProgramConfig from invalid JSON") {
    CHECK_FALSE(ProgramConfig::from_json(nlohmann::json::parse("{}")));
    CHECK_FALSE(ProgramConfig::from_json(nlohmann::json::parse("[]")));
    CHECK_FALSE(ProgramConfig::from_json(nlohmann::json::parse("not json", nullptr, /*allow_exceptions=*/false)));
    CHECK_FALSE(ProgramConfig::from_json(nlohmann::json::parse(R"({"programId": 42})")));
    CHECK_FALSE(ProgramConfig::from_json(nlohmann::json::parse(R"({"programId": "0x1234"})")));
    CHECK_FALSE(ProgramConfig::from_json(nlohmann::json::parse(R"({
        "programId": "5aee45e62e23555c3cdcedda5ed5f8c436c9898a2f263ed4e035c7b9e4dbc08c",
        "secp256k1ProgramId": "0xzz"
    })")));
}

TEST_CASE("ProgramConfig stream output") {
    std::ostringstream out;
    out << ProgramConfig{.program_id = kProgram};
    CHECK(out.str().find("5aee45e62e23555c3cdcedda5ed5f8c436c9898a2f263ed4e035c7b9e4dbc08c") != std::string::npos);
}

}  // namespace sigmgr
