// Copyright 2025 The Sigmgr Authors
// SPDX-License-Identifier: Apache-2.0

#include "hex_option.hpp"

#include <catch2/catch_test_macros.hpp>

namespace sigmgr::cmd::common {

TEST_CASE("HexBytesValidator") {
    const HexBytesValidator validator{2};
    CHECK(validator(std::string{"0x0102"}).empty());
    CHECK(validator(std::string{"0102"}).empty());
    CHECK_FALSE(validator(std::string{"0x010203"}).empty());
    CHECK_FALSE(validator(std::string{"0xzz02"}).empty());
    CHECK_FALSE(validator(std::string{}).empty());

    const HexBytesValidator optional{2, /*allow_empty=*/true};
    CHECK(optional(std::string{}).empty());
}

TEST_CASE("Identity option") {
    CLI::App app;
    std::string identity;
    add_option_identity(app, "--id", identity, "identity");

    CHECK_NOTHROW(app.parse("--id 0x5aee45e62e23555c3cdcedda5ed5f8c436c9898a2f263ed4e035c7b9e4dbc08c"));
    CHECK(identity == "0x5aee45e62e23555c3cdcedda5ed5f8c436c9898a2f263ed4e035c7b9e4dbc08c");

    CHECK_THROWS_AS(app.parse("--id 0x1234"), CLI::ValidationError);
}

}  // namespace sigmgr::cmd::common
