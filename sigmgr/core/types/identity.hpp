// Copyright 2025 The Sigmgr Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <evmc/evmc.hpp>

#include <sigmgr/core/common/base.hpp>
#include <sigmgr/core/common/bytes.hpp>

namespace sigmgr {

//! 32-byte public identity of a ledger account (record, owner, program)
using Identity = evmc::bytes32;

//! Compact secp256k1 signature (r || s)
using Signature = std::array<uint8_t, kSignatureLength>;

std::string identity_to_hex(const Identity& identity);

//! \brief Parses a 0x-prefixed or bare hex string of exactly 32 bytes
std::optional<Identity> hex_to_identity(std::string_view hex) noexcept;

std::string address_to_hex(const evmc::address& address);

//! \brief Parses a 0x-prefixed or bare hex string of exactly 20 bytes
std::optional<evmc::address> hex_to_address(std::string_view hex) noexcept;

//! \brief Parses a 0x-prefixed or bare hex string of exactly 64 bytes
std::optional<Signature> hex_to_signature(std::string_view hex) noexcept;

}  // namespace sigmgr

namespace evmc {

std::ostream& operator<<(std::ostream& out, const evmc::address& address);

std::ostream& operator<<(std::ostream& out, const evmc::bytes32& bytes32);

}  // namespace evmc
