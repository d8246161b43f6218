// Copyright 2025 The Sigmgr Authors
// SPDX-License-Identifier: Apache-2.0

#include "identity.hpp"

#include <algorithm>

#include <sigmgr/core/common/util.hpp>

namespace sigmgr {

template <size_t N>
static std::optional<std::array<uint8_t, N>> fixed_from_hex(std::string_view hex) noexcept {
    const std::optional<Bytes> bytes{from_hex(hex)};
    if (!bytes || bytes->size() != N) {
        return std::nullopt;
    }
    std::array<uint8_t, N> out{};
    std::ranges::copy(*bytes, out.begin());
    return out;
}

std::string identity_to_hex(const Identity& identity) {
    return to_hex(identity.bytes, /*with_prefix=*/true);
}

std::optional<Identity> hex_to_identity(std::string_view hex) noexcept {
    const auto raw{fixed_from_hex<kIdentityLength>(hex)};
    if (!raw) {
        return std::nullopt;
    }
    Identity identity;
    std::ranges::copy(*raw, identity.bytes);
    return identity;
}

std::string address_to_hex(const evmc::address& address) {
    return to_hex(address.bytes, /*with_prefix=*/true);
}

std::optional<evmc::address> hex_to_address(std::string_view hex) noexcept {
    const auto raw{fixed_from_hex<kAddressLength>(hex)};
    if (!raw) {
        return std::nullopt;
    }
    evmc::address address;
    std::ranges::copy(*raw, address.bytes);
    return address;
}

std::optional<Signature> hex_to_signature(std::string_view hex) noexcept {
    return fixed_from_hex<kSignatureLength>(hex);
}

}  // namespace sigmgr

namespace evmc {

std::ostream& operator<<(std::ostream& out, const evmc::address& address) {
    out << sigmgr::address_to_hex(address);
    return out;
}

std::ostream& operator<<(std::ostream& out, const evmc::bytes32& bytes32) {
    out << sigmgr::identity_to_hex(bytes32);
    return out;
}

}  // namespace evmc
