// Copyright 2025 The Sigmgr Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <string>

#include <evmc/evmc.hpp>

#include <sigmgr/core/common/bytes.hpp>
#include <sigmgr/core/common/decoding_result.hpp>
#include <sigmgr/core/types/identity.hpp>

namespace sigmgr {

//! \brief External (Ethereum-style) address registered under a signer group
//! \details Persisted layout (53 bytes): [version: u8][signer_group: 32 bytes][eth_address: 20 bytes]
//! \remarks Only version decides validity: clearing a signer leaves the address bytes in place
struct ValidSigner {
    static constexpr size_t kSize{1 + kIdentityLength + kAddressLength};

    static constexpr uint8_t kCurrentVersion{1};

    //! 0 means uninitialized or revoked, any other value means active
    uint8_t version{0};

    //! Signer group account this signer belongs to, set once on initialization
    Identity signer_group{};

    //! Address that signatures must recover to
    evmc::address eth_address{};

    bool is_initialized() const noexcept { return version != 0; }

    std::string to_string() const;

    friend bool operator==(const ValidSigner&, const ValidSigner&) = default;
};

//! \brief Serializes the record into exactly ValidSigner::kSize bytes, replacing the content of to
void encode(Bytes& to, const ValidSigner& signer);

//! \brief Deserializes a record from exactly ValidSigner::kSize bytes
DecodingResult decode(ByteView from, ValidSigner& to) noexcept;

}  // namespace sigmgr
