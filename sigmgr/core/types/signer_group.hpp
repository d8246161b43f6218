// Copyright 2025 The Sigmgr Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <string>

#include <sigmgr/core/common/bytes.hpp>
#include <sigmgr/core/common/decoding_result.hpp>
#include <sigmgr/core/types/identity.hpp>

namespace sigmgr {

//! \brief Authorization domain with a single owner, under which valid signers are registered
//! \details Persisted layout (33 bytes): [version: u8][owner: 32 bytes]
struct SignerGroup {
    //! Serialized size of the record, which is also the size of the account holding it
    static constexpr size_t kSize{1 + kIdentityLength};

    //! Version written on initialization
    static constexpr uint8_t kCurrentVersion{1};

    //! 0 means uninitialized, any other value means initialized
    uint8_t version{0};

    //! The only identity allowed to add or remove valid signers
    Identity owner{};

    bool is_initialized() const noexcept { return version != 0; }

    std::string to_string() const;

    friend bool operator==(const SignerGroup&, const SignerGroup&) = default;
};

//! \brief Serializes the record into exactly SignerGroup::kSize bytes, replacing the content of to
void encode(Bytes& to, const SignerGroup& group);

//! \brief Deserializes a record from exactly SignerGroup::kSize bytes
DecodingResult decode(ByteView from, SignerGroup& to) noexcept;

}  // namespace sigmgr
