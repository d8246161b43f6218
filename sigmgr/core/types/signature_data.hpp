// Copyright 2025 The Sigmgr Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>

#include <sigmgr/core/common/bytes.hpp>
#include <sigmgr/core/types/identity.hpp>

namespace sigmgr {

//! \brief A secp256k1 signature over a message, as claimed by the caller
struct SignatureData {
    Signature signature{};
    //! Recovery id (0..3) needed to recover the signer's public key
    uint8_t recovery_id{0};
    Bytes message;

    friend bool operator==(const SignatureData&, const SignatureData&) = default;
};

}  // namespace sigmgr
