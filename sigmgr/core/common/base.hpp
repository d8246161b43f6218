// Copyright 2025 The Sigmgr Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// The most common and basic macros, types, and constants.

#include <cstddef>
#include <cstdint>
#include <string_view>

#include <sigmgr/core/common/assert.hpp>

namespace sigmgr {

using namespace std::string_view_literals;

//! Length of an Ethereum-style address recovered from a secp256k1 signature
inline constexpr size_t kAddressLength{20};

//! Length of an account identity (public key) on the ledger
inline constexpr size_t kIdentityLength{32};

//! Length of a compact secp256k1 signature (r || s)
inline constexpr size_t kSignatureLength{64};

inline constexpr size_t kHashLength{32};

}  // namespace sigmgr
