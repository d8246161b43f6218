// Copyright 2025 The Sigmgr Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>

#include <evmc/evmc.hpp>

#include <sigmgr/core/common/bytes.hpp>
#include <sigmgr/core/types/signature_data.hpp>
#include <sigmgr/infra/common/secp256k1_context.hpp>

namespace sigmgr {

//! \brief Signs messages the way the secp256k1 co-processor verifies them: over keccak256(message)
class EthereumSigner {
  public:
    //! \throws std::invalid_argument if private_key is not a valid 32-byte secp256k1 secret key
    explicit EthereumSigner(ByteView private_key);

    //! \brief Address derived from the public key: last 20 bytes of keccak256 of the uncompressed key without prefix
    const evmc::address& address() const noexcept { return address_; }

    SignatureData sign(ByteView message);

  private:
    SecP256K1Context context_{/*allow_verify=*/false, /*allow_sign=*/true};
    Bytes private_key_;
    evmc::address address_;
};

//! \brief Address derived from a serialized uncompressed public key
evmc::address public_key_to_address(ByteView uncompressed_public_key);

//! \brief Recovers the address that produced the signature over keccak256(message)
//! \return std::nullopt if signature or recovery id are invalid
std::optional<evmc::address> recover_address(const SignatureData& signature_data);

}  // namespace sigmgr
