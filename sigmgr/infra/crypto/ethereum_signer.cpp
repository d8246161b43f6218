// Copyright 2025 The Sigmgr Authors
// SPDX-License-Identifier: Apache-2.0

#include "ethereum_signer.hpp"

#include <algorithm>
#include <stdexcept>

#include <sigmgr/core/common/util.hpp>
#include <sigmgr/infra/common/ensure.hpp>

namespace sigmgr {

EthereumSigner::EthereumSigner(ByteView private_key) : private_key_{private_key} {
    if (!context_.verify_private_key_data(private_key_)) {
        throw std::invalid_argument("invalid secp256k1 private key");
    }
    secp256k1_pubkey public_key;
    ensure(context_.create_public_key(&public_key, private_key_), "cannot derive public key");
    address_ = public_key_to_address(context_.serialize_public_key(&public_key, /*is_compressed=*/false));
}

SignatureData EthereumSigner::sign(ByteView message) {
    const ethash::hash256 digest{keccak256(message)};
    secp256k1_ecdsa_recoverable_signature signature;
    ensure(context_.sign_recoverable(&signature, digest.bytes, private_key_), "cannot sign message");

    const auto [compact, recovery_id] = context_.serialize_recoverable_signature(&signature);
    SignatureData data{.recovery_id = recovery_id, .message = Bytes{message}};
    std::ranges::copy(compact, data.signature.begin());
    return data;
}

evmc::address public_key_to_address(ByteView uncompressed_public_key) {
    ensure(uncompressed_public_key.size() == SecP256K1Context::kPublicKeySizeUncompressed,
           "public key must be uncompressed");
    const ethash::hash256 hash{keccak256(uncompressed_public_key.substr(1))};
    evmc::address address;
    std::copy_n(hash.bytes + sizeof(hash.bytes) - kAddressLength, kAddressLength, address.bytes);
    return address;
}

std::optional<evmc::address> recover_address(const SignatureData& signature_data) {
    SecP256K1Context context;
    secp256k1_ecdsa_recoverable_signature signature;
    if (!context.parse_recoverable_signature(&signature, signature_data.signature, signature_data.recovery_id)) {
        return std::nullopt;
    }
    const ethash::hash256 digest{keccak256(signature_data.message)};
    secp256k1_pubkey public_key;
    if (!context.recover_signature_public_key(&public_key, &signature, digest.bytes)) {
        return std::nullopt;
    }
    return public_key_to_address(context.serialize_public_key(&public_key, /*is_compressed=*/false));
}

}  // namespace sigmgr
