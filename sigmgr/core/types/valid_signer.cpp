// Copyright 2025 The Sigmgr Authors
// SPDX-License-Identifier: Apache-2.0

#include "valid_signer.hpp"

#include <algorithm>
#include <sstream>

namespace sigmgr {

namespace {
    constexpr size_t kGroupOffset{1};
    constexpr size_t kAddressOffset{kGroupOffset + kIdentityLength};
}  // namespace

void encode(Bytes& to, const ValidSigner& signer) {
    to.clear();
    to.reserve(ValidSigner::kSize);
    to.push_back(signer.version);
    to.append(signer.signer_group.bytes, kIdentityLength);
    to.append(signer.eth_address.bytes, kAddressLength);
}

DecodingResult decode(ByteView from, ValidSigner& to) noexcept {
    if (from.size() < ValidSigner::kSize) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }
    if (from.size() > ValidSigner::kSize) {
        return tl::unexpected{DecodingError::kInputTooLong};
    }
    to.version = from[0];
    std::copy_n(&from[kGroupOffset], kIdentityLength, to.signer_group.bytes);
    std::copy_n(&from[kAddressOffset], kAddressLength, to.eth_address.bytes);
    return {};
}

std::string ValidSigner::to_string() const {
    std::stringstream out;
    out << "version: " << int{version}
        << " signer_group: " << signer_group
        << " eth_address: " << eth_address;
    return out.str();
}

}  // namespace sigmgr
