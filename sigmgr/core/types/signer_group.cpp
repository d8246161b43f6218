// Copyright 2025 The Sigmgr Authors
// SPDX-License-Identifier: Apache-2.0

#include "signer_group.hpp"

#include <algorithm>
#include <sstream>

namespace sigmgr {

void encode(Bytes& to, const SignerGroup& group) {
    to.clear();
    to.reserve(SignerGroup::kSize);
    to.push_back(group.version);
    to.append(group.owner.bytes, kIdentityLength);
}

DecodingResult decode(ByteView from, SignerGroup& to) noexcept {
    if (from.size() < SignerGroup::kSize) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }
    if (from.size() > SignerGroup::kSize) {
        return tl::unexpected{DecodingError::kInputTooLong};
    }
    to.version = from[0];
    std::copy_n(&from[1], kIdentityLength, to.owner.bytes);
    return {};
}

std::string SignerGroup::to_string() const {
    std::stringstream out;
    out << "version: " << int{version} << " owner: " << owner;
    return out.str();
}

}  // namespace sigmgr
