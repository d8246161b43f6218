// Copyright 2025 The Sigmgr Authors
// SPDX-License-Identifier: Apache-2.0

#include "account.hpp"

#include <sstream>

#include <sigmgr/core/common/util.hpp>

namespace sigmgr {

std::string AccountInfo::to_string() const {
    std::stringstream out;
    out << "key: " << key;
    out << " owner: " << owner;
    out << " signer: " << std::boolalpha << is_signer;
    out << " writable: " << is_writable;
    out << " data: " << abridge(to_hex(data), 32);
    return out.str();
}

}  // namespace sigmgr
