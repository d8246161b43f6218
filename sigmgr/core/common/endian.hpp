// Copyright 2025 The Sigmgr Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/*
Facilities to deal with byte order/endianness
See https://en.wikipedia.org/wiki/Endianness
*/

#include <cstdint>

#include <intx/intx.hpp>

namespace sigmgr::endian {

// NOLINTBEGIN(readability-identifier-naming)

// Similar to boost::endian::load_little_u16
const auto load_little_u16 = intx::le::unsafe::load<uint16_t>;

// Similar to boost::endian::store_little_u16
const auto store_little_u16 = intx::le::unsafe::store<uint16_t>;

// NOLINTEND(readability-identifier-naming)

}  // namespace sigmgr::endian
