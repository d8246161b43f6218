// Copyright 2025 The Sigmgr Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <tl/expected.hpp>

namespace sigmgr {

// Error codes for byte-level decoding of requests, records and batch data
enum class [[nodiscard]] DecodingError {
    kInputTooShort,
    kInputTooLong,
    kUnknownTag,
    kOutOfRange,  // an offset or index points past the end of the data
};

// TODO(C++23) Switch to std::expected
using DecodingResult = tl::expected<void, DecodingError>;

}  // namespace sigmgr
