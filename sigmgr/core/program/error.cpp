// Copyright 2025 The Sigmgr Authors
// SPDX-License-Identifier: Apache-2.0

#include "error.hpp"

#include <magic_enum.hpp>

namespace sigmgr {

std::string_view to_string(ProgramError error) noexcept {
    return magic_enum::enum_name(error);
}

}  // namespace sigmgr
