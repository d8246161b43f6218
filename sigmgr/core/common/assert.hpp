// Copyright 2025 The Sigmgr Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

namespace sigmgr {
[[noreturn]] void abort_due_to_assertion_failure(char const* expr, char const* file, int line);
}

// SIGMGR_ASSERT always aborts program execution on assertion failure, even when NDEBUG is defined.
#define SIGMGR_ASSERT(expr)   \
    if ((expr)) [[likely]]    \
        static_cast<void>(0); \
    else                      \
        ::sigmgr::abort_due_to_assertion_failure(#expr, __FILE__, __LINE__)
