// Copyright 2025 The Sigmgr Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <iostream>
#include <sstream>

#include <catch2/catch_test_macros.hpp>

#include <sigmgr/infra/test_util/log.hpp>

namespace sigmgr::log {

// Swaps the buffer of std::cerr for the lifetime of the object
class CerrCapture {
  public:
    CerrCapture() : buffer_{std::cerr.rdbuf(out_.rdbuf())} {}
    ~CerrCapture() { std::cerr.rdbuf(buffer_); }

    std::string str() const { return out_.str(); }

  private:
    std::ostringstream out_;
    std::streambuf* buffer_;
};

TEST_CASE("Log verbosity") {
    test_util::SetLogVerbosityGuard guard{Level::kInfo};
    CHECK(test_verbosity(Level::kError));
    CHECK(test_verbosity(Level::kInfo));
    CHECK_FALSE(test_verbosity(Level::kDebug));
}

TEST_CASE("Log lines") {
    test_util::SetLogVerbosityGuard guard{Level::kInfo};
    CerrCapture capture;

    SIGMGR_INFO_M("batch executed", {"instructions", "2"});
    SIGMGR_DEBUG_M("hidden", {"key", "value"});
    SIGMGR_WARN << "plain " << 42;

    const std::string output{capture.str()};
    CHECK(output.find("INFO") != std::string::npos);
    CHECK(output.find("batch executed") != std::string::npos);
    CHECK(output.find("instructions") != std::string::npos);
    CHECK(output.find("hidden") == std::string::npos);
    CHECK(output.find("plain 42") != std::string::npos);
}

}  // namespace sigmgr::log
