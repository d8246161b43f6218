// Copyright 2025 The Sigmgr Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <sigmgr/infra/common/terminal.hpp>

namespace sigmgr::log {

//! \brief Available verbosity levels
enum class Level {
    kNone,      // Simple logging line with no severity (e.g. build info)
    kCritical,  // An error there's no way we can recover from
    kError,     // We encountered an error which we might be able to recover from
    kWarning,   // Something happened and user might have the possibility to amend the situation
    kInfo,      // Info messages on regular operations
    kDebug,     // Debug information
    kTrace      // Trace calls to functions
};

//! \brief Holds logging configuration
struct Settings {
    //! Whether console logging goes to std::cout or std::cerr (default)
    bool log_std_out{false};
    //! Whether timestamps should be in UTC or imbue local timezone
    bool log_utc{true};
    //! Whether timestamps should include the timezone identifier
    bool log_timezone{true};
    //! Whether to disable colorized output
    bool log_nocolor{false};
    //! Whether to trim log level
    bool log_trim{false};
    //! Log verbosity level
    Level log_verbosity{Level::kNone};
    //! Log to file
    std::string log_file;
};

//! \brief Initializes logging facilities
//! \note This function is not thread safe as it's meant to be used at start of process and never called again
void init(const Settings& settings = {});

//! \brief Get the current logging verbosity
Level get_verbosity();

//! \brief Sets logging verbosity
void set_verbosity(Level level);

//! \brief Checks if provided log level will be effectively printed on behalf of current settings
bool test_verbosity(Level level);

//! \brief Sets a file output for log teeing
//! \throws std::runtime_error if the file cannot be opened
void tee_file(const std::filesystem::path& path);

using Args = std::vector<std::string>;

class BufferBase {
  public:
    explicit BufferBase(Level level);
    explicit BufferBase(Level level, std::string_view msg, const Args& args);
    ~BufferBase() { flush(); }

    template <class T>
    void append(const T& t) {
        if (should_print_) ss_ << t;
    }
    template <class T>
    BufferBase& operator<<(const T& t) {
        append(t);
        return *this;
    }
    void append(const Args& args) {
        append("", args);
    }
    BufferBase& operator<<(const Args& args) {
        append(args);
        return *this;
    }

  protected:
    void append(std::string_view msg, const Args& args) {
        if (!should_print_) return;
        ss_ << std::left << std::setw(36) << std::setfill(' ') << msg;
        bool left{true};
        for (const auto& arg : args) {
            ss_ << (left ? kColorGreen : kColorWhite) << arg << kColorReset << (left ? "=" : " ");
            left = !left;
        }
    }
    void flush();
    const bool should_print_;
    std::stringstream ss_;
};

template <Level level>
class LogBuffer : public BufferBase {
  public:
    explicit LogBuffer() : BufferBase(level) {}
    explicit LogBuffer(std::string_view msg, const Args& args = {}) : BufferBase(level, msg, args) {}
};

using Trace = LogBuffer<Level::kTrace>;
using Debug = LogBuffer<Level::kDebug>;
using Info = LogBuffer<Level::kInfo>;
using Warning = LogBuffer<Level::kWarning>;
using Error = LogBuffer<Level::kError>;
using Critical = LogBuffer<Level::kCritical>;
using Message = LogBuffer<Level::kNone>;

}  // namespace sigmgr::log

#define SIGMGR_LOGBUFFER(level_, ...)           \
    if (!sigmgr::log::test_verbosity(level_)) { \
    } else                                      \
        sigmgr::log::LogBuffer<level_>(__VA_ARGS__)

#define SIGMGR_TRACE_M(...) SIGMGR_LOGBUFFER(sigmgr::log::Level::kTrace, __VA_ARGS__)
#define SIGMGR_DEBUG_M(...) SIGMGR_LOGBUFFER(sigmgr::log::Level::kDebug, __VA_ARGS__)
#define SIGMGR_INFO_M(...) SIGMGR_LOGBUFFER(sigmgr::log::Level::kInfo, __VA_ARGS__)
#define SIGMGR_WARN_M(...) SIGMGR_LOGBUFFER(sigmgr::log::Level::kWarning, __VA_ARGS__)
#define SIGMGR_ERROR_M(...) SIGMGR_LOGBUFFER(sigmgr::log::Level::kError, __VA_ARGS__)
#define SIGMGR_CRIT_M(...) SIGMGR_LOGBUFFER(sigmgr::log::Level::kCritical, __VA_ARGS__)
#define SIGMGR_LOG_M(...) SIGMGR_LOGBUFFER(sigmgr::log::Level::kNone, __VA_ARGS__)

#define SIGMGR_TRACE SIGMGR_TRACE_M()
#define SIGMGR_DEBUG SIGMGR_DEBUG_M()
#define SIGMGR_INFO SIGMGR_INFO_M()
#define SIGMGR_WARN SIGMGR_WARN_M()
#define SIGMGR_ERROR SIGMGR_ERROR_M()
#define SIGMGR_CRIT SIGMGR_CRIT_M()
#define SIGMGR_LOG SIGMGR_LOG_M()
