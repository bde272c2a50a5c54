// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace zkgas::log {

//! \brief Verbosity levels, a line is printed when its level is not above the configured one
enum class Level {
    kNone,      // Always printed, no severity tag
    kCritical,  // The run cannot continue
    kError,     // An operation failed and the failure is reported to the user
    kWarning,   // Unexpected condition the user may want to look at
    kInfo,      // Progress of regular operations
    kDebug,     // Details useful when diagnosing node interaction
    kTrace      // Raw requests and responses
};

//! \brief Logging configuration, populated from the --log.* command-line options
struct Settings {
    //! Write log lines to std::cout instead of std::cerr
    bool log_std_out{false};
    //! Print timestamps in UTC rather than in the local timezone
    bool log_utc{true};
    //! Disable colors, always disabled when not writing to a terminal or when teeing to a file
    bool log_nocolor{false};
    //! Print the thread name in each line
    bool log_threads{false};
    Level log_verbosity{Level::kWarning};
    //! Also append every log line to this file, if not empty
    std::string log_file;
};

//! \brief Initializes logging facilities
//! \note Not thread safe, meant to be called once at process start
void init(const Settings& settings = {});

Level get_verbosity();

//! \note Not thread safe, meant to be called at process start or in tests
void set_verbosity(Level level);

//! \brief Checks if a line at the given level would be printed with the current settings
bool test_verbosity(Level level);

//! \brief Sets the name for this thread when logging traces also threads
void set_thread_name(const char* name);

//! \brief Returns the currently set name for the thread or the thread id
std::string get_thread_name();

//! \brief Sets a file output for log teeing
//! \throws std::runtime_error if the file cannot be opened
void tee_file(const std::filesystem::path& path);

using Args = std::vector<std::string>;

//! \brief Accumulates one log line and writes it out on destruction
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
    void append(const Args& args) { append_args("", args); }
    BufferBase& operator<<(const Args& args) {
        append(args);
        return *this;
    }

  protected:
    //! Message padded to a fixed width followed by key=value pairs
    void append_args(std::string_view msg, const Args& args);
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

}  // namespace zkgas::log

#define ZKGAS_LOGBUFFER(level_, ...)           \
    if (!zkgas::log::test_verbosity(level_)) { \
    } else                                     \
        zkgas::log::LogBuffer<level_>(__VA_ARGS__)

#define ZKGAS_TRACE_M(...) ZKGAS_LOGBUFFER(zkgas::log::Level::kTrace, __VA_ARGS__)
#define ZKGAS_DEBUG_M(...) ZKGAS_LOGBUFFER(zkgas::log::Level::kDebug, __VA_ARGS__)
#define ZKGAS_INFO_M(...) ZKGAS_LOGBUFFER(zkgas::log::Level::kInfo, __VA_ARGS__)
#define ZKGAS_WARN_M(...) ZKGAS_LOGBUFFER(zkgas::log::Level::kWarning, __VA_ARGS__)
#define ZKGAS_ERROR_M(...) ZKGAS_LOGBUFFER(zkgas::log::Level::kError, __VA_ARGS__)
#define ZKGAS_CRIT_M(...) ZKGAS_LOGBUFFER(zkgas::log::Level::kCritical, __VA_ARGS__)
#define ZKGAS_LOG_M(...) ZKGAS_LOGBUFFER(zkgas::log::Level::kNone, __VA_ARGS__)

#define ZKGAS_TRACE ZKGAS_TRACE_M()
#define ZKGAS_DEBUG ZKGAS_DEBUG_M()
#define ZKGAS_INFO ZKGAS_INFO_M()
#define ZKGAS_WARN ZKGAS_WARN_M()
#define ZKGAS_ERROR ZKGAS_ERROR_M()
#define ZKGAS_CRIT ZKGAS_CRIT_M()
#define ZKGAS_LOG ZKGAS_LOG_M()
