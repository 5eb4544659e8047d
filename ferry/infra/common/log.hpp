// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace ferry::log {

//! \brief Available verbosity levels
enum class Level {
    kNone,      // Line with no severity (e.g. build info)
    kCritical,  // A migration cannot continue and nothing else can be done about it
    kError,     // A migration was aborted
    kWarning,   // A file or a checkpoint write failed, the migration goes on
    kInfo,      // Job lifecycle
    kDebug,     // Batches and scheduling
    kTrace      // Single file outcomes
};

//! \brief When log lines carry ANSI colors
enum class ColorMode {
    kAuto,    // Only when std::cerr is a terminal
    kAlways,
    kNever,
};

//! \brief Holds logging configuration
//! \details Log lines always go to std::cerr: std::cout is reserved to command output
struct Settings {
    //! Whether timestamps are printed in UTC or in the local timezone
    bool log_utc{true};
    //! Whether to paint log lines
    ColorMode log_colors{ColorMode::kAuto};
    //! Whether to print thread names in log lines
    bool log_threads{false};
    //! Log verbosity level
    Level log_verbosity{Level::kNone};
    //! Tee all log lines to this file (never colored)
    std::filesystem::path log_file;
};

//! \brief Initializes logging facilities
//! \note Not thread safe: call once at process start, before any runner exists
void init(const Settings& settings = {});

//! \note Not thread safe, meant to be used in tests
Level get_verbosity();

//! \note Not thread safe, meant to be used at process start or in tests
void set_verbosity(Level level);

//! \brief Sets the name printed for this thread when thread names are enabled
void set_thread_name(const char* name);

//! \brief Returns the name set for this thread or, if none, the thread id
std::string get_thread_name();

//! \brief Whether a line of the given level would be printed
//! \remarks Lets call sites skip building arguments for lines that would be discarded
bool test_verbosity(Level level);

//! \brief Appends all log lines to the file at path, creating it if missing
//! \throws std::runtime_error if the file cannot be opened
void tee_file(const std::filesystem::path& path);

//! Key-value pairs: even positions hold keys, odd positions hold values
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
    void append(const Args& args) { append("", args); }
    BufferBase& operator<<(const Args& args) {
        append(args);
        return *this;
    }

  protected:
    void append(std::string_view msg, const Args& args);
    void flush();

    //! Returns code when this line is painted, nothing otherwise
    std::string_view paint(std::string_view code) const { return colored_ ? code : std::string_view{}; }

    const bool should_print_;
    const bool colored_;
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

}  // namespace ferry::log

#define FERRY_LOGBUFFER(level_, ...)           \
    if (!ferry::log::test_verbosity(level_)) { \
    } else                                     \
        ferry::log::LogBuffer<level_>(__VA_ARGS__)

#define FERRY_TRACE_M(...) FERRY_LOGBUFFER(ferry::log::Level::kTrace, __VA_ARGS__)
#define FERRY_DEBUG_M(...) FERRY_LOGBUFFER(ferry::log::Level::kDebug, __VA_ARGS__)
#define FERRY_INFO_M(...) FERRY_LOGBUFFER(ferry::log::Level::kInfo, __VA_ARGS__)
#define FERRY_WARN_M(...) FERRY_LOGBUFFER(ferry::log::Level::kWarning, __VA_ARGS__)
#define FERRY_ERROR_M(...) FERRY_LOGBUFFER(ferry::log::Level::kError, __VA_ARGS__)
#define FERRY_CRIT_M(...) FERRY_LOGBUFFER(ferry::log::Level::kCritical, __VA_ARGS__)
#define FERRY_LOG_M(...) FERRY_LOGBUFFER(ferry::log::Level::kNone, __VA_ARGS__)

#define FERRY_TRACE FERRY_TRACE_M()
#define FERRY_DEBUG FERRY_DEBUG_M()
#define FERRY_INFO FERRY_INFO_M()
#define FERRY_WARN FERRY_WARN_M()
#define FERRY_ERROR FERRY_ERROR_M()
#define FERRY_CRIT FERRY_CRIT_M()
#define FERRY_LOG FERRY_LOG_M()
