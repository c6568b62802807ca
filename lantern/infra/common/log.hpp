// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <lantern/infra/common/terminal.hpp>

namespace lantern::log {

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

//! \brief Parses a verbosity level from either its name (e.g. "info", "warning") or its number (0-6)
std::optional<Level> level_from_string(std::string_view name) noexcept;

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
    //! Whether to print thread names in log lines
    bool log_threads{false};
    //! Log verbosity level
    Level log_verbosity{Level::kInfo};
    //! Log to file
    std::string log_file;
    //! Thousands separator
    char log_thousands_sep{'\''};
};

//! \brief Initializes logging facilities
//! \note This function is not thread safe as it's meant to be used at start of process and never called again
void init(const Settings& settings = {});

//! \brief Get the current logging verbosity
Level get_verbosity();

//! \brief Sets logging verbosity
//! \note This function is not thread safe as it's meant to be used at start of process or in tests
void set_verbosity(Level level);

//! \brief Sets the name for this thread, printed when thread logging is enabled
void set_thread_name(const char* name);

//! \brief Returns the currently set name for the thread or the thread id
std::string get_thread_name();

//! \brief Checks if provided log level will be effectively printed on behalf of current settings
//! \remarks Callers building expensive messages should check this first
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

    BufferBase(const BufferBase&) = delete;
    BufferBase& operator=(const BufferBase&) = delete;

    template <class T>
    void append(const T& t) {
        if (should_print_) ss_ << t;
    }
    template <class T>
    BufferBase& operator<<(const T& t) {
        append(t);
        return *this;
    }
    BufferBase& operator<<(const Args& args) {
        append("", args);
        return *this;
    }

  protected:
    //! Message left-aligned followed by key=value pairs taken two at a time from args
    void append(std::string_view msg, const Args& args) {
        if (!should_print_) return;
        ss_ << std::left << std::setw(36) << std::setfill(' ') << msg;
        for (size_t i{0}; i < args.size(); i += 2) {
            ss_ << kColorGreen << args[i] << kColorReset << "=";
            ss_ << kColorWhite << (i + 1 < args.size() ? args[i + 1] : "") << kColorReset << " ";
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

}  // namespace lantern::log

#define LANTERN_LOGBUFFER(level_, ...)           \
    if (!lantern::log::test_verbosity(level_)) { \
    } else                                       \
        lantern::log::LogBuffer<level_>(__VA_ARGS__)

#define LANTERN_TRACE_M(...) LANTERN_LOGBUFFER(lantern::log::Level::kTrace, __VA_ARGS__)
#define LANTERN_DEBUG_M(...) LANTERN_LOGBUFFER(lantern::log::Level::kDebug, __VA_ARGS__)
#define LANTERN_INFO_M(...) LANTERN_LOGBUFFER(lantern::log::Level::kInfo, __VA_ARGS__)
#define LANTERN_WARN_M(...) LANTERN_LOGBUFFER(lantern::log::Level::kWarning, __VA_ARGS__)
#define LANTERN_ERROR_M(...) LANTERN_LOGBUFFER(lantern::log::Level::kError, __VA_ARGS__)
#define LANTERN_CRIT_M(...) LANTERN_LOGBUFFER(lantern::log::Level::kCritical, __VA_ARGS__)
#define LANTERN_LOG_M(...) LANTERN_LOGBUFFER(lantern::log::Level::kNone, __VA_ARGS__)

#define LANTERN_TRACE LANTERN_TRACE_M()
#define LANTERN_DEBUG LANTERN_DEBUG_M()
#define LANTERN_INFO LANTERN_INFO_M()
#define LANTERN_WARN LANTERN_WARN_M()
#define LANTERN_ERROR LANTERN_ERROR_M()
#define LANTERN_CRIT LANTERN_CRIT_M()
#define LANTERN_LOG LANTERN_LOG_M()
