//! # sift Logging
//!
//! A small structured logger shared by every sift component:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Module-tagged messages for per-component filtering
//! - Pluggable output sinks (Console, File, Null, Memory, Multi)
//! - Thread-safe dispatch with mutex protection
//! - Compile-time level elision via SIFT_MIN_LOG_LEVEL
//!
//! ## Usage
//!
//! ```cpp
//! SIFT_LOG_DEBUG("dce", "round " << round << " removed " << n << " instructions");
//! SIFT_LOG_WARN("liveness", "no fixed point after " << cap << " iterations");
//! ```
//!
//! ## Module tags
//!
//! | Tag        | Component                          |
//! |------------|------------------------------------|
//! | `dce`      | Fixed-point driver and transformer |
//! | `liveness` | Liveness dataflow                  |
//! | `escape`   | Escape analysis                    |
//! | `verify`   | Structural verifier                |

#ifndef SIFT_LOG_HPP
#define SIFT_LOG_HPP

#include <chrono>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sift::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6 ///< Disables all logging
};

/// Returns the upper-case name for a log level (e.g., "TRACE").
inline const char* level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    case LogLevel::Off:
        return "OFF";
    }
    return "???";
}

/// Parses a log level from a string (lower or upper case).
/// Returns LogLevel::Info if the string is not recognized.
inline LogLevel parse_level(std::string_view s) {
    if (s == "trace" || s == "TRACE")
        return LogLevel::Trace;
    if (s == "debug" || s == "DEBUG")
        return LogLevel::Debug;
    if (s == "info" || s == "INFO")
        return LogLevel::Info;
    if (s == "warn" || s == "WARN")
        return LogLevel::Warn;
    if (s == "error" || s == "ERROR")
        return LogLevel::Error;
    if (s == "fatal" || s == "FATAL")
        return LogLevel::Fatal;
    if (s == "off" || s == "OFF")
        return LogLevel::Off;
    return LogLevel::Info;
}

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level;
    std::string_view module; ///< Module tag (e.g., "dce", "liveness")
    std::string message;
    const char* file; ///< Source file (__FILE__)
    int line;         ///< Source line (__LINE__)
    int64_t timestamp_ms;
};

/// Output format for log messages.
enum class LogFormat {
    Text, ///< Human-readable text with optional ANSI colors
    JSON  ///< One JSON object per line
};

// ============================================================================
// Log Sinks
// ============================================================================

/// Abstract base class for log output destinations.
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Console sink that writes to stderr with optional ANSI colors.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);

    void write(const LogRecord& record) override;
    void flush() override;

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    bool colors_enabled_;
    LogFormat format_ = LogFormat::Text;

    const char* level_color(LogLevel level) const;
};

/// File sink. Flushes eagerly on Error and Fatal records.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);
    ~FileSink() override;

    void write(const LogRecord& record) override;
    void flush() override;

    bool is_open() const {
        return file_.is_open();
    }

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    std::ofstream file_;
    LogFormat format_ = LogFormat::Text;
};

/// Sink that discards everything.
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

/// Keeps every record in memory. Used by tests and by tools that want to
/// inspect pass diagnostics after the fact.
///
/// Module tags are stored as views, so they must outlive the sink (the
/// logging macros pass string literals).
class MemorySink : public LogSink {
public:
    void write(const LogRecord& record) override {
        records_.push_back(record);
    }
    void flush() override {}

    const std::vector<LogRecord>& records() const {
        return records_;
    }

    /// Number of records at `level` from `module` (any module when empty).
    size_t count(LogLevel level, std::string_view module = {}) const;

    /// True if any record's message contains `needle`.
    bool contains(std::string_view needle) const;

    void clear() {
        records_.clear();
    }

private:
    std::vector<LogRecord> records_;
};

/// Fans records out to several child sinks.
class MultiSink : public LogSink {
public:
    void write(const LogRecord& record) override;
    void flush() override;

    void add(std::unique_ptr<LogSink> sink);

    size_t size() const {
        return sinks_.size();
    }

private:
    std::vector<std::unique_ptr<LogSink>> sinks_;
};

/// Renders a record as one line of text (no trailing newline).
std::string format_text(const LogRecord& record);

/// Renders a record as one JSON object (no trailing newline).
std::string format_json(const LogRecord& record);

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based log level filter.
///
/// Parses filter strings like "dce=trace,liveness=debug,*=warn".
class LogFilter {
public:
    LogFilter() = default;

    /// Parse a filter specification string.
    /// Format: "module1=level,module2=level,*=default_level"
    /// A bare module name enables Trace for that module.
    void parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest level configured anywhere, used by the Logger fast path.
    LogLevel min_level() const {
        LogLevel min = default_level_;
        for (const auto& [_, level] : module_levels_) {
            if (level < min)
                min = level;
        }
        return min;
    }

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger
// ============================================================================

/// Configuration for logger initialization.
struct LogConfig {
    LogLevel level = LogLevel::Warn;
    LogFormat format = LogFormat::Text;
    std::string filter_spec;
    std::string log_file; ///< Empty = no file sink
    bool console = true;
    bool colors = true;
};

/// Thread-safe global logger.
///
/// Auto-initializes with a Warn-level console sink on first use.
class Logger {
public:
    /// Replace sinks, level and filter with the given configuration.
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Fast-path check used by the macros before the message is built.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);
    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    void set_level(LogLevel level);

    LogLevel level() const {
        return level_;
    }

    void set_filter(std::string_view spec);

    void flush();

private:
    Logger();

    LogLevel level_ = LogLevel::Warn;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Timestamp Helpers
// ============================================================================

/// Returns current local time formatted as "HH:MM:SS.mmm".
inline std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    auto now_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &now_c);
#else
    localtime_r(&now_c, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << now_ms.count();
    return oss.str();
}

/// Returns milliseconds since epoch.
inline int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// Option Parsing
// ============================================================================

/// Parse logging options from argv.
/// Recognizes: --log-level, --log-filter, --log-file, --log-format, -v/-vv/-vvv, -q.
/// Falls back to the SIFT_LOG environment variable when no level or filter is given.
LogConfig parse_log_options(int argc, char* argv[]);

// ============================================================================
// Logging Macros
// ============================================================================

// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef SIFT_MIN_LOG_LEVEL
#define SIFT_MIN_LOG_LEVEL 0
#endif

/// Internal macro, use the level-specific ones below.
#define SIFT_LOG_IMPL(level, module_str, msg)                                                      \
    do {                                                                                           \
        if (static_cast<int>(level) >= SIFT_MIN_LOG_LEVEL) {                                       \
            auto& logger_ = ::sift::log::Logger::instance();                                       \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define SIFT_LOG_TRACE(module, msg) SIFT_LOG_IMPL(::sift::log::LogLevel::Trace, module, msg)
#define SIFT_LOG_DEBUG(module, msg) SIFT_LOG_IMPL(::sift::log::LogLevel::Debug, module, msg)
#define SIFT_LOG_INFO(module, msg) SIFT_LOG_IMPL(::sift::log::LogLevel::Info, module, msg)
#define SIFT_LOG_WARN(module, msg) SIFT_LOG_IMPL(::sift::log::LogLevel::Warn, module, msg)
#define SIFT_LOG_ERROR(module, msg) SIFT_LOG_IMPL(::sift::log::LogLevel::Error, module, msg)
#define SIFT_LOG_FATAL(module, msg) SIFT_LOG_IMPL(::sift::log::LogLevel::Fatal, module, msg)

} // namespace sift::log

#endif // SIFT_LOG_HPP
