//! # Eden Logging
//!
//! A small structured logging library with:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Module-tagged messages for per-component filtering
//! - Console, file and null output sinks
//! - Thread-safe output with mutex protection
//! - Compile-time level elision via EDEN_MIN_LOG_LEVEL
//!
//! ## Usage
//!
//! ```cpp
//! EDEN_LOG_DEBUG("lexer", "Tokenizing " << size << " bytes");
//! EDEN_LOG_TRACE("lexer", "Token " << token);
//! ```
//!
//! ## Configuration
//!
//! The logger configures itself from the environment on first use:
//!
//! | Variable          | Meaning                                        |
//! |-------------------|------------------------------------------------|
//! | `EDEN_LOG`        | A level (`debug`) or a filter (`lexer=trace`)  |
//! | `EDEN_LOG_FILE`   | Also write to this file                        |
//! | `EDEN_LOG_FORMAT` | `text` (default) or `json`                     |

#ifndef EDEN_LOG_HPP
#define EDEN_LOG_HPP

#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace eden::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
/// Setting a minimum level filters out all messages below that threshold.
enum class LogLevel : int {
    Trace = 0, ///< Fine-grained internal tracing
    Debug = 1, ///< Debugging information
    Info = 2,  ///< General informational messages
    Warn = 3,  ///< Potential issues
    Error = 4, ///< Recoverable errors
    Fatal = 5, ///< Unrecoverable errors
    Off = 6    ///< Disables all logging
};

/// Returns the short string name for a log level (e.g., "TRACE", "DEBUG").
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
    LogLevel level;          ///< Severity level
    std::string_view module; ///< Module tag (e.g., "lexer")
    std::string message;     ///< Formatted message text
    const char* file;        ///< Source file (__FILE__)
    int line;                ///< Source line (__LINE__)
    int64_t timestamp_ms;    ///< Milliseconds since epoch
};

/// Output format for log messages.
enum class LogFormat {
    Text, ///< Human-readable text with optional ANSI colors
    JSON  ///< Machine-parseable JSON (one object per line)
};

/// Formats a record as one line of text: `HH:MM:SS.mmm LEVEL [module] message`.
std::string format_text(const LogRecord& record);

/// Formats a record as one JSON object (no trailing newline).
std::string format_json(const LogRecord& record);

// ============================================================================
// Log Sinks
// ============================================================================

/// Abstract base class for log output destinations.
class LogSink {
public:
    virtual ~LogSink() = default;

    /// Write a log record to the sink.
    virtual void write(const LogRecord& record) = 0;

    /// Flush any buffered output.
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

/// File sink that writes log messages to a file.
/// Auto-flushes on Error and Fatal messages.
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

/// Null sink that discards all messages (for testing/benchmarking).
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based log level filter.
///
/// Parses filter strings like "lexer=trace,*=warn" and provides fast
/// `should_log(level, module)` checks.
class LogFilter {
public:
    LogFilter() = default;

    /// Parse a filter specification string.
    /// Format: "module1=level,module2=level,*=default_level"
    /// Module names without "=level" are set to Trace.
    void parse(std::string_view spec);

    /// Check if a message at the given level from the given module should be logged.
    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// Get the minimum configured level across all modules and the default.
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
// Logger Configuration
// ============================================================================

/// Configuration for logger initialization.
struct LogConfig {
    LogLevel level = LogLevel::Warn;    ///< Global minimum log level
    LogFormat format = LogFormat::Text; ///< Output format
    std::string filter_spec;            ///< Module filter string
    std::string log_file;               ///< Path to log file (empty = no file)
    bool console = true;                ///< Enable console (stderr) output
    bool colors = true;                 ///< Enable ANSI colors on console
};

/// Builds a configuration from `EDEN_LOG`, `EDEN_LOG_FILE` and `EDEN_LOG_FORMAT`.
LogConfig config_from_env();

// ============================================================================
// Logger Singleton
// ============================================================================

/// Thread-safe global logger.
///
/// Manages sinks, filtering, and dispatches log records. The first call to
/// `instance()` initializes it from `config_from_env()` unless `init()` was
/// called before.
class Logger {
public:
    /// Initialize the global logger with the given configuration.
    static void init(const LogConfig& config);

    /// Get the global logger instance.
    static Logger& instance();

    /// Check if a message at the given level/module should be logged.
    /// This is the fast-path check used by macros before constructing the message.
    bool should_log(LogLevel level, std::string_view module) const;

    /// Log a pre-formatted record to all sinks.
    void log(const LogRecord& record);

    /// Log a message at the given level from the given module.
    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    /// Add a sink to the logger.
    void add_sink(std::unique_ptr<LogSink> sink);

    /// Remove all sinks.
    void clear_sinks();

    /// Set the global minimum log level.
    void set_level(LogLevel level);

    LogLevel level() const {
        return level_;
    }

    /// Set the module filter from a filter specification string.
    void set_filter(std::string_view spec);

    /// Flush all sinks.
    void flush();

private:
    Logger();

    void configure(const LogConfig& config);

    LogLevel level_ = LogLevel::Warn;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Timestamp Helpers
// ============================================================================

/// Returns current time formatted as "HH:MM:SS.mmm".
std::string get_timestamp();

/// Returns milliseconds since epoch (for LogRecord timestamps).
int64_t epoch_ms();

// ============================================================================
// Logging Macros
// ============================================================================

// Compile-time minimum log level gate.
// Define EDEN_MIN_LOG_LEVEL before including this header to elide
// log calls below that level at compile time.
// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef EDEN_MIN_LOG_LEVEL
#define EDEN_MIN_LOG_LEVEL 0
#endif

/// Internal macro, do not use directly.
#define EDEN_LOG_IMPL(level, module_str, msg)                                                      \
    do {                                                                                           \
        if (static_cast<int>(level) >= EDEN_MIN_LOG_LEVEL) {                                       \
            auto& logger_ = ::eden::log::Logger::instance();                                       \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

/// Log a trace-level message.
/// Usage: EDEN_LOG_TRACE("module", "message " << value);
#define EDEN_LOG_TRACE(module, msg) EDEN_LOG_IMPL(::eden::log::LogLevel::Trace, module, msg)

/// Log a debug-level message.
#define EDEN_LOG_DEBUG(module, msg) EDEN_LOG_IMPL(::eden::log::LogLevel::Debug, module, msg)

/// Log an info-level message.
#define EDEN_LOG_INFO(module, msg) EDEN_LOG_IMPL(::eden::log::LogLevel::Info, module, msg)

/// Log a warning-level message.
#define EDEN_LOG_WARN(module, msg) EDEN_LOG_IMPL(::eden::log::LogLevel::Warn, module, msg)

/// Log an error-level message.
#define EDEN_LOG_ERROR(module, msg) EDEN_LOG_IMPL(::eden::log::LogLevel::Error, module, msg)

/// Log a fatal-level message.
#define EDEN_LOG_FATAL(module, msg) EDEN_LOG_IMPL(::eden::log::LogLevel::Fatal, module, msg)

} // namespace eden::log

#endif // EDEN_LOG_HPP
