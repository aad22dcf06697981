//! # bintag Logging
//!
//! A small structured logging library shared by the codec and the CLI:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Module-tagged messages for per-component filtering
//! - Console, file and null sinks, in text or JSON-lines format
//! - Thread-safe dispatch with mutex protection
//! - Compile-time level elision via BINTAG_MIN_LOG_LEVEL
//!
//! A logger that was never initialized has no sinks, so library code can
//! log freely without producing output in programs that do not opt in.
//!
//! ## Usage
//!
//! ```cpp
//! BINTAG_LOG_INFO("cli", "Writing " << path);
//! BINTAG_LOG_TRACE("codec", "decoded TAG with " << n << " entries");
//! ```

#ifndef BINTAG_LOG_HPP
#define BINTAG_LOG_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace bintag::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0, ///< Fine-grained internal tracing
    Debug = 1, ///< Debugging information
    Info = 2,  ///< General informational messages
    Warn = 3,  ///< Potential issues
    Error = 4, ///< Recoverable errors
    Fatal = 5, ///< Unrecoverable errors
    Off = 6    ///< Disables all logging
};

/// Returns the display name for a log level (e.g., "TRACE", "DEBUG").
const char* level_name(LogLevel level);

/// Parses a log level name, ignoring case.
/// Returns LogLevel::Info if the string is not recognized.
LogLevel parse_level(std::string_view s);

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level;          ///< Severity level
    std::string_view module; ///< Module tag (e.g., "codec", "cli")
    std::string message;     ///< Formatted message text
    const char* file;        ///< Source file (__FILE__)
    int line;                ///< Source line (__LINE__)
    int64_t timestamp_ms;    ///< Milliseconds since epoch
};

/// Output format for log messages.
enum class LogFormat {
    Text, ///< Human-readable text
    JSON  ///< One JSON object per line
};

/// Formats a record as `HH:MM:SS.mmm LEVEL [module] message\n`.
std::string format_text_line(const LogRecord& record);

/// Formats a record as a single JSON object followed by a newline.
///
/// Keys are `ts`, `level`, `module` and `msg`; quotes, backslashes and
/// control characters in the module and message are escaped.
std::string format_json_line(const LogRecord& record);

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

/// Console sink writing to stderr (or another stream) with optional colors.
class ConsoleSink : public LogSink {
public:
    /// Colors are used only if requested and stderr is a color terminal.
    explicit ConsoleSink(bool use_colors = true);

    /// Writes to `out` without colors.
    explicit ConsoleSink(std::ostream& out);

    void write(const LogRecord& record) override;
    void flush() override;

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    std::ostream& out_;
    bool colors_enabled_;
    LogFormat format_ = LogFormat::Text;
};

/// File sink that writes log messages to a file.
/// Flushes after every Error and Fatal message.
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

/// Sink that discards all messages.
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
/// Parses filter strings like "codec=trace,cli=info,*=warn".
class LogFilter {
public:
    LogFilter() = default;

    /// Parse a filter specification string.
    /// Format: "module1=level,module2=level,*=default_level"
    /// A bare module name enables Trace for that module.
    void parse(std::string_view spec);

    /// Check if a message at the given level from the given module passes.
    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest level configured for any module or the default.
    LogLevel min_level() const;

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

// ============================================================================
// Logger Singleton
// ============================================================================

/// Thread-safe global logger.
class Logger {
public:
    /// Replaces sinks, level and filter according to `config`.
    static void init(const LogConfig& config);

    /// Get the global logger instance.
    static Logger& instance();

    /// Fast-path check used by the macros before formatting a message.
    bool should_log(LogLevel level, std::string_view module) const;

    /// Log a pre-formatted record to all sinks.
    void log(const LogRecord& record);

    /// Log a message at the given level from the given module.
    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Removes all sinks. Subsequent messages are dropped.
    void clear_sinks();

    /// Set the global minimum log level.
    void set_level(LogLevel level);

    LogLevel level() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return level_;
    }

    /// Set the module filter from a filter specification string.
    void set_filter(std::string_view spec);

    /// Flush all sinks.
    void flush();

private:
    Logger();

    LogLevel level_ = LogLevel::Info;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    std::atomic<bool> has_sinks_{false};
    mutable std::mutex mutex_;
};

// ============================================================================
// Time Helpers
// ============================================================================

/// Returns current local time formatted as "HH:MM:SS.mmm".
std::string get_timestamp();

/// Returns milliseconds since epoch (for LogRecord timestamps).
inline int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// CLI Parsing
// ============================================================================

/// Parse logging-related CLI options from argv.
/// Extracts: --log-level, --log-filter, --log-file, --log-format, -v/-vv/-vvv, -q
/// Falls back to the BINTAG_LOG environment variable.
LogConfig parse_log_options(int argc, char* argv[]);

/// Returns `true` for arguments consumed by `parse_log_options`.
bool is_log_option(std::string_view arg);

// ============================================================================
// Logging Macros
// ============================================================================

// Compile-time minimum log level gate.
// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef BINTAG_MIN_LOG_LEVEL
#define BINTAG_MIN_LOG_LEVEL 0
#endif

/// Internal macro, do not use directly.
#define BINTAG_LOG_IMPL(level, module_str, msg)                                                    \
    do {                                                                                           \
        if (static_cast<int>(level) >= BINTAG_MIN_LOG_LEVEL) {                                     \
            auto& logger_ = ::bintag::log::Logger::instance();                                     \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

/// Log a trace-level message.
/// Usage: BINTAG_LOG_TRACE("module", "message " << value);
#define BINTAG_LOG_TRACE(module, msg) BINTAG_LOG_IMPL(::bintag::log::LogLevel::Trace, module, msg)

/// Log a debug-level message.
#define BINTAG_LOG_DEBUG(module, msg) BINTAG_LOG_IMPL(::bintag::log::LogLevel::Debug, module, msg)

/// Log an info-level message.
#define BINTAG_LOG_INFO(module, msg) BINTAG_LOG_IMPL(::bintag::log::LogLevel::Info, module, msg)

/// Log a warning-level message.
#define BINTAG_LOG_WARN(module, msg) BINTAG_LOG_IMPL(::bintag::log::LogLevel::Warn, module, msg)

/// Log an error-level message.
#define BINTAG_LOG_ERROR(module, msg) BINTAG_LOG_IMPL(::bintag::log::LogLevel::Error, module, msg)

/// Log a fatal-level message.
#define BINTAG_LOG_FATAL(module, msg) BINTAG_LOG_IMPL(::bintag::log::LogLevel::Fatal, module, msg)

} // namespace bintag::log

#endif // BINTAG_LOG_HPP
