//! # autojit Logging
//!
//! Structured, module-tagged logging for the JIT layer:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Module tags for per-component filtering ("cache", "dispatch", "exttypes", ...)
//! - Console, file and null sinks
//! - Thread-safe output
//! - Compile-time level elision via AUTOJIT_MIN_LOG_LEVEL
//!
//! ## Usage
//!
//! ```cpp
//! AUTOJIT_LOG_DEBUG("cache", "miss for " << sig.to_string());
//! AUTOJIT_LOG_INFO("exttypes", "built class " << name);
//! ```

#ifndef AUTOJIT_LOG_HPP
#define AUTOJIT_LOG_HPP

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

namespace autojit::log {

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

/// Returns the upper-case name for a log level (e.g., "DEBUG").
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

/// Parses a log level name (lower or upper case).
/// Returns LogLevel::Info if the string is not recognized.
LogLevel parse_level(std::string_view s);

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level;          ///< Severity level
    std::string_view module; ///< Module tag (e.g., "cache")
    std::string message;     ///< Formatted message text
    const char* file;        ///< Source file (__FILE__)
    int line;                ///< Source line (__LINE__)
    int64_t timestamp_ms;    ///< Milliseconds since epoch
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

/// Writes to stderr, colored when stderr is a terminal.
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
};

/// Appends to a file. Flushes on Error and Fatal.
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

/// Discards all messages.
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

/// Renders a record as one line of text or JSON, without a trailing newline.
std::string format_record(const LogRecord& record, LogFormat format);

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based log level filter.
///
/// Parses filters like "cache=trace,exttypes=debug,*=warn".
class LogFilter {
public:
    LogFilter() = default;

    /// Parse a filter string. A bare module name enables Trace for it.
    void parse(std::string_view text);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest level configured for any module, used by the logger's fast path.
    LogLevel min_level() const;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger Configuration
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Warn;
    LogFormat format = LogFormat::Text;
    std::string module_filter; ///< Module filter string
    std::string log_file;    ///< Path to log file (empty = no file)
    bool console = true;     ///< Enable stderr output
    bool colors = true;      ///< Enable ANSI colors on console
};

// ============================================================================
// Logger
// ============================================================================

/// Thread-safe process logger. Auto-initializes with a Warn-level console sink.
class Logger {
public:
    /// (Re)configure the logger, replacing all sinks.
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Fast-path check used by the macros before building the message.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    void set_level(LogLevel level);

    LogLevel level() const {
        return level_;
    }

    void set_filter(std::string_view text);

    void flush();

private:
    Logger();

    LogLevel level_ = LogLevel::Warn;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Helpers
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

inline int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

/// Parse logging options from argv: --log-level=, --log-filter=, --log-file=,
/// --log-format=, -v/-vv/-vvv, -q. Falls back to the AUTOJIT_LOG environment
/// variable when neither a level nor a filter was given.
LogConfig parse_log_options(int argc, char* argv[]);

// ============================================================================
// Logging Macros
// ============================================================================

// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef AUTOJIT_MIN_LOG_LEVEL
#define AUTOJIT_MIN_LOG_LEVEL 0
#endif

/// Internal macro, use the level-specific ones below.
#define AUTOJIT_LOG_IMPL(level, module_str, msg)                                                   \
    do {                                                                                           \
        if (static_cast<int>(level) >= AUTOJIT_MIN_LOG_LEVEL) {                                    \
            auto& logger_ = ::autojit::log::Logger::instance();                                    \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define AUTOJIT_LOG_TRACE(module, msg) AUTOJIT_LOG_IMPL(::autojit::log::LogLevel::Trace, module, msg)
#define AUTOJIT_LOG_DEBUG(module, msg) AUTOJIT_LOG_IMPL(::autojit::log::LogLevel::Debug, module, msg)
#define AUTOJIT_LOG_INFO(module, msg) AUTOJIT_LOG_IMPL(::autojit::log::LogLevel::Info, module, msg)
#define AUTOJIT_LOG_WARN(module, msg) AUTOJIT_LOG_IMPL(::autojit::log::LogLevel::Warn, module, msg)
#define AUTOJIT_LOG_ERROR(module, msg) AUTOJIT_LOG_IMPL(::autojit::log::LogLevel::Error, module, msg)
#define AUTOJIT_LOG_FATAL(module, msg) AUTOJIT_LOG_IMPL(::autojit::log::LogLevel::Fatal, module, msg)

} // namespace autojit::log

#endif // AUTOJIT_LOG_HPP
