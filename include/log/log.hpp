//! # rustisan Logging
//!
//! Leveled, module-tagged diagnostics for the rustisan CLI. Progress and
//! errors go through the logger; command results (config values, listings)
//! are written to the command's output stream instead.
//!
//! Console lines follow the usual toolchain style:
//!
//! ```text
//! Created model: src/models/post.rs
//! warning: 'app.key' is empty
//! error: TargetExistsError: src/models/post.rs already exists
//! debug [config] inserting 'mail.driver' after line 12
//! ```
//!
//! ## Usage
//!
//! ```cpp
//! RUSTISAN_LOG_INFO("make", "Created " << path);
//! RUSTISAN_LOG_DEBUG("config", "Inserting " << key << " after line " << line);
//! ```

#ifndef RUSTISAN_LOG_HPP
#define RUSTISAN_LOG_HPP

#include <atomic>
#include <cstdint>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace rustisan::log {

// ============================================================================
// Levels
// ============================================================================

enum class LogLevel : int {
    Trace = 0,
    Debug = 1,
    Info = 2, ///< Default for the CLI
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6
};

/// Lower-case name: "trace", "debug", "info", ...
const char* level_name(LogLevel level);

/// Case-insensitive level name. "warning" is accepted for Warn.
std::optional<LogLevel> parse_level(std::string_view s);

// ============================================================================
// Records and Formats
// ============================================================================

struct LogRecord {
    LogLevel level;
    std::string_view module; ///< "make", "config", "db", ...
    std::string message;
    int64_t timestamp_ms; ///< Milliseconds since epoch
};

enum class LogFormat {
    Text,
    JSON ///< One object per line
};

/// Console line without colors: the bare message at Info, a severity
/// prefix otherwise.
std::string format_console(const LogRecord& record);

/// `2024-03-05T14:07:09.120Z info [make] message`
std::string format_text(const LogRecord& record);

/// `{"time":...,"level":"info","module":"make","message":"..."}`
std::string format_json(const LogRecord& record);

/// "HH:MM:SS.mmm" local time of the record.
std::string clock_time(int64_t timestamp_ms);

// ============================================================================
// Sinks
// ============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Writes to stderr. Severity prefixes are colored when stderr is a
/// terminal and NO_COLOR is unset.
class ConsoleSink : public LogSink {
public:
    ConsoleSink(LogFormat format, bool colors, bool timestamps);

    void write(const LogRecord& record) override;
    void flush() override;

private:
    LogFormat format_;
    bool colors_;
    bool timestamps_;
};

/// Appends to a file. Flushed after every Error and Fatal record.
class FileSink : public LogSink {
public:
    FileSink(const std::string& path, LogFormat format);

    void write(const LogRecord& record) override;
    void flush() override;

    bool is_open() const {
        return file_.is_open();
    }

private:
    std::ofstream file_;
    LogFormat format_;
};

// ============================================================================
// Filter
// ============================================================================

/// Per-module levels parsed from specs such as `make=debug,db=off,warn`.
/// A bare level sets the default; a bare module name enables Trace for it.
class LogFilter {
public:
    /// Returns the offending entry when a level name is not recognized.
    std::optional<std::string> parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }
    LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest level any module can emit.
    LogLevel min_level() const;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::map<std::string, LogLevel, std::less<>> modules_;
};

// ============================================================================
// Logger
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Info;
    LogFormat format = LogFormat::Text;
    std::string filter_spec;
    std::string log_file; ///< Empty for no file sink
    bool console = true;
    bool colors = true;
    bool timestamps = false; ///< Prefix console lines with the time (-vvv)
};

/// Process-wide logger. Starts with an Info console sink until `init()`.
class Logger {
public:
    static void init(const LogConfig& config);
    static Logger& instance();

    /// Checked by the macros before the message is built.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(LogLevel level, std::string_view module, std::string message);

    void add_sink(std::unique_ptr<LogSink> sink);
    void clear_sinks();
    void flush();

private:
    Logger();

    std::atomic<int> gate_{static_cast<int>(LogLevel::Info)};
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Command Line
// ============================================================================

/// Reads `-v`, `-vv`, `-vvv`, `--verbose`, `-q`, `--quiet`, `--log-level=`,
/// `--log-filter=`, `--log-file=` and `--log-format=` up to a `--` token.
/// Without a level or filter on the command line, RUSTISAN_LOG is read as
/// a filter spec.
LogConfig parse_log_options(int argc, char* argv[]);

/// True for every token `parse_log_options` consumes.
bool is_log_option(std::string_view arg);

// ============================================================================
// Macros
// ============================================================================

#define RUSTISAN_LOG_AT(level, module_str, msg)                                                    \
    do {                                                                                           \
        auto& rustisan_logger_ = ::rustisan::log::Logger::instance();                              \
        if (rustisan_logger_.should_log(level, module_str)) {                                      \
            std::ostringstream rustisan_oss_;                                                      \
            rustisan_oss_ << msg;                                                                  \
            rustisan_logger_.log(level, module_str, rustisan_oss_.str());                          \
        }                                                                                          \
    } while (0)

#define RUSTISAN_LOG_TRACE(module, msg)                                                            \
    RUSTISAN_LOG_AT(::rustisan::log::LogLevel::Trace, module, msg)
#define RUSTISAN_LOG_DEBUG(module, msg)                                                            \
    RUSTISAN_LOG_AT(::rustisan::log::LogLevel::Debug, module, msg)
#define RUSTISAN_LOG_INFO(module, msg) RUSTISAN_LOG_AT(::rustisan::log::LogLevel::Info, module, msg)
#define RUSTISAN_LOG_WARN(module, msg) RUSTISAN_LOG_AT(::rustisan::log::LogLevel::Warn, module, msg)
#define RUSTISAN_LOG_ERROR(module, msg)                                                            \
    RUSTISAN_LOG_AT(::rustisan::log::LogLevel::Error, module, msg)
#define RUSTISAN_LOG_FATAL(module, msg)                                                            \
    RUSTISAN_LOG_AT(::rustisan::log::LogLevel::Fatal, module, msg)

} // namespace rustisan::log

#endif // RUSTISAN_LOG_HPP
