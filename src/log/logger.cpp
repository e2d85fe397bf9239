//! # Logger Implementation
//!
//! Line formats, the console and file sinks, module filters and the
//! process-wide logger.

#include "log/log.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>

#ifdef _WIN32
#include <io.h>
#define RUSTISAN_STDERR_IS_TTY() (_isatty(_fileno(stderr)) != 0)
#else
#include <unistd.h>
#define RUSTISAN_STDERR_IS_TTY() (isatty(fileno(stderr)) != 0)
#endif

namespace rustisan::log {

// ============================================================================
// Levels
// ============================================================================

const char* level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "trace";
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warn:
        return "warn";
    case LogLevel::Error:
        return "error";
    case LogLevel::Fatal:
        return "fatal";
    case LogLevel::Off:
        return "off";
    }
    return "unknown";
}

std::optional<LogLevel> parse_level(std::string_view s) {
    std::string lower(s);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "warning") {
        return LogLevel::Warn;
    }
    for (int i = static_cast<int>(LogLevel::Trace); i <= static_cast<int>(LogLevel::Off); ++i) {
        auto level = static_cast<LogLevel>(i);
        if (lower == level_name(level)) {
            return level;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Formats
// ============================================================================

namespace {

std::tm split_time(int64_t timestamp_ms, bool utc) {
    std::time_t seconds = static_cast<std::time_t>(timestamp_ms / 1000);
    std::tm tm_buf{};
#ifdef _WIN32
    if (utc) {
        gmtime_s(&tm_buf, &seconds);
    } else {
        localtime_s(&tm_buf, &seconds);
    }
#else
    if (utc) {
        gmtime_r(&seconds, &tm_buf);
    } else {
        localtime_r(&seconds, &tm_buf);
    }
#endif
    return tm_buf;
}

std::string iso_time(int64_t timestamp_ms) {
    std::tm tm_buf = split_time(timestamp_ms, true);
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
        << std::setw(3) << (timestamp_ms % 1000) << 'Z';
    return oss.str();
}

void append_json_string(std::ostringstream& oss, std::string_view text) {
    oss << '"';
    for (char c : text) {
        switch (c) {
        case '"':
            oss << "\\\"";
            break;
        case '\\':
            oss << "\\\\";
            break;
        case '\n':
            oss << "\\n";
            break;
        case '\r':
            oss << "\\r";
            break;
        case '\t':
            oss << "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                oss << buf;
            } else {
                oss << c;
            }
        }
    }
    oss << '"';
}

/// Severity prefix of a console line, empty at Info.
std::string console_prefix(const LogRecord& record) {
    switch (record.level) {
    case LogLevel::Trace:
    case LogLevel::Debug:
        return std::string(level_name(record.level)) + " [" + std::string(record.module) + "] ";
    case LogLevel::Warn:
        return "warning: ";
    case LogLevel::Error:
    case LogLevel::Fatal:
        return "error: ";
    case LogLevel::Info:
    case LogLevel::Off:
        break;
    }
    return "";
}

const char* prefix_color(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "\033[90m";
    case LogLevel::Debug:
        return "\033[36m";
    case LogLevel::Warn:
        return "\033[1;33m";
    case LogLevel::Error:
    case LogLevel::Fatal:
        return "\033[1;31m";
    case LogLevel::Info:
    case LogLevel::Off:
        break;
    }
    return "";
}

bool stderr_supports_color() {
    if (std::getenv("NO_COLOR")) {
        return false;
    }
    if (!RUSTISAN_STDERR_IS_TTY()) {
        return false;
    }
#ifndef _WIN32
    const char* term = std::getenv("TERM");
    if (!term || std::string_view(term) == "dumb") {
        return false;
    }
#endif
    return true;
}

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

} // namespace

std::string clock_time(int64_t timestamp_ms) {
    std::tm tm_buf = split_time(timestamp_ms, false);
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << (timestamp_ms % 1000);
    return oss.str();
}

std::string format_console(const LogRecord& record) {
    return console_prefix(record) + record.message;
}

std::string format_text(const LogRecord& record) {
    std::ostringstream oss;
    oss << iso_time(record.timestamp_ms) << ' ' << level_name(record.level) << " ["
        << record.module << "] " << record.message;
    return oss.str();
}

std::string format_json(const LogRecord& record) {
    std::ostringstream oss;
    oss << "{\"time\":";
    append_json_string(oss, iso_time(record.timestamp_ms));
    oss << ",\"level\":\"" << level_name(record.level) << "\",\"module\":";
    append_json_string(oss, record.module);
    oss << ",\"message\":";
    append_json_string(oss, record.message);
    oss << '}';
    return oss.str();
}

// ============================================================================
// Sinks
// ============================================================================

ConsoleSink::ConsoleSink(LogFormat format, bool colors, bool timestamps)
    : format_(format), colors_(colors && stderr_supports_color()), timestamps_(timestamps) {}

void ConsoleSink::write(const LogRecord& record) {
    if (format_ == LogFormat::JSON) {
        std::cerr << format_json(record) << '\n';
        return;
    }
    if (timestamps_) {
        std::cerr << clock_time(record.timestamp_ms) << ' ';
    }
    std::string prefix = console_prefix(record);
    if (colors_ && !prefix.empty()) {
        std::cerr << prefix_color(record.level) << prefix << "\033[0m";
    } else {
        std::cerr << prefix;
    }
    std::cerr << record.message << '\n';
}

void ConsoleSink::flush() {
    std::cerr.flush();
}

FileSink::FileSink(const std::string& path, LogFormat format)
    : file_(path, std::ios::out | std::ios::app), format_(format) {}

void FileSink::write(const LogRecord& record) {
    if (!file_.is_open()) {
        return;
    }
    file_ << (format_ == LogFormat::JSON ? format_json(record) : format_text(record)) << '\n';
    if (record.level >= LogLevel::Error) {
        file_.flush();
    }
}

void FileSink::flush() {
    if (file_.is_open()) {
        file_.flush();
    }
}

// ============================================================================
// Filter
// ============================================================================

std::optional<std::string> LogFilter::parse(std::string_view spec) {
    size_t pos = 0;
    while (pos <= spec.size()) {
        size_t comma = spec.find(',', pos);
        if (comma == std::string_view::npos) {
            comma = spec.size();
        }
        std::string_view entry = spec.substr(pos, comma - pos);
        pos = comma + 1;
        if (entry.empty()) {
            continue;
        }

        size_t eq = entry.find('=');
        if (eq == std::string_view::npos) {
            if (auto level = parse_level(entry)) {
                default_level_ = *level;
            } else {
                modules_[std::string(entry)] = LogLevel::Trace;
            }
            continue;
        }

        std::string_view module = entry.substr(0, eq);
        auto level = parse_level(entry.substr(eq + 1));
        if (!level) {
            return std::string(entry);
        }
        if (module == "*") {
            default_level_ = *level;
        } else {
            modules_[std::string(module)] = *level;
        }
    }
    return std::nullopt;
}

bool LogFilter::should_log(LogLevel level, std::string_view module) const {
    if (level == LogLevel::Off) {
        return false;
    }
    auto it = modules_.find(module);
    return level >= (it != modules_.end() ? it->second : default_level_);
}

LogLevel LogFilter::min_level() const {
    LogLevel lowest = default_level_;
    for (const auto& [module, level] : modules_) {
        lowest = std::min(lowest, level);
    }
    return lowest;
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger() {
    sinks_.push_back(std::make_unique<ConsoleSink>(LogFormat::Text, true, false));
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::init(const LogConfig& config) {
    auto& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);

    logger.filter_ = LogFilter();
    logger.filter_.set_default_level(config.level);
    std::optional<std::string> bad_entry;
    if (!config.filter_spec.empty()) {
        bad_entry = logger.filter_.parse(config.filter_spec);
    }
    logger.gate_.store(static_cast<int>(logger.filter_.min_level()));

    logger.sinks_.clear();
    if (config.console) {
        logger.sinks_.push_back(
            std::make_unique<ConsoleSink>(config.format, config.colors, config.timestamps));
    }

    std::vector<std::string> problems;
    if (bad_entry) {
        problems.push_back("ignoring log filter entry '" + *bad_entry + "'");
    }
    if (!config.log_file.empty()) {
        auto file = std::make_unique<FileSink>(config.log_file, config.format);
        if (file->is_open()) {
            logger.sinks_.push_back(std::move(file));
        } else {
            problems.push_back("could not open log file " + config.log_file);
        }
    }

    for (const auto& problem : problems) {
        LogRecord record{LogLevel::Warn, "log", problem, now_ms()};
        for (auto& sink : logger.sinks_) {
            sink->write(record);
        }
    }
}

bool Logger::should_log(LogLevel level, std::string_view module) const {
    if (static_cast<int>(level) < gate_.load(std::memory_order_relaxed)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return filter_.should_log(level, module);
}

void Logger::log(LogLevel level, std::string_view module, std::string message) {
    LogRecord record{level, module, std::move(message), now_ms()};
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

} // namespace rustisan::log
