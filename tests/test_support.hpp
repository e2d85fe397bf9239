//! # Test Support
//!
//! Fixtures shared by the rustisan tests: a process runner that records
//! instead of executing, a log sink that keeps records in memory, and a
//! scratch project directory.

#pragma once

#include "cli/context.hpp"
#include "log/log.hpp"
#include "process/runner.hpp"

#include <chrono>
#include <filesystem>
#include <gtest/gtest.h>
#include <map>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace rustisan::testing {

namespace fs = std::filesystem;

/// Records every command and answers with a configured exit status.
class RecordingRunner : public process::ProcessRunner {
public:
    int run(const process::ShellCommand& command) override {
        commands.push_back(command);
        auto it = exit_codes.find(command.program);
        return it == exit_codes.end() ? 0 : it->second;
    }

    bool available(const std::string& program) override {
        return installed.count(program) > 0;
    }

    /// `display()` of every recorded command.
    std::vector<std::string> lines() const {
        std::vector<std::string> out;
        for (const auto& cmd : commands) {
            out.push_back(cmd.display());
        }
        return out;
    }

    std::vector<process::ShellCommand> commands;
    std::map<std::string, int> exit_codes;
    std::set<std::string> installed;
};

/// Keeps log records in memory.
class CaptureSink : public log::LogSink {
public:
    struct Entry {
        log::LogLevel level;
        std::string module;
        std::string message;
    };

    void write(const log::LogRecord& record) override {
        records.push_back({record.level, std::string(record.module), record.message});
    }
    void flush() override {}

    bool contains(const std::string& text) const {
        for (const auto& r : records) {
            if (r.message.find(text) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    std::vector<Entry> records;
};

/// Fixed point in time: 2024-03-05 14:07:09 UTC.
std::chrono::system_clock::time_point fixed_time();

/// Creates a unique empty directory under the system temp directory.
fs::path make_temp_dir(const std::string& prefix);

/// Reads a whole file, or returns an empty string.
std::string read_text(const fs::path& path);

/// Writes a file, creating parent directories.
void write_text(const fs::path& path, const std::string& content);

/// Base fixture: a scratch directory holding a minimal rustisan project
/// (`Cargo.toml` and the default `rustisan.toml`), a recording runner and
/// captured output. Log records are captured too.
class ProjectTest : public ::testing::Test {
protected:
    void SetUp() override;
    void TearDown() override;

    /// Context over `root` with the recording runner and string streams.
    cli::CommandContext context();

    /// Sets the text read by interactive confirmations.
    void answer(const std::string& text) {
        input.str(text);
        input.clear();
    }

    fs::path root;
    RecordingRunner runner;
    std::ostringstream output;
    std::istringstream input;
    CaptureSink* logs = nullptr;
};

} // namespace rustisan::testing
