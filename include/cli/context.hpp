//! # Command Context
//!
//! Everything a command handler may touch outside its own arguments: the
//! project directory, the external process runner, the clock and the
//! user-facing streams. `main` builds one from the real environment;
//! tests build one over a temporary directory and a recording runner.

#pragma once

#include "cli/error.hpp"
#include "process/runner.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>

namespace rustisan::cli {

namespace fs = std::filesystem;

using Clock = std::function<std::chrono::system_clock::time_point()>;

struct CommandContext {
    /// Directory the command operates in (the project root for most commands).
    fs::path cwd;

    /// Runner for delegated work.
    process::ProcessRunner& runner;

    /// Results meant for the user (config values, listings).
    std::ostream& out;

    /// Source of interactive confirmations.
    std::istream& in;

    /// Time source for timestamped file names.
    Clock now = [] { return std::chrono::system_clock::now(); };

    /// Path of `rustisan.toml` in `cwd`.
    fs::path config_path() const;

    /// Fails with `NotAProject` unless `cwd` holds `rustisan.toml` and `Cargo.toml`.
    Status require_project() const;

    /// Asks a yes/no question on `out` and reads the answer from `in`.
    /// Only "y" and "yes" (any case) confirm.
    bool confirm(const std::string& question);

    /// Runs a delegated command, mapping a non-zero exit to `DelegatedFailure`.
    Status delegate(const process::ShellCommand& command);
};

} // namespace rustisan::cli
