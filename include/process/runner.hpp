//! # External Process Runner
//!
//! Commands such as `serve`, `migrate` and `build` do their real work in
//! external tools (cargo, git, database clients, docker). They all reach
//! those tools through `ProcessRunner`, so tests can substitute a recorder
//! for the real shell.
//!
//! ## Example
//!
//! ```cpp
//! ShellCommand cmd{"cargo", {"run", "--bin", "migrate", "--", "up"}};
//! cmd.cwd = project_root;
//! int status = runner.run(cmd);
//! ```

#ifndef RUSTISAN_PROCESS_RUNNER_HPP
#define RUSTISAN_PROCESS_RUNNER_HPP

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rustisan::process {

/// A single external command line.
struct ShellCommand {
    /// Program name, resolved through PATH.
    std::string program;

    /// Arguments, passed verbatim (each is quoted on rendering).
    std::vector<std::string> args;

    /// Extra environment variables for the child.
    std::vector<std::pair<std::string, std::string>> env;

    /// Working directory. Empty means the current directory.
    std::filesystem::path cwd;

    /// Renders the command as a POSIX shell line, e.g.
    /// `cd "/app" && APP_ENV="local" "cargo" "run"`.
    [[nodiscard]] auto to_string() const -> std::string;

    /// Renders only `program args...`, for log messages.
    [[nodiscard]] auto display() const -> std::string;
};

/// Quotes a word for a POSIX shell using double quotes.
std::string shell_quote(std::string_view word);

/// Abstract interface to run external commands synchronously.
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    /// Runs the command in the foreground and returns its exit status.
    /// Returns -1 if the command could not be started.
    virtual int run(const ShellCommand& command) = 0;

    /// Returns true if `program` can be found on PATH.
    virtual bool available(const std::string& program) = 0;
};

/// Runs commands through the system shell (`std::system`).
class SystemProcessRunner : public ProcessRunner {
public:
    int run(const ShellCommand& command) override;
    bool available(const std::string& program) override;
};

} // namespace rustisan::process

#endif // RUSTISAN_PROCESS_RUNNER_HPP
