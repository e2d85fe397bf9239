//! # System Process Runner
//!
//! Shell rendering of `ShellCommand` and the `std::system` based runner.

#include "process/runner.hpp"

#include "log/log.hpp"

#include <cstdlib>

#ifndef _WIN32
#include <sys/wait.h>
#endif

namespace rustisan::process {

std::string shell_quote(std::string_view word) {
    std::string result = "\"";
    for (char c : word) {
        // Characters that stay special inside double quotes
        if (c == '"' || c == '\\' || c == '$' || c == '`') {
            result += '\\';
        }
        result += c;
    }
    result += '"';
    return result;
}

auto ShellCommand::display() const -> std::string {
    std::string result = program;
    for (const auto& arg : args) {
        result += ' ';
        if (arg.empty() || arg.find_first_of(" \t\"'$`\\*?") != std::string::npos) {
            result += shell_quote(arg);
        } else {
            result += arg;
        }
    }
    return result;
}

auto ShellCommand::to_string() const -> std::string {
    std::string line;
    if (!cwd.empty()) {
        line += "cd " + shell_quote(cwd.string()) + " && ";
    }
    for (const auto& [name, value] : env) {
        line += name + "=" + shell_quote(value) + " ";
    }
    line += shell_quote(program);
    for (const auto& arg : args) {
        line += " " + shell_quote(arg);
    }
    return line;
}

int SystemProcessRunner::run(const ShellCommand& command) {
    std::string line = command.to_string();
    RUSTISAN_LOG_DEBUG("process", "Running: " << line);

    int ret = std::system(line.c_str());
    if (ret == -1) {
        RUSTISAN_LOG_ERROR("process", "Failed to start " << command.program);
        return -1;
    }

#ifdef _WIN32
    return ret;
#else
    if (WIFEXITED(ret)) {
        return WEXITSTATUS(ret);
    }
    // Killed by a signal, reported the way shells do
    if (WIFSIGNALED(ret)) {
        return 128 + WTERMSIG(ret);
    }
    return 1;
#endif
}

bool SystemProcessRunner::available(const std::string& program) {
#ifdef _WIN32
    std::string check = "where " + program + " >nul 2>&1";
#else
    std::string check = "command -v " + shell_quote(program) + " >/dev/null 2>&1";
#endif
    return std::system(check.c_str()) == 0;
}

} // namespace rustisan::process
