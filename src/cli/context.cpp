//! # Command Context Helpers

#include "cli/context.hpp"

#include "common.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace rustisan::cli {

fs::path CommandContext::config_path() const {
    return cwd / CONFIG_FILE_NAME;
}

Status CommandContext::require_project() const {
    std::error_code ec;
    if (!fs::exists(config_path(), ec) || !fs::exists(cwd / "Cargo.toml", ec)) {
        return CliError::make(ErrorKind::NotAProject,
                              "not a rustisan project (no " + std::string(CONFIG_FILE_NAME) +
                                  " and Cargo.toml in " + cwd.string() + ")");
    }
    return true;
}

bool CommandContext::confirm(const std::string& question) {
    out << question << " [y/N] " << std::flush;
    std::string answer;
    if (!std::getline(in, answer)) {
        return false;
    }
    std::transform(answer.begin(), answer.end(), answer.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return answer == "y" || answer == "yes";
}

Status CommandContext::delegate(const process::ShellCommand& command) {
    RUSTISAN_LOG_INFO("process", "Running " << command.display());
    int status = runner.run(command);
    if (status != 0) {
        if (status < 0) {
            return CliError::delegated("could not start " + command.program, 1);
        }
        return CliError::delegated(command.display() + " exited with status " +
                                       std::to_string(status),
                                   status);
    }
    return true;
}

} // namespace rustisan::cli
