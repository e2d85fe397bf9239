//! # Package Command Interface
//!
//! - `rustisan package:install <name> [--version V]`
//! - `rustisan package:remove <name>`
//! - `rustisan package:list`, `package:update`

#ifndef RUSTISAN_CLI_CMD_PACKAGE_HPP
#define RUSTISAN_CLI_CMD_PACKAGE_HPP

#include "cli/command.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace rustisan::cli {

/// One entry of `[dependencies]` in `Cargo.toml`.
struct PackageInfo {
    std::string name;
    std::string version; ///< "*" when the entry names no version
    std::vector<std::string> features;
};

/// The `[dependencies]` of `<root>/Cargo.toml`, sorted by name.
Result<std::vector<PackageInfo>, CliError> installed_packages(const std::filesystem::path& root);

Status run_package_install(const CommandDescriptor& cmd, CommandContext& ctx);
Status run_package_remove(const CommandDescriptor& cmd, CommandContext& ctx);
Status run_package_list(const CommandDescriptor& cmd, CommandContext& ctx);

void register_package_commands(CommandRegistry& registry);

} // namespace rustisan::cli

#endif // RUSTISAN_CLI_CMD_PACKAGE_HPP
