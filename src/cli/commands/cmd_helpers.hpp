//! # Command Helpers
//!
//! Small pieces shared by several command handlers: reading the project
//! configuration, building cargo invocations and writing the config cache.

#ifndef RUSTISAN_CLI_CMD_HELPERS_HPP
#define RUSTISAN_CLI_CMD_HELPERS_HPP

#include "cli/context.hpp"
#include "config/toml_document.hpp"

#include <string>
#include <vector>

namespace rustisan::cli {

/// Parses `rustisan.toml` in the project root.
Result<config::TomlDocument, CliError> load_project_config(const CommandContext& ctx);

/// Display text of the value at `key`, or `fallback` when absent.
std::string config_text(const config::TomlValue& root, const std::string& key,
                        const std::string& fallback = "");

/// `package.name` from `Cargo.toml`, or the directory name.
std::string package_name(const CommandContext& ctx);

/// A `cargo <args...>` invocation in the project root.
process::ShellCommand cargo(const CommandContext& ctx, std::vector<std::string> args);

/// True if `app.env` is `production` or APP_ENV/RUSTISAN_ENV say so.
bool is_production(const CommandContext& ctx);

/// Merges `config/*.toml` into `bootstrap/cache/config.json`.
/// Returns the number of files cached.
Result<size_t, CliError> write_config_cache(const CommandContext& ctx);

} // namespace rustisan::cli

#endif // RUSTISAN_CLI_CMD_HELPERS_HPP
