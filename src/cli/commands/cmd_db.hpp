//! # Database Command Interface
//!
//! - `rustisan db:status`
//! - `rustisan db:create`
//! - `rustisan db:drop [--force]`
//! - `rustisan db:reset [--force]`
//! - `rustisan db:seed`

#ifndef RUSTISAN_CLI_CMD_DB_HPP
#define RUSTISAN_CLI_CMD_DB_HPP

#include "cli/command.hpp"
#include "config/toml_value.hpp"

#include <string>

namespace rustisan::cli {

/// The configured default database connection.
struct DbConnection {
    std::string name;
    std::string driver;
    std::string host;
    std::string port;
    std::string database;
    std::string username;
    std::string password;
};

/// Reads `database.connections.<database.default>` from a config tree.
DbConnection read_connection(const config::TomlValue& root);

Status run_db_status(const CommandDescriptor& cmd, CommandContext& ctx);
Status run_db_create(const CommandDescriptor& cmd, CommandContext& ctx);
Status run_db_drop(const CommandDescriptor& cmd, CommandContext& ctx);
Status run_db_reset(const CommandDescriptor& cmd, CommandContext& ctx);
Status run_db_seed(const CommandDescriptor& cmd, CommandContext& ctx);

void register_db_commands(CommandRegistry& registry);

} // namespace rustisan::cli

#endif // RUSTISAN_CLI_CMD_DB_HPP
