//! # Migrate and Seed Command Interface
//!
//! - `rustisan migrate` / `migrate up`
//! - `rustisan migrate down --steps 2`
//! - `rustisan migrate:reset`, `migrate:refresh`, `migrate:status`
//! - `rustisan seed [--class UserSeeder] [--force]`

#ifndef RUSTISAN_CLI_CMD_MIGRATE_HPP
#define RUSTISAN_CLI_CMD_MIGRATE_HPP

#include "cli/command.hpp"

#include <string>

namespace rustisan::cli {

/// Runs `cargo run --bin migrate -- <action>`.
Status run_migration(const std::string& action, int64_t steps, CommandContext& ctx);

Status run_migrate(const CommandDescriptor& cmd, CommandContext& ctx);
Status run_seed(const CommandDescriptor& cmd, CommandContext& ctx);

void register_migrate_commands(CommandRegistry& registry);

} // namespace rustisan::cli

#endif // RUSTISAN_CLI_CMD_MIGRATE_HPP
