//! # Config Command Interface
//!
//! - `rustisan config:show [--reveal]`
//! - `rustisan config:get app.name`
//! - `rustisan config:set app.name "New App"`
//! - `rustisan config:generate-key`
//! - `rustisan config:validate`
//! - `rustisan config:reset [--force]`

#ifndef RUSTISAN_CLI_CMD_CONFIG_HPP
#define RUSTISAN_CLI_CMD_CONFIG_HPP

#include "cli/command.hpp"

namespace rustisan::cli {

Status run_config_show(const CommandDescriptor& cmd, CommandContext& ctx);
Status run_config_get(const CommandDescriptor& cmd, CommandContext& ctx);
Status run_config_set(const CommandDescriptor& cmd, CommandContext& ctx);
Status run_config_generate_key(const CommandDescriptor& cmd, CommandContext& ctx);
Status run_config_validate(const CommandDescriptor& cmd, CommandContext& ctx);
Status run_config_reset(const CommandDescriptor& cmd, CommandContext& ctx);

void register_config_commands(CommandRegistry& registry);

} // namespace rustisan::cli

#endif // RUSTISAN_CLI_CMD_CONFIG_HPP
