//! # Cache Command Interface
//!
//! - `rustisan cache:clear`
//! - `rustisan cache:forget <key>`
//! - `rustisan cache:config`

#ifndef RUSTISAN_CLI_CMD_CACHE_HPP
#define RUSTISAN_CLI_CMD_CACHE_HPP

#include "cli/command.hpp"

namespace rustisan::cli {

Status run_cache_clear(const CommandDescriptor& cmd, CommandContext& ctx);
Status run_cache_forget(const CommandDescriptor& cmd, CommandContext& ctx);
Status run_cache_config(const CommandDescriptor& cmd, CommandContext& ctx);

void register_cache_commands(CommandRegistry& registry);

} // namespace rustisan::cli

#endif // RUSTISAN_CLI_CMD_CACHE_HPP
