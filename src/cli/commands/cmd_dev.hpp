//! # Dev Command Interface
//!
//! - `rustisan dev:server [--host H] [--port P]`
//! - `rustisan dev:watch`, `dev:format`, `dev:check`
//! - `rustisan dev:docs [--open]`

#ifndef RUSTISAN_CLI_CMD_DEV_HPP
#define RUSTISAN_CLI_CMD_DEV_HPP

#include "cli/command.hpp"

namespace rustisan::cli {

/// Runs the server under cargo-watch when it is installed, else once.
Status run_dev_server(const CommandDescriptor& cmd, CommandContext& ctx);

Status run_dev_watch(const CommandDescriptor& cmd, CommandContext& ctx);
Status run_dev_docs(const CommandDescriptor& cmd, CommandContext& ctx);

void register_dev_commands(CommandRegistry& registry);

} // namespace rustisan::cli

#endif // RUSTISAN_CLI_CMD_DEV_HPP
