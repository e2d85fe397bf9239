//! # New Command Interface
//!
//! - `rustisan new blog`: web project in `./blog`
//! - `rustisan new api --template api --path ~/src`
//! - `rustisan new tool --template ./my-template --git=false`

#ifndef RUSTISAN_CLI_CMD_NEW_HPP
#define RUSTISAN_CLI_CMD_NEW_HPP

#include "cli/command.hpp"

namespace rustisan::cli {

/// Scaffolds a new project directory.
Status run_new(const CommandDescriptor& cmd, CommandContext& ctx);

void register_new_command(CommandRegistry& registry);

} // namespace rustisan::cli

#endif // RUSTISAN_CLI_CMD_NEW_HPP
