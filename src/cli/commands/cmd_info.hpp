//! # Info Command Interface
//!
//! - `rustisan info`: tool version, project name and environment
//! - `rustisan info --detailed`: also dependencies and environment variables

#ifndef RUSTISAN_CLI_CMD_INFO_HPP
#define RUSTISAN_CLI_CMD_INFO_HPP

#include "cli/command.hpp"

namespace rustisan::cli {

Status run_info(const CommandDescriptor& cmd, CommandContext& ctx);

void register_info_command(CommandRegistry& registry);

} // namespace rustisan::cli

#endif // RUSTISAN_CLI_CMD_INFO_HPP
