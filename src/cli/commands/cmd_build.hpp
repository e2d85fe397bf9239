//! # Build Command Interface
//!
//! - `rustisan build`: production (release) build
//! - `rustisan build --env staging --optimize`
//! - `rustisan build --output dist`

#ifndef RUSTISAN_CLI_CMD_BUILD_HPP
#define RUSTISAN_CLI_CMD_BUILD_HPP

#include "cli/command.hpp"

namespace rustisan::cli {

Status run_build(const CommandDescriptor& cmd, CommandContext& ctx);

void register_build_command(CommandRegistry& registry);

} // namespace rustisan::cli

#endif // RUSTISAN_CLI_CMD_BUILD_HPP
