//! # Make Command Interface
//!
//! One `make:<kind>` command per component kind:
//!
//! - `rustisan make:controller PostController --resource`
//! - `rustisan make:model Post --migration --factory --seeder`
//! - `rustisan make:migration add_slug_to_posts --table posts`

#ifndef RUSTISAN_CLI_CMD_MAKE_HPP
#define RUSTISAN_CLI_CMD_MAKE_HPP

#include "cli/command.hpp"
#include "generator/layout.hpp"

namespace rustisan::cli {

/// Generates a component of `kind` (and its secondaries) into the project.
Status run_make(generator::ComponentKind kind, const CommandDescriptor& cmd, CommandContext& ctx);

void register_make_commands(CommandRegistry& registry);

} // namespace rustisan::cli

#endif // RUSTISAN_CLI_CMD_MAKE_HPP
