//! # Serve and Test Command Interface
//!
//! - `rustisan serve [--host H] [--port P] [--env E] [--reload]`
//! - `rustisan test [name] [--unit | --integration]`

#ifndef RUSTISAN_CLI_CMD_SERVE_HPP
#define RUSTISAN_CLI_CMD_SERVE_HPP

#include "cli/command.hpp"
#include "process/runner.hpp"

#include <cstdint>
#include <string>

namespace rustisan::cli {

/// `cargo run`, or `cargo watch` over the sources when `reload`, with the
/// server address and environment in the child's environment.
process::ShellCommand server_command(const CommandContext& ctx, const std::string& host,
                                     int64_t port, const std::string& env, bool reload);

/// Starts the development server in the foreground.
Status run_serve(const CommandDescriptor& cmd, CommandContext& ctx);

/// Runs the project's test suite through cargo.
Status run_test(const CommandDescriptor& cmd, CommandContext& ctx);

void register_serve_commands(CommandRegistry& registry);

} // namespace rustisan::cli

#endif // RUSTISAN_CLI_CMD_SERVE_HPP
