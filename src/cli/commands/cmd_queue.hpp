//! # Queue Command Interface
//!
//! - `rustisan queue:work [--queue Q] [--max-jobs N] [--memory MB] [--sleep S]`
//! - `rustisan queue:failed`, `queue:retry [id]`, `queue:flush`, `queue:restart`

#ifndef RUSTISAN_CLI_CMD_QUEUE_HPP
#define RUSTISAN_CLI_CMD_QUEUE_HPP

#include "cli/command.hpp"

namespace rustisan::cli {

Status run_queue_work(const CommandDescriptor& cmd, CommandContext& ctx);
Status run_queue_retry(const CommandDescriptor& cmd, CommandContext& ctx);

void register_queue_commands(CommandRegistry& registry);

} // namespace rustisan::cli

#endif // RUSTISAN_CLI_CMD_QUEUE_HPP
