//! # Queue Commands
//!
//! The worker lives in the application's `queue` binary; every
//! `queue:<action>` becomes `cargo run --bin queue -- <action> ...`.
//! `queue:work` blocks until the worker exits.

#include "cmd_queue.hpp"

#include "cli/context.hpp"
#include "cmd_helpers.hpp"
#include "log/log.hpp"

namespace rustisan::cli {

namespace {

Status run_queue_action(CommandContext& ctx, const std::string& action,
                        const std::vector<std::string>& extra) {
    auto project = ctx.require_project();
    if (is_err(project)) {
        return project;
    }
    std::vector<std::string> args = {"run", "--bin", "queue", "--", action};
    args.insert(args.end(), extra.begin(), extra.end());
    return ctx.delegate(cargo(ctx, std::move(args)));
}

CommandHandler simple_action(std::string action) {
    return [action](const CommandDescriptor&, CommandContext& ctx) {
        RUSTISAN_LOG_INFO("queue", "Running queue " << action);
        return run_queue_action(ctx, action, {});
    };
}

} // namespace

Status run_queue_work(const CommandDescriptor& cmd, CommandContext& ctx) {
    std::string queue = cmd.flag("queue").value_or("default");
    std::vector<std::string> extra = {"--queue", queue};
    if (auto max_jobs = cmd.flag("max-jobs")) {
        extra.insert(extra.end(), {"--max-jobs", *max_jobs});
    }
    if (auto memory = cmd.flag("memory")) {
        extra.insert(extra.end(), {"--memory", *memory});
    }
    std::string sleep = std::to_string(cmd.flag_int("sleep", 3));
    extra.insert(extra.end(), {"--sleep", sleep});

    RUSTISAN_LOG_INFO("queue", "Starting worker for queue '" << queue << "' (sleep " << sleep
                                                              << "s)");
    return run_queue_action(ctx, "work", extra);
}

Status run_queue_retry(const CommandDescriptor& cmd, CommandContext& ctx) {
    std::string id = cmd.arg(0).value_or("all");
    RUSTISAN_LOG_INFO("queue", "Retrying failed job(s): " << id);
    return run_queue_action(ctx, "retry", {id});
}

void register_queue_commands(CommandRegistry& registry) {
    registry.add(CommandSpec{"queue",
                             "work",
                             {},
                             {
                                 {"queue", 0, FlagType::String, "default", "queue to work"},
                                 {"max-jobs", 0, FlagType::Int, "", "stop after N jobs"},
                                 {"memory", 0, FlagType::Int, "", "memory limit in MB"},
                                 {"sleep", 0, FlagType::Int, "3", "seconds to wait when idle"},
                             },
                             "Start a queue worker",
                             run_queue_work});
    registry.add(
        CommandSpec{"queue", "failed", {}, {}, "List failed jobs", simple_action("failed")});
    registry.add(CommandSpec{"queue",
                             "retry",
                             {{"id", false, "job id, or all"}},
                             {},
                             "Retry failed jobs",
                             run_queue_retry});
    registry.add(
        CommandSpec{"queue", "flush", {}, {}, "Delete all failed jobs", simple_action("flush")});
    registry.add(CommandSpec{
        "queue", "restart", {}, {}, "Restart queue workers", simple_action("restart")});
}

} // namespace rustisan::cli
