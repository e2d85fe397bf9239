//! # Migrate and Seed Commands
//!
//! Migrations and seeders are compiled into the application itself, as
//! the `migrate` and `seed` binaries. These commands only forward to them.

#include "cmd_migrate.hpp"

#include "cli/context.hpp"
#include "cmd_helpers.hpp"
#include "log/log.hpp"

#include <array>
#include <string_view>

namespace rustisan::cli {

namespace {

constexpr std::array<std::string_view, 5> MIGRATE_ACTIONS = {"up", "down", "reset", "refresh",
                                                             "status"};

bool is_migrate_action(const std::string& action) {
    for (auto known : MIGRATE_ACTIONS) {
        if (action == known) {
            return true;
        }
    }
    return false;
}

CommandHandler fixed_action(std::string action) {
    return [action](const CommandDescriptor&, CommandContext& ctx) {
        return run_migration(action, 1, ctx);
    };
}

} // namespace

Status run_migration(const std::string& action, int64_t steps, CommandContext& ctx) {
    auto project = ctx.require_project();
    if (is_err(project)) {
        return project;
    }

    std::vector<std::string> args = {"run", "--bin", "migrate", "--", action};
    if (action == "down") {
        args.push_back("--steps");
        args.push_back(std::to_string(steps));
        RUSTISAN_LOG_INFO("migrate", "Rolling back " << steps << " migration(s)");
    } else {
        RUSTISAN_LOG_INFO("migrate", "Running migrate " << action);
    }
    return ctx.delegate(cargo(ctx, std::move(args)));
}

Status run_migrate(const CommandDescriptor& cmd, CommandContext& ctx) {
    std::string action = cmd.arg(0).value_or("up");
    if (!is_migrate_action(action)) {
        return CliError::make(ErrorKind::ParseError,
                              "unknown migrate action '" + action +
                                  "' (expected up, down, reset, refresh or status)");
    }
    int64_t steps = cmd.flag_int("steps", 1);
    if (steps < 1) {
        return CliError::make(ErrorKind::ParseError, "--steps must be at least 1");
    }
    return run_migration(action, steps, ctx);
}

Status run_seed(const CommandDescriptor& cmd, CommandContext& ctx) {
    auto project = ctx.require_project();
    if (is_err(project)) {
        return project;
    }
    if (is_production(ctx) && !cmd.flag_bool("force")) {
        return CliError::make(ErrorKind::ValidationFailed,
                              "refusing to run seeders in production without --force");
    }

    std::vector<std::string> args = {"run", "--bin", "seed"};
    if (auto cls = cmd.flag("class")) {
        args.insert(args.end(), {"--", "--class", *cls});
        RUSTISAN_LOG_INFO("seed", "Running seeder " << *cls);
    } else {
        RUSTISAN_LOG_INFO("seed", "Running all seeders");
    }
    return ctx.delegate(cargo(ctx, std::move(args)));
}

void register_migrate_commands(CommandRegistry& registry) {
    registry.add(CommandSpec{"migrate",
                             std::nullopt,
                             {{"action", false, "up, down, reset, refresh or status"}},
                             {{"steps", 0, FlagType::Int, "1", "migrations to roll back"}},
                             "Run database migrations",
                             run_migrate});
    registry.add(CommandSpec{
        "migrate", "reset", {}, {}, "Roll back all migrations", fixed_action("reset")});
    registry.add(CommandSpec{"migrate",
                             "refresh",
                             {},
                             {},
                             "Roll back and re-run all migrations",
                             fixed_action("refresh")});
    registry.add(CommandSpec{
        "migrate", "status", {}, {}, "Show migration status", fixed_action("status")});
    registry.add(CommandSpec{"seed",
                             std::nullopt,
                             {},
                             {
                                 {"class", 'c', FlagType::String, "", "seeder to run"},
                                 {"force", 0, FlagType::Bool, "", "allow seeding in production"},
                             },
                             "Run database seeders",
                             run_seed});
}

} // namespace rustisan::cli
