//! # Dev Commands
//!
//! Development tooling, each a cargo invocation in the project root:
//!
//! | Command      | Runs                                                    |
//! |--------------|---------------------------------------------------------|
//! | `dev:server` | the `serve` command line, reloading when cargo-watch is installed |
//! | `dev:watch`  | `cargo watch -x check -x test`                          |
//! | `dev:format` | `cargo fmt`                                             |
//! | `dev:check`  | `cargo clippy --all-targets --all-features -- -D warnings` |
//! | `dev:docs`   | `cargo doc --no-deps [--open]`                          |

#include "cmd_dev.hpp"

#include "cli/context.hpp"
#include "cmd_helpers.hpp"
#include "cmd_serve.hpp"
#include "log/log.hpp"

namespace rustisan::cli {

namespace {

CommandHandler cargo_tool(std::string description, std::vector<std::string> args,
                          std::string done) {
    return [description, args, done](const CommandDescriptor&, CommandContext& ctx) -> Status {
        auto project = ctx.require_project();
        if (is_err(project)) {
            return project;
        }
        RUSTISAN_LOG_INFO("dev", description);
        auto result = ctx.delegate(cargo(ctx, args));
        if (is_err(result)) {
            return result;
        }
        RUSTISAN_LOG_INFO("dev", done);
        return true;
    };
}

} // namespace

Status run_dev_server(const CommandDescriptor& cmd, CommandContext& ctx) {
    auto project = ctx.require_project();
    if (is_err(project)) {
        return project;
    }
    std::string host = cmd.flag("host").value_or("127.0.0.1");
    int64_t port = cmd.flag_int("port", 3000);
    if (port < 1 || port > 65535) {
        return CliError::make(ErrorKind::ParseError,
                              "--port must be between 1 and 65535, got " + std::to_string(port));
    }

    bool reload = ctx.runner.available("cargo-watch");
    if (reload) {
        RUSTISAN_LOG_INFO("dev", "Hot reload enabled with cargo-watch");
    } else {
        RUSTISAN_LOG_WARN("dev", "cargo-watch not found, starting without hot reload "
                                 "(cargo install cargo-watch)");
    }
    RUSTISAN_LOG_INFO("dev", "Starting development server at " << host << ":" << port);
    return ctx.delegate(server_command(ctx, host, port, "development", reload));
}

Status run_dev_watch(const CommandDescriptor&, CommandContext& ctx) {
    auto project = ctx.require_project();
    if (is_err(project)) {
        return project;
    }
    if (!ctx.runner.available("cargo-watch")) {
        return CliError::make(ErrorKind::ValidationFailed,
                              "dev:watch needs cargo-watch (cargo install cargo-watch)");
    }
    RUSTISAN_LOG_INFO("dev", "Watching files for changes");
    return ctx.delegate(cargo(ctx, {"watch", "-x", "check", "-x", "test"}));
}

Status run_dev_docs(const CommandDescriptor& cmd, CommandContext& ctx) {
    auto project = ctx.require_project();
    if (is_err(project)) {
        return project;
    }
    bool open = cmd.flag_bool("open");
    std::vector<std::string> args = {"doc", "--no-deps"};
    if (open) {
        args.push_back("--open");
    }
    RUSTISAN_LOG_INFO("dev", "Generating documentation");
    auto result = ctx.delegate(cargo(ctx, std::move(args)));
    if (is_err(result)) {
        return result;
    }
    if (!open) {
        RUSTISAN_LOG_INFO("dev", "Documentation available at target/doc/");
    }
    return true;
}

void register_dev_commands(CommandRegistry& registry) {
    registry.add(CommandSpec{"dev",
                             "server",
                             {},
                             {
                                 {"host", 0, FlagType::String, "127.0.0.1", "address to bind"},
                                 {"port", 'p', FlagType::Int, "3000", "port to listen on"},
                             },
                             "Start the server with hot reload",
                             run_dev_server});
    registry.add(CommandSpec{
        "dev", "watch", {}, {}, "Check and test on every change", run_dev_watch});
    registry.add(CommandSpec{"dev",
                             "format",
                             {},
                             {},
                             "Format the code with rustfmt",
                             cargo_tool("Formatting code", {"fmt"}, "Code formatted")});
    registry.add(CommandSpec{"dev",
                             "check",
                             {},
                             {},
                             "Lint the code with clippy",
                             cargo_tool("Checking code with clippy",
                                        {"clippy", "--all-targets", "--all-features", "--", "-D",
                                         "warnings"},
                                        "Code check passed")});
    registry.add(CommandSpec{"dev",
                             "docs",
                             {},
                             {{"open", 0, FlagType::Bool, "", "open in a browser"}},
                             "Generate the documentation",
                             run_dev_docs});
}

} // namespace rustisan::cli
