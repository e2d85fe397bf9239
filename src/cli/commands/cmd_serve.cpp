//! # Serve and Test Commands
//!
//! `serve` runs the application with `cargo run`, or under `cargo watch`
//! with `--reload`. The server address and environment are passed in the
//! child's environment:
//!
//! | Variable      | Flag     | Default     |
//! |---------------|----------|-------------|
//! | `APP_ENV`     | `--env`  | development |
//! | `SERVER_HOST` | `--host` | 127.0.0.1   |
//! | `SERVER_PORT` | `--port` | 3000        |

#include "cmd_serve.hpp"

#include "cli/context.hpp"
#include "cmd_helpers.hpp"
#include "common.hpp"
#include "log/log.hpp"

namespace rustisan::cli {

process::ShellCommand server_command(const CommandContext& ctx, const std::string& host,
                                     int64_t port, const std::string& env, bool reload) {
    process::ShellCommand server;
    if (reload) {
        server = cargo(ctx, {"watch", "-x", "run", "-w", "src", "-w", "Cargo.toml", "-w",
                             CONFIG_FILE_NAME});
    } else {
        server = cargo(ctx, {"run"});
    }
    server.env = {
        {"APP_ENV", env},
        {"SERVER_HOST", host},
        {"SERVER_PORT", std::to_string(port)},
    };
    return server;
}

Status run_serve(const CommandDescriptor& cmd, CommandContext& ctx) {
    auto project = ctx.require_project();
    if (is_err(project)) {
        return project;
    }

    std::string host = cmd.flag("host").value_or("127.0.0.1");
    int64_t port = cmd.flag_int("port", 3000);
    std::string env = cmd.flag("env").value_or("development");
    if (port < 1 || port > 65535) {
        return CliError::make(ErrorKind::ParseError,
                              "--port must be between 1 and 65535, got " + std::to_string(port));
    }

    bool reload = cmd.flag_bool("reload");
    if (reload && !ctx.runner.available("cargo-watch")) {
        return CliError::make(ErrorKind::ValidationFailed,
                              "--reload needs cargo-watch (cargo install cargo-watch)");
    }
    process::ShellCommand server = server_command(ctx, host, port, env, reload);

    RUSTISAN_LOG_INFO("serve", "Starting development server on http://" << host << ":" << port
                                                                         << " (" << env << ")");
    return ctx.delegate(server);
}

Status run_test(const CommandDescriptor& cmd, CommandContext& ctx) {
    auto project = ctx.require_project();
    if (is_err(project)) {
        return project;
    }
    bool unit = cmd.flag_bool("unit");
    bool integration = cmd.flag_bool("integration");
    if (unit && integration) {
        return CliError::make(ErrorKind::ParseError,
                              "--unit and --integration cannot be used together");
    }

    std::vector<std::string> args = {"test"};
    if (unit) {
        args.push_back("--lib");
    } else if (integration) {
        args.insert(args.end(), {"--test", "*"});
    }
    if (auto name = cmd.arg(0)) {
        args.push_back(*name);
    }
    return ctx.delegate(cargo(ctx, std::move(args)));
}

void register_serve_commands(CommandRegistry& registry) {
    registry.add(CommandSpec{"serve",
                             std::nullopt,
                             {},
                             {
                                 {"host", 0, FlagType::String, "127.0.0.1", "address to bind"},
                                 {"port", 'p', FlagType::Int, "3000", "port to listen on"},
                                 {"env", 'e', FlagType::String, "development", "APP_ENV value"},
                                 {"reload", 0, FlagType::Bool, "", "restart on file changes"},
                             },
                             "Start the development server",
                             run_serve});
    registry.add(CommandSpec{"test",
                             std::nullopt,
                             {{"name", false, "only tests matching this name"}},
                             {
                                 {"unit", 0, FlagType::Bool, "", "unit tests only"},
                                 {"integration", 0, FlagType::Bool, "", "integration tests only"},
                             },
                             "Run the test suite",
                             run_test});
}

} // namespace rustisan::cli
