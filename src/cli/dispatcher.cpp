//! # CLI Command Dispatcher
//!
//! This file implements the main entry point for the rustisan CLI.
//! It configures logging, parses the command line through the command
//! registry and routes to the registered handler.
//!
//! ## Architecture
//!
//! ```text
//! rustisan_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   ├─ new            → run_new()
//!   ├─ serve, test    → run_serve(), run_test()
//!   ├─ make:<kind>    → run_make()
//!   ├─ db:*           → run_db_*()
//!   ├─ migrate[:*]    → run_migrate()
//!   ├─ seed           → run_seed()
//!   ├─ cache:*        → run_cache_*()
//!   ├─ queue:*        → run_queue_*()
//!   ├─ route:*        → run_route_*()
//!   ├─ config:*       → run_config_*()
//!   ├─ build          → run_build()
//!   ├─ deploy[:init]  → run_deploy(), run_deploy_init()
//!   ├─ package:*      → run_package_*()
//!   ├─ dev:*          → run_dev_*()
//!   └─ info           → run_info()
//! ```
//!
//! ## Command Categories
//!
//! | Category    | Commands                          | Description                  |
//! |-------------|-----------------------------------|------------------------------|
//! | Project     | new, info                         | Create and inspect projects  |
//! | Generation  | make:*                            | Generate components          |
//! | Database    | db:*, migrate, seed               | Database tooling             |
//! | Runtime     | serve, queue:*, cache:*, route:*  | Run and maintain the app     |
//! | Config      | config:*                          | Edit `rustisan.toml`         |
//! | Delivery    | test, build, deploy               | Test, build and ship         |
//! | Tooling     | package:*, dev:*                  | Dependencies and dev tools   |
//!
//! ## Exit Codes
//!
//! | Code | Meaning                                              |
//! |------|------------------------------------------------------|
//! | 0    | Success                                              |
//! | 1    | Command failed                                       |
//! | 2    | Unknown command or malformed arguments               |
//! | N    | Exit status of a failed external tool                |

#include "commands/cmd_build.hpp"
#include "commands/cmd_cache.hpp"
#include "commands/cmd_config.hpp"
#include "commands/cmd_db.hpp"
#include "commands/cmd_deploy.hpp"
#include "commands/cmd_dev.hpp"
#include "commands/cmd_info.hpp"
#include "commands/cmd_make.hpp"
#include "commands/cmd_migrate.hpp"
#include "commands/cmd_new.hpp"
#include "commands/cmd_package.hpp"
#include "commands/cmd_queue.hpp"
#include "commands/cmd_route.hpp"
#include "commands/cmd_serve.hpp"
#include "cli/context.hpp"
#include "common.hpp"
#include "driver.hpp"
#include "log/log.hpp"
#include "utils.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace rustisan::cli {

CommandRegistry build_registry() {
    CommandRegistry registry;
    register_new_command(registry);
    register_serve_commands(registry);
    register_make_commands(registry);
    register_db_commands(registry);
    register_migrate_commands(registry);
    register_cache_commands(registry);
    register_queue_commands(registry);
    register_route_commands(registry);
    register_config_commands(registry);
    register_build_command(registry);
    register_deploy_commands(registry);
    register_package_commands(registry);
    register_dev_commands(registry);
    register_info_command(registry);
    return registry;
}

/// Main entry point for the rustisan CLI.
///
/// ## Examples
///
/// ```bash
/// rustisan new blog                      # Scaffold a project
/// rustisan make:model Post -m -f -s      # Model, migration, factory, seeder
/// rustisan config:set app.name "Blog"    # Edit rustisan.toml
/// rustisan migrate -v                    # Run migrations with debug logging
/// ```
int rustisan_main(int argc, char* argv[]) {
    log::LogConfig log_config = log::parse_log_options(argc, argv);
    log::Logger::init(log_config);

    std::vector<std::string> tokens;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--quiet" || arg == "-q") {
            GlobalOptions::quiet = true;
        }
        tokens.push_back(std::move(arg));
    }

    CommandRegistry registry = build_registry();

    // First token that is not a logging option
    size_t first = 0;
    while (first < tokens.size() && log::is_log_option(tokens[first])) {
        ++first;
    }
    if (first == tokens.size() || tokens[first] == "--help" || tokens[first] == "-h") {
        print_usage(registry, std::cout);
        return 0;
    }
    if (tokens[first] == "--version" || tokens[first] == "-V") {
        print_version(std::cout);
        return 0;
    }

    auto parsed = registry.parse(tokens);
    if (is_err(parsed)) {
        const CliError& err = unwrap_err(parsed);
        RUSTISAN_LOG_ERROR("cli", err.to_string());
        std::cerr << "Run 'rustisan --help' for usage information.\n";
        return err.exit_code();
    }

    const ParsedCommand& command = unwrap(parsed);
    if (command.help_requested) {
        std::cout << command.spec->usage();
        return 0;
    }

    process::SystemProcessRunner runner;
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (ec) {
        RUSTISAN_LOG_ERROR("cli", "cannot determine the current directory: " << ec.message());
        return 1;
    }
    CommandContext ctx{cwd, runner, std::cout, std::cin};

    RUSTISAN_LOG_DEBUG("cli", "Dispatching " << command.descriptor.name());
    auto result = registry.dispatch(command.descriptor, ctx);
    if (is_err(result)) {
        const CliError& err = unwrap_err(result);
        RUSTISAN_LOG_ERROR("cli", err.to_string());
        return err.exit_code();
    }
    return 0;
}

} // namespace rustisan::cli

// Entry point wrapper (outside namespace)
int rustisan_main(int argc, char* argv[]) {
    return rustisan::cli::rustisan_main(argc, argv);
}
