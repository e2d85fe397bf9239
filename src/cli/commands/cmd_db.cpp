//! # Database Commands
//!
//! Creates and drops the database named by the default connection in
//! `rustisan.toml`. The work is done by the database's own client tools:
//!
//! | Driver     | create                             | drop                         |
//! |------------|------------------------------------|------------------------------|
//! | `mysql`    | `mysql -e "CREATE DATABASE ..."`   | `mysql -e "DROP DATABASE ..."` |
//! | `postgres` | `createdb`                         | `dropdb --if-exists`         |
//! | `sqlite`   | creates the database file          | removes the database file    |
//!
//! Passwords reach the clients through `MYSQL_PWD` / `PGPASSWORD` so they
//! never show up in a process listing or a log line.

#include "cmd_db.hpp"

#include "cli/context.hpp"
#include "cli/utils.hpp"
#include "cmd_helpers.hpp"
#include "common.hpp"
#include "log/log.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace rustisan::cli {

namespace {

Result<DbConnection, CliError> load_connection(const CommandContext& ctx) {
    auto project = ctx.require_project();
    if (is_err(project)) {
        return unwrap_err(project);
    }
    auto doc = load_project_config(ctx);
    if (is_err(doc)) {
        return unwrap_err(doc);
    }
    DbConnection conn = read_connection(unwrap(doc).root());
    std::string prefix = "database.connections." + conn.name + ".";
    if (conn.driver.empty()) {
        return CliError::make(ErrorKind::ValidationFailed,
                              prefix + "driver is not configured in " +
                                  std::string(CONFIG_FILE_NAME));
    }
    if (conn.database.empty()) {
        return CliError::make(ErrorKind::ValidationFailed,
                              prefix + "database is not configured in " +
                                  std::string(CONFIG_FILE_NAME));
    }
    return conn;
}

Status unsupported_driver(const DbConnection& conn) {
    return CliError::make(ErrorKind::ValidationFailed,
                          "unsupported database driver '" + conn.driver + "'");
}

/// MySQL identifier in backquotes, with embedded backquotes doubled.
std::string quote_identifier(const std::string& name) {
    std::string quoted = "`";
    for (char c : name) {
        if (c == '`') {
            quoted += '`';
        }
        quoted += c;
    }
    return quoted + "`";
}

process::ShellCommand mysql(const CommandContext& ctx, const DbConnection& conn,
                            const std::string& sql) {
    process::ShellCommand cmd;
    cmd.program = "mysql";
    cmd.args = {"-h", conn.host, "-P", conn.port, "-u", conn.username, "-e", sql};
    if (!conn.password.empty()) {
        cmd.env.emplace_back("MYSQL_PWD", conn.password);
    }
    cmd.cwd = ctx.cwd;
    return cmd;
}

process::ShellCommand postgres(const CommandContext& ctx, const DbConnection& conn,
                               const std::string& program, bool if_exists) {
    process::ShellCommand cmd;
    cmd.program = program;
    if (if_exists) {
        cmd.args.push_back("--if-exists");
    }
    cmd.args.insert(cmd.args.end(),
                    {"-h", conn.host, "-p", conn.port, "-U", conn.username, conn.database});
    if (!conn.password.empty()) {
        cmd.env.emplace_back("PGPASSWORD", conn.password);
    }
    cmd.cwd = ctx.cwd;
    return cmd;
}

fs::path sqlite_path(const CommandContext& ctx, const DbConnection& conn) {
    fs::path path = conn.database;
    return path.is_absolute() ? path : ctx.cwd / path;
}

Status create_database(CommandContext& ctx, const DbConnection& conn) {
    RUSTISAN_LOG_INFO("db", "Creating database '" << conn.database << "'");
    Status result = true;
    if (conn.driver == "mysql") {
        result = ctx.delegate(mysql(ctx, conn, "CREATE DATABASE IF NOT EXISTS " + quote_identifier(conn.database)));
    } else if (conn.driver == "postgres") {
        result = ctx.delegate(postgres(ctx, conn, "createdb", false));
    } else if (conn.driver == "sqlite") {
        fs::path file = sqlite_path(ctx, conn);
        std::error_code ec;
        if (!fs::exists(file, ec)) {
            result = write_file(file, "");
        }
    } else {
        return unsupported_driver(conn);
    }
    if (is_ok(result)) {
        RUSTISAN_LOG_INFO("db", "Database '" << conn.database << "' created");
    }
    return result;
}

Status drop_database(CommandContext& ctx, const DbConnection& conn, bool force) {
    if (!force && !ctx.confirm("This will permanently delete database '" + conn.database +
                               "'. Continue?")) {
        return CliError::make(ErrorKind::Cancelled, "database drop cancelled");
    }
    RUSTISAN_LOG_INFO("db", "Dropping database '" << conn.database << "'");
    Status result = true;
    if (conn.driver == "mysql") {
        result = ctx.delegate(mysql(ctx, conn, "DROP DATABASE IF EXISTS " + quote_identifier(conn.database)));
    } else if (conn.driver == "postgres") {
        result = ctx.delegate(postgres(ctx, conn, "dropdb", true));
    } else if (conn.driver == "sqlite") {
        std::error_code ec;
        fs::remove(sqlite_path(ctx, conn), ec);
        if (ec) {
            return CliError::make(ErrorKind::IoError, "cannot remove " + conn.database + ": " +
                                                          ec.message());
        }
    } else {
        return unsupported_driver(conn);
    }
    if (is_ok(result)) {
        RUSTISAN_LOG_INFO("db", "Database '" << conn.database << "' dropped");
    }
    return result;
}

} // namespace

DbConnection read_connection(const config::TomlValue& root) {
    DbConnection conn;
    conn.name = config_text(root, "database.default", "default");
    std::string prefix = "database.connections." + config::format_key(conn.name) + ".";
    conn.driver = config_text(root, prefix + "driver");
    conn.host = config_text(root, prefix + "host", "localhost");
    conn.port = config_text(root, prefix + "port",
                            conn.driver == "postgres" ? "5432" : "3306");
    conn.database = config_text(root, prefix + "database");
    conn.username = config_text(root, prefix + "username", "root");
    conn.password = config_text(root, prefix + "password");
    return conn;
}

Status run_db_status(const CommandDescriptor&, CommandContext& ctx) {
    auto conn = load_connection(ctx);
    if (is_err(conn)) {
        return unwrap_err(conn);
    }
    const auto& c = unwrap(conn);
    ctx.out << "Connection: " << c.name << "\n";
    ctx.out << "Driver:     " << c.driver << "\n";
    if (c.driver != "sqlite") {
        ctx.out << "Host:       " << c.host << ":" << c.port << "\n";
    }
    ctx.out << "Database:   " << c.database << "\n";
    RUSTISAN_LOG_INFO("db", "Use 'rustisan migrate:status' for migration details");
    return true;
}

Status run_db_create(const CommandDescriptor&, CommandContext& ctx) {
    auto conn = load_connection(ctx);
    if (is_err(conn)) {
        return unwrap_err(conn);
    }
    return create_database(ctx, unwrap(conn));
}

Status run_db_drop(const CommandDescriptor& cmd, CommandContext& ctx) {
    auto conn = load_connection(ctx);
    if (is_err(conn)) {
        return unwrap_err(conn);
    }
    return drop_database(ctx, unwrap(conn), cmd.flag_bool("force"));
}

Status run_db_reset(const CommandDescriptor& cmd, CommandContext& ctx) {
    auto conn = load_connection(ctx);
    if (is_err(conn)) {
        return unwrap_err(conn);
    }
    auto dropped = drop_database(ctx, unwrap(conn), cmd.flag_bool("force"));
    if (is_err(dropped)) {
        return dropped;
    }
    return create_database(ctx, unwrap(conn));
}

Status run_db_seed(const CommandDescriptor&, CommandContext& ctx) {
    auto project = ctx.require_project();
    if (is_err(project)) {
        return project;
    }
    RUSTISAN_LOG_INFO("db", "Seeding database");
    return ctx.delegate(cargo(ctx, {"run", "--bin", "seed"}));
}

void register_db_commands(CommandRegistry& registry) {
    FlagSpec force{"force", 'f', FlagType::Bool, "", "skip the confirmation"};
    registry.add(CommandSpec{"db", "status", {}, {}, "Show the database connection", run_db_status});
    registry.add(CommandSpec{"db", "create", {}, {}, "Create the database", run_db_create});
    registry.add(CommandSpec{"db", "drop", {}, {force}, "Drop the database", run_db_drop});
    registry.add(CommandSpec{
        "db", "reset", {}, {force}, "Drop and recreate the database", run_db_reset});
    registry.add(CommandSpec{"db", "seed", {}, {}, "Run the database seeders", run_db_seed});
}

} // namespace rustisan::cli
