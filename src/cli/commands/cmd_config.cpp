//! # Config Commands
//!
//! User-facing access to `rustisan.toml`. Values are printed on stdout so
//! they can be captured by scripts; everything else goes to the log.
//!
//! `config:get` prints the value as stored. `config:show` lists every leaf
//! and masks secrets (`app.key`, passwords, tokens) unless `--reveal` is
//! given.

#include "cmd_config.hpp"

#include "cli/context.hpp"
#include "config/config_store.hpp"
#include "log/log.hpp"

namespace rustisan::cli {

namespace {

/// Store for the project config, after checking we are in a project.
Result<config::ConfigStore, CliError> open_store(const CommandContext& ctx) {
    auto project = ctx.require_project();
    if (is_err(project)) {
        return unwrap_err(project);
    }
    return config::ConfigStore(ctx.config_path());
}

} // namespace

Status run_config_show(const CommandDescriptor& cmd, CommandContext& ctx) {
    auto store = open_store(ctx);
    if (is_err(store)) {
        return unwrap_err(store);
    }
    auto doc = unwrap(store).load();
    if (is_err(doc)) {
        return unwrap_err(doc);
    }

    bool reveal = cmd.flag_bool("reveal");
    for (const auto& entry : config::flatten(unwrap(doc).root())) {
        ctx.out << entry.key << " = "
                << (entry.sensitive && !reveal ? config::MASKED_VALUE : entry.value) << "\n";
    }
    return true;
}

Status run_config_get(const CommandDescriptor& cmd, CommandContext& ctx) {
    auto store = open_store(ctx);
    if (is_err(store)) {
        return unwrap_err(store);
    }
    auto value = unwrap(store).get(cmd.arg(0).value_or(""));
    if (is_err(value)) {
        return unwrap_err(value);
    }
    ctx.out << unwrap(value).to_display() << "\n";
    return true;
}

Status run_config_set(const CommandDescriptor& cmd, CommandContext& ctx) {
    auto store = open_store(ctx);
    if (is_err(store)) {
        return unwrap_err(store);
    }
    std::string key = cmd.arg(0).value_or("");
    auto result = unwrap(store).set(key, config::parse_cli_value(cmd.arg(1).value_or("")));
    if (is_err(result)) {
        return result;
    }
    RUSTISAN_LOG_INFO("config", "Updated " << key);
    return true;
}

Status run_config_generate_key(const CommandDescriptor&, CommandContext& ctx) {
    auto store = open_store(ctx);
    if (is_err(store)) {
        return unwrap_err(store);
    }
    std::string key = config::generate_app_key();
    auto result = unwrap(store).set("app.key", config::TomlValue(key));
    if (is_err(result)) {
        return result;
    }
    RUSTISAN_LOG_INFO("config", "Application key set");
    ctx.out << key << "\n";
    return true;
}

Status run_config_validate(const CommandDescriptor&, CommandContext& ctx) {
    auto store = open_store(ctx);
    if (is_err(store)) {
        return unwrap_err(store);
    }
    auto doc = unwrap(store).load();
    if (is_err(doc)) {
        return unwrap_err(doc);
    }

    config::ValidationReport report = config::validate(unwrap(doc).root());
    for (const auto& error : report.errors) {
        ctx.out << "error: " << error << "\n";
    }
    for (const auto& warning : report.warnings) {
        ctx.out << "warning: " << warning << "\n";
    }
    if (!report.ok()) {
        return CliError::make(ErrorKind::ValidationFailed,
                              "configuration has " + std::to_string(report.errors.size()) +
                                  " error(s)");
    }
    if (report.warnings.empty()) {
        RUSTISAN_LOG_INFO("config", "Configuration is valid");
    } else {
        RUSTISAN_LOG_WARN("config", "Configuration is valid with "
                                        << report.warnings.size() << " warning(s)");
    }
    return true;
}

Status run_config_reset(const CommandDescriptor& cmd, CommandContext& ctx) {
    auto store = open_store(ctx);
    if (is_err(store)) {
        return unwrap_err(store);
    }
    if (!cmd.flag_bool("force") &&
        !ctx.confirm("Reset " + ctx.config_path().filename().string() + " to defaults?")) {
        return CliError::make(ErrorKind::Cancelled, "configuration reset cancelled");
    }
    auto result = unwrap(store).overwrite(config::default_config());
    if (is_err(result)) {
        return result;
    }
    RUSTISAN_LOG_INFO("config", "Configuration reset to defaults");
    return true;
}

void register_config_commands(CommandRegistry& registry) {
    registry.add(CommandSpec{"config",
                             "show",
                             {},
                             {{"reveal", 0, FlagType::Bool, "", "show secret values"}},
                             "Show the configuration",
                             run_config_show});
    registry.add(CommandSpec{"config",
                             "get",
                             {{"key", true, "dotted key, e.g. app.name"}},
                             {},
                             "Print a configuration value",
                             run_config_get});
    registry.add(CommandSpec{"config",
                             "set",
                             {{"key", true, "dotted key"}, {"value", true, "new value"}},
                             {},
                             "Set a configuration value",
                             run_config_set});
    registry.add(CommandSpec{
        "config", "generate-key", {}, {}, "Generate a new application key", run_config_generate_key});
    registry.add(CommandSpec{
        "config", "validate", {}, {}, "Check the configuration", run_config_validate});
    registry.add(CommandSpec{"config",
                             "reset",
                             {},
                             {{"force", 'f', FlagType::Bool, "", "skip the confirmation"}},
                             "Reset the configuration to defaults",
                             run_config_reset});
}

} // namespace rustisan::cli
