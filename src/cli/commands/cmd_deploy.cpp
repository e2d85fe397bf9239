//! # Deploy Commands
//!
//! A deployment is a fixed sequence of external commands:
//!
//! ```text
//! pre_deploy_commands      sh -c "<command>"
//! cargo build --release    (unless --skip-build)
//! cargo test --release
//! strategy:
//!   server      scp target/release/<pkg> user@host:path/
//!               ssh user@host 'sudo systemctl restart <pkg>'
//!   docker      docker build -t <image> .
//!               docker tag / docker push   (when DOCKER_REGISTRY is set)
//!   kubernetes  kubectl apply -f k8s/ -n <ns>
//!               kubectl rollout status deployment/<pkg> -n <ns>
//! cargo run --bin migrate -- up
//! post_deploy_commands     sh -c "<command>"
//! ```
//!
//! The whole sequence is planned before anything runs, so a bad config is
//! reported up front. `--dry-run` logs the plan instead of running it.

#include "cmd_deploy.hpp"

#include "cli/context.hpp"
#include "cli/utils.hpp"
#include "cmd_helpers.hpp"
#include "config/config_store.hpp"
#include "generator/naming.hpp"
#include "log/log.hpp"

#include <cstdlib>
#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;

namespace rustisan::cli {

namespace {

CliError invalid(const std::string& msg) {
    return CliError::make(ErrorKind::ValidationFailed, msg);
}

Result<std::string, CliError> read_string(const config::TomlValue& root, const std::string& key,
                                          const std::string& fallback) {
    const config::TomlValue* value = root.get(key);
    if (!value) {
        return fallback;
    }
    if (!value->is_string()) {
        return invalid("deploy config: '" + key + "' must be a string");
    }
    return value->as_string();
}

Result<std::vector<std::string>, CliError> read_commands(const config::TomlValue& root,
                                                         const std::string& key) {
    std::vector<std::string> commands;
    const config::TomlValue* value = root.get(key);
    if (!value) {
        return commands;
    }
    if (!value->is_array()) {
        return invalid("deploy config: '" + key + "' must be an array of strings");
    }
    for (const auto& item : value->as_array()) {
        if (!item.is_string()) {
            return invalid("deploy config: '" + key + "' must be an array of strings");
        }
        commands.push_back(item.as_string());
    }
    return commands;
}

process::ShellCommand shell(const CommandContext& ctx, const std::string& line) {
    process::ShellCommand cmd;
    cmd.program = "sh";
    cmd.args = {"-c", line};
    cmd.cwd = ctx.cwd;
    return cmd;
}

process::ShellCommand tool(const CommandContext& ctx, std::string program,
                           std::vector<std::string> args) {
    process::ShellCommand cmd;
    cmd.program = std::move(program);
    cmd.args = std::move(args);
    cmd.cwd = ctx.cwd;
    return cmd;
}

Status require_field(const std::string& value, const std::string& key, const std::string& type) {
    if (value.empty()) {
        return invalid("deploy config: '" + key + "' is required for " + type + " deployments");
    }
    return true;
}

Status plan_strategy(const CommandContext& ctx, const DeployConfig& config,
                     std::vector<process::ShellCommand>& plan) {
    std::string package = package_name(ctx);

    if (config.type == "server") {
        for (const auto& [value, key] : {std::pair{&config.host, "host"},
                                         std::pair{&config.user, "user"},
                                         std::pair{&config.path, "path"}}) {
            auto present = require_field(*value, key, config.type);
            if (is_err(present)) {
                return present;
            }
        }
        std::string port = std::to_string(config.port);
        std::string remote = config.user + "@" + config.host;
        plan.push_back(tool(ctx, "scp",
                            {"-P", port, "target/release/" + package,
                             remote + ":" + config.path + "/"}));
        plan.push_back(
            tool(ctx, "ssh", {"-p", port, remote, "sudo systemctl restart " + package}));
        return true;
    }

    if (config.type == "docker") {
        auto present = require_field(config.docker_image, "docker_image", config.type);
        if (is_err(present)) {
            return present;
        }
        plan.push_back(tool(ctx, "docker", {"build", "-t", config.docker_image, "."}));
        const char* registry = std::getenv("DOCKER_REGISTRY");
        if (registry && *registry) {
            std::string remote_image = std::string(registry) + "/" + config.docker_image;
            plan.push_back(tool(ctx, "docker", {"tag", config.docker_image, remote_image}));
            plan.push_back(tool(ctx, "docker", {"push", remote_image}));
        }
        return true;
    }

    if (config.type == "kubernetes") {
        plan.push_back(
            tool(ctx, "kubectl", {"apply", "-f", "k8s/", "-n", config.namespace_name}));
        plan.push_back(tool(ctx, "kubectl",
                            {"rollout", "status", "deployment/" + package, "-n",
                             config.namespace_name}));
        return true;
    }

    return invalid("unsupported deployment type '" + config.type +
                   "' (expected server, docker or kubernetes)");
}

} // namespace

Result<DeployConfig, CliError> parse_deploy_config(const config::TomlValue& root) {
    DeployConfig config;

    struct StringField {
        const char* key;
        std::string* target;
    };
    for (const StringField& field : {StringField{"deployment_type", &config.type},
                                     StringField{"host", &config.host},
                                     StringField{"user", &config.user},
                                     StringField{"path", &config.path},
                                     StringField{"docker_image", &config.docker_image},
                                     StringField{"kubernetes_namespace", &config.namespace_name}}) {
        auto value = read_string(root, field.key, *field.target);
        if (is_err(value)) {
            return unwrap_err(value);
        }
        *field.target = unwrap(value);
    }

    if (const config::TomlValue* port = root.get("port")) {
        if (!port->is_integer() || port->as_integer() < 1 || port->as_integer() > 65535) {
            return invalid("deploy config: 'port' must be an integer between 1 and 65535");
        }
        config.port = port->as_integer();
    }

    if (const config::TomlValue* env = root.get("environment_variables")) {
        if (!env->is_table()) {
            return invalid("deploy config: 'environment_variables' must be a table");
        }
        for (const auto& [name, value] : env->as_table()) {
            config.environment.emplace_back(name, value.to_display());
        }
    }

    auto pre = read_commands(root, "pre_deploy_commands");
    if (is_err(pre)) {
        return unwrap_err(pre);
    }
    config.pre_deploy_commands = std::move(unwrap(pre));

    auto post = read_commands(root, "post_deploy_commands");
    if (is_err(post)) {
        return unwrap_err(post);
    }
    config.post_deploy_commands = std::move(unwrap(post));
    return config;
}

Result<std::vector<process::ShellCommand>, CliError>
plan_deployment(const CommandContext& ctx, const DeployConfig& config,
                const DeployOptions& options) {
    std::vector<process::ShellCommand> plan;

    for (const auto& line : config.pre_deploy_commands) {
        plan.push_back(shell(ctx, line));
    }
    if (!options.skip_build) {
        plan.push_back(cargo(ctx, {"build", "--release"}));
    }
    plan.push_back(cargo(ctx, {"test", "--release"}));

    auto strategy = plan_strategy(ctx, config, plan);
    if (is_err(strategy)) {
        return unwrap_err(strategy);
    }

    plan.push_back(cargo(ctx, {"run", "--bin", "migrate", "--", "up"}));
    for (const auto& line : config.post_deploy_commands) {
        plan.push_back(shell(ctx, line));
    }

    for (auto& cmd : plan) {
        cmd.env.insert(cmd.env.end(), config.environment.begin(), config.environment.end());
    }
    return plan;
}

std::string deploy_config_template(const std::string& target, const std::string& package) {
    std::ostringstream oss;
    oss << "# Deployment configuration for " << target << "\n";
    oss << "deployment_type = \"server\"  # Options: server, docker, kubernetes\n";
    oss << "\n";
    oss << "# Server deployment settings\n";
    oss << "host = \"your-server.com\"\n";
    oss << "port = 22\n";
    oss << "user = \"deploy\"\n";
    oss << "path = " << config::quote_string("/opt/" + package) << "\n";
    oss << "\n";
    oss << "# Docker settings (deployment_type = \"docker\")\n";
    oss << "docker_image = " << config::quote_string(package) << "\n";
    oss << "\n";
    oss << "# Kubernetes settings (deployment_type = \"kubernetes\")\n";
    oss << "kubernetes_namespace = \"default\"\n";
    oss << "\n";
    oss << "# Shell commands run before and after the deployment\n";
    oss << "pre_deploy_commands = []\n";
    oss << "post_deploy_commands = []\n";
    oss << "\n";
    oss << "# Environment passed to every deployment command\n";
    oss << "[environment_variables]\n";
    oss << "APP_ENV = " << config::quote_string(target) << "\n";
    return oss.str();
}

Status run_deploy(const CommandDescriptor& cmd, CommandContext& ctx) {
    auto project = ctx.require_project();
    if (is_err(project)) {
        return project;
    }

    DeployOptions options;
    options.target = cmd.arg(0).value_or("production");
    if (!generator::is_valid_package_name(options.target)) {
        return CliError::make(ErrorKind::InvalidName,
                              "invalid deployment target '" + options.target + "'");
    }
    options.skip_build = cmd.flag_bool("skip-build");
    options.dry_run = cmd.flag_bool("dry-run");

    fs::path config_path = ctx.cwd / "deploy" / (options.target + ".toml");
    std::error_code ec;
    if (!fs::exists(config_path, ec)) {
        return invalid("deployment config not found: " + display_path(config_path, ctx.cwd) +
                       " (run 'rustisan deploy:init " + options.target + "')");
    }
    config::ConfigStore store(config_path);
    auto doc = store.load();
    if (is_err(doc)) {
        return unwrap_err(doc);
    }
    auto config = parse_deploy_config(unwrap(doc).root());
    if (is_err(config)) {
        return unwrap_err(config);
    }

    if (!fs::exists(ctx.cwd / "src" / "main.rs", ec)) {
        return invalid("required file not found: src/main.rs");
    }

    auto plan = plan_deployment(ctx, unwrap(config), options);
    if (is_err(plan)) {
        return unwrap_err(plan);
    }

    RUSTISAN_LOG_INFO("deploy", "Deploying to " << options.target << " ("
                                                << unwrap(config).type << ")");
    for (const auto& step : unwrap(plan)) {
        if (options.dry_run) {
            RUSTISAN_LOG_INFO("deploy", "[dry-run] " << step.display());
            continue;
        }
        auto result = ctx.delegate(step);
        if (is_err(result)) {
            return result;
        }
    }
    RUSTISAN_LOG_INFO("deploy", (options.dry_run ? "Dry run completed" : "Deployment completed"));
    return true;
}

Status run_deploy_init(const CommandDescriptor& cmd, CommandContext& ctx) {
    auto project = ctx.require_project();
    if (is_err(project)) {
        return project;
    }
    std::string target = cmd.arg(0).value_or("production");
    if (!generator::is_valid_package_name(target)) {
        return CliError::make(ErrorKind::InvalidName, "invalid deployment target '" + target + "'");
    }

    fs::path path = ctx.cwd / "deploy" / (target + ".toml");
    std::error_code ec;
    if (fs::exists(path, ec) && !cmd.flag_bool("force")) {
        return CliError::make(ErrorKind::TargetExists,
                              display_path(path, ctx.cwd) + " already exists (use --force to overwrite)");
    }
    auto written = write_file(path, deploy_config_template(target, package_name(ctx)));
    if (is_err(written)) {
        return written;
    }
    RUSTISAN_LOG_INFO("deploy", "Created " << display_path(path, ctx.cwd));
    return true;
}

void register_deploy_commands(CommandRegistry& registry) {
    registry.add(CommandSpec{"deploy",
                             std::nullopt,
                             {{"target", false, "deployment target (default production)"}},
                             {
                                 {"skip-build", 0, FlagType::Bool, "", "do not run cargo build"},
                                 {"dry-run", 0, FlagType::Bool, "", "print the commands only"},
                             },
                             "Deploy the application",
                             run_deploy});
    registry.add(CommandSpec{"deploy",
                             "init",
                             {{"target", false, "deployment target (default production)"}},
                             {{"force", 0, FlagType::Bool, "", "overwrite an existing file"}},
                             "Create a deployment config",
                             run_deploy_init});
}

} // namespace rustisan::cli
