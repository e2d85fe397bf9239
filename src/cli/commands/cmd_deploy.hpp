//! # Deploy Command Interface
//!
//! - `rustisan deploy:init [target]`: writes `deploy/<target>.toml`
//! - `rustisan deploy [target] [--skip-build] [--dry-run]`
//!
//! The target defaults to `production`.

#ifndef RUSTISAN_CLI_CMD_DEPLOY_HPP
#define RUSTISAN_CLI_CMD_DEPLOY_HPP

#include "cli/command.hpp"
#include "config/toml_value.hpp"
#include "process/runner.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace rustisan::cli {

/// Contents of `deploy/<target>.toml`.
struct DeployConfig {
    std::string type = "server"; ///< server, docker or kubernetes
    std::string host;
    int64_t port = 22;
    std::string user;
    std::string path;
    std::string docker_image;
    std::string namespace_name = "default";
    std::vector<std::pair<std::string, std::string>> environment;
    std::vector<std::string> pre_deploy_commands;
    std::vector<std::string> post_deploy_commands;
};

struct DeployOptions {
    std::string target = "production";
    bool skip_build = false;
    bool dry_run = false;
};

/// Reads a deploy config tree. Fails with `ValidationFailed` on wrong types.
Result<DeployConfig, CliError> parse_deploy_config(const config::TomlValue& root);

/// Every external command a deployment runs, in order.
Result<std::vector<process::ShellCommand>, CliError>
plan_deployment(const CommandContext& ctx, const DeployConfig& config,
                const DeployOptions& options);

/// Text of a fresh `deploy/<target>.toml`.
std::string deploy_config_template(const std::string& target, const std::string& package);

Status run_deploy(const CommandDescriptor& cmd, CommandContext& ctx);
Status run_deploy_init(const CommandDescriptor& cmd, CommandContext& ctx);

void register_deploy_commands(CommandRegistry& registry);

} // namespace rustisan::cli

#endif // RUSTISAN_CLI_CMD_DEPLOY_HPP
