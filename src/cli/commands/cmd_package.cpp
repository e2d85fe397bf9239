//! # Package Commands
//!
//! Dependency changes go through cargo; rustisan only checks the request
//! against `Cargo.toml` first.
//!
//! | Command           | Runs                          |
//! |-------------------|-------------------------------|
//! | `package:install` | `cargo add <name>[@<version>]` |
//! | `package:remove`  | `cargo remove <name>`         |
//! | `package:update`  | `cargo update`                |
//!
//! `package:list` reads `[dependencies]` itself.

#include "cmd_package.hpp"

#include "cli/context.hpp"
#include "cmd_helpers.hpp"
#include "config/config_store.hpp"
#include "generator/naming.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <iomanip>

namespace fs = std::filesystem;

namespace rustisan::cli {

namespace {

PackageInfo package_info(const std::string& name, const config::TomlValue& entry) {
    PackageInfo info{name, "*", {}};
    if (entry.is_string()) {
        info.version = entry.as_string();
    } else if (entry.is_table()) {
        if (const auto* version = entry.get("version"); version && version->is_string()) {
            info.version = version->as_string();
        }
        if (const auto* features = entry.get("features"); features && features->is_array()) {
            for (const auto& feature : features->as_array()) {
                if (feature.is_string()) {
                    info.features.push_back(feature.as_string());
                }
            }
        }
    }
    return info;
}

Result<bool, CliError> is_installed(const CommandContext& ctx, const std::string& name) {
    auto packages = installed_packages(ctx.cwd);
    if (is_err(packages)) {
        return unwrap_err(packages);
    }
    const auto& list = unwrap(packages);
    return std::any_of(list.begin(), list.end(),
                       [&](const PackageInfo& p) { return p.name == name; });
}

Result<std::string, CliError> package_argument(const CommandDescriptor& cmd) {
    std::string name = cmd.arg(0).value_or("");
    if (!generator::is_valid_package_name(name)) {
        return CliError::make(ErrorKind::InvalidName, "invalid package name '" + name + "'");
    }
    return name;
}

} // namespace

Result<std::vector<PackageInfo>, CliError> installed_packages(const fs::path& root) {
    config::ConfigStore manifest(root / "Cargo.toml");
    auto doc = manifest.load();
    if (is_err(doc)) {
        return unwrap_err(doc);
    }
    std::vector<PackageInfo> packages;
    const config::TomlValue* deps = unwrap(doc).get({"dependencies"});
    if (deps && deps->is_table()) {
        for (const auto& [name, entry] : deps->as_table()) {
            packages.push_back(package_info(name, entry));
        }
    }
    return packages;
}

Status run_package_install(const CommandDescriptor& cmd, CommandContext& ctx) {
    auto project = ctx.require_project();
    if (is_err(project)) {
        return project;
    }
    auto name = package_argument(cmd);
    if (is_err(name)) {
        return unwrap_err(name);
    }
    auto installed = is_installed(ctx, unwrap(name));
    if (is_err(installed)) {
        return unwrap_err(installed);
    }
    if (unwrap(installed)) {
        RUSTISAN_LOG_WARN("package", "Package " << unwrap(name) << " is already installed");
        return true;
    }

    std::string request = unwrap(name);
    if (auto version = cmd.flag("version")) {
        request += "@" + *version;
    }
    RUSTISAN_LOG_INFO("package", "Installing package " << request);
    auto added = ctx.delegate(cargo(ctx, {"add", request}));
    if (is_err(added)) {
        return added;
    }
    RUSTISAN_LOG_INFO("package", "Package " << unwrap(name) << " installed");
    return true;
}

Status run_package_remove(const CommandDescriptor& cmd, CommandContext& ctx) {
    auto project = ctx.require_project();
    if (is_err(project)) {
        return project;
    }
    auto name = package_argument(cmd);
    if (is_err(name)) {
        return unwrap_err(name);
    }
    auto installed = is_installed(ctx, unwrap(name));
    if (is_err(installed)) {
        return unwrap_err(installed);
    }
    if (!unwrap(installed)) {
        RUSTISAN_LOG_WARN("package", "Package " << unwrap(name) << " is not installed");
        return true;
    }

    RUSTISAN_LOG_INFO("package", "Removing package " << unwrap(name));
    auto removed = ctx.delegate(cargo(ctx, {"remove", unwrap(name)}));
    if (is_err(removed)) {
        return removed;
    }
    RUSTISAN_LOG_INFO("package", "Package " << unwrap(name) << " removed");
    return true;
}

Status run_package_list(const CommandDescriptor&, CommandContext& ctx) {
    auto project = ctx.require_project();
    if (is_err(project)) {
        return project;
    }
    auto packages = installed_packages(ctx.cwd);
    if (is_err(packages)) {
        return unwrap_err(packages);
    }
    const auto& list = unwrap(packages);
    if (list.empty()) {
        RUSTISAN_LOG_WARN("package", "No packages found");
        return true;
    }

    size_t name_width = 4;
    size_t version_width = 7;
    for (const auto& p : list) {
        name_width = std::max(name_width, p.name.size());
        version_width = std::max(version_width, p.version.size());
    }
    auto row = [&](const std::string& name, const std::string& version,
                   const std::string& features) {
        ctx.out << std::left << std::setw(static_cast<int>(name_width + 2)) << name
                << std::setw(static_cast<int>(version_width + 2)) << version << features
                << "\n";
    };
    row("Name", "Version", "Features");
    for (const auto& p : list) {
        std::string features;
        for (const auto& f : p.features) {
            features += (features.empty() ? "" : ", ") + f;
        }
        row(p.name, p.version, features.empty() ? "default" : features);
    }
    return true;
}

void register_package_commands(CommandRegistry& registry) {
    registry.add(CommandSpec{"package",
                             "install",
                             {{"name", true, "crate to add"}},
                             {{"version", 0, FlagType::String, "", "version requirement"}},
                             "Add a dependency",
                             run_package_install});
    registry.add(CommandSpec{"package",
                             "remove",
                             {{"name", true, "crate to remove"}},
                             {},
                             "Remove a dependency",
                             run_package_remove});
    registry.add(
        CommandSpec{"package", "list", {}, {}, "List the dependencies", run_package_list});
    registry.add(CommandSpec{"package",
                             "update",
                             {},
                             {},
                             "Update the dependencies",
                             [](const CommandDescriptor&, CommandContext& ctx) -> Status {
                                 auto project = ctx.require_project();
                                 if (is_err(project)) {
                                     return project;
                                 }
                                 RUSTISAN_LOG_INFO("package", "Updating packages");
                                 return ctx.delegate(cargo(ctx, {"update"}));
                             }});
}

} // namespace rustisan::cli
