//! # Build Command
//!
//! ## Pipeline
//!
//! ```text
//! config/*.toml ──> bootstrap/cache/config.json
//! cargo build [--release]     (APP_ENV, RUSTISAN_ENV set)
//! resources/assets/ ──> public/
//! --output DIR: binary, config.json and public/ copied to DIR
//! ```
//!
//! The release profile is used with `--optimize` or for `production`.

#include "cmd_build.hpp"

#include "cli/context.hpp"
#include "cli/utils.hpp"
#include "cmd_helpers.hpp"
#include "log/log.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace rustisan::cli {

namespace {

Status copy_path(const fs::path& from, const fs::path& to, const fs::path& base) {
    std::error_code ec;
    fs::create_directories(to.parent_path(), ec);
    if (!ec) {
        fs::copy(from, to,
                 fs::copy_options::recursive | fs::copy_options::overwrite_existing, ec);
    }
    if (ec) {
        return CliError::make(ErrorKind::IoError, "cannot copy " + display_path(from, base) +
                                                      " to " + to.string() + ": " + ec.message());
    }
    RUSTISAN_LOG_DEBUG("build", "Copied " << display_path(from, base) << " -> " << to.string());
    return true;
}

Status copy_assets(const CommandContext& ctx) {
    fs::path assets = ctx.cwd / "resources" / "assets";
    std::error_code ec;
    if (!fs::is_directory(assets, ec)) {
        return true;
    }
    RUSTISAN_LOG_INFO("build", "Copying assets to public/");
    return copy_path(assets, ctx.cwd / "public", ctx.cwd);
}

Status copy_to_output(const CommandContext& ctx, const fs::path& output,
                      const std::string& profile) {
    std::string package = package_name(ctx);
    fs::path binary = ctx.cwd / "target" / profile / package;
    std::error_code ec;
    if (!fs::exists(binary, ec)) {
        return CliError::make(ErrorKind::IoError,
                              "built binary not found: " + display_path(binary, ctx.cwd));
    }
    RUSTISAN_LOG_INFO("build", "Copying build to " << output.string());

    auto copied = copy_path(binary, output / package, ctx.cwd);
    if (is_err(copied)) {
        return copied;
    }
    fs::path config_cache = ctx.cwd / "bootstrap" / "cache" / "config.json";
    if (fs::exists(config_cache, ec)) {
        copied = copy_path(config_cache, output / "config.json", ctx.cwd);
        if (is_err(copied)) {
            return copied;
        }
    }
    fs::path public_dir = ctx.cwd / "public";
    if (fs::is_directory(public_dir, ec)) {
        return copy_path(public_dir, output / "public", ctx.cwd);
    }
    return true;
}

} // namespace

Status run_build(const CommandDescriptor& cmd, CommandContext& ctx) {
    auto project = ctx.require_project();
    if (is_err(project)) {
        return project;
    }

    std::string env = cmd.flag("env").value_or("production");
    bool release = cmd.flag_bool("optimize") || env == "production";
    std::string profile = release ? "release" : "debug";
    RUSTISAN_LOG_INFO("build", "Building for " << env << " (" << profile << " profile)");

    auto cached = write_config_cache(ctx);
    if (is_err(cached)) {
        return unwrap_err(cached);
    }
    RUSTISAN_LOG_DEBUG("build", "Cached " << unwrap(cached) << " configuration file(s)");

    std::vector<std::string> args = {"build"};
    if (release) {
        args.push_back("--release");
    }
    process::ShellCommand compile = cargo(ctx, std::move(args));
    compile.env = {{"APP_ENV", env}, {"RUSTISAN_ENV", env}};
    auto built = ctx.delegate(compile);
    if (is_err(built)) {
        return built;
    }

    auto assets = copy_assets(ctx);
    if (is_err(assets)) {
        return assets;
    }

    if (auto output = cmd.flag("output")) {
        fs::path dir = *output;
        if (dir.is_relative()) {
            dir = ctx.cwd / dir;
        }
        auto copied = copy_to_output(ctx, dir, profile);
        if (is_err(copied)) {
            return copied;
        }
    }

    RUSTISAN_LOG_INFO("build", "Build completed");
    return true;
}

void register_build_command(CommandRegistry& registry) {
    registry.add(CommandSpec{"build",
                             std::nullopt,
                             {},
                             {
                                 {"env", 'e', FlagType::String, "production", "target environment"},
                                 {"optimize", 0, FlagType::Bool, "", "force a release build"},
                                 {"output", 'o', FlagType::String, "", "copy the build here"},
                             },
                             "Build the application",
                             run_build});
}

} // namespace rustisan::cli
