//! # Cache Commands
//!
//! ## Locations cleared by `cache:clear`
//!
//! ```text
//! bootstrap/cache/            (directory contents)
//! storage/cache/
//! storage/framework/cache/
//! storage/framework/sessions/
//! storage/framework/views/
//! bootstrap/cache/routes.json (single files)
//! bootstrap/cache/config.json
//! bootstrap/cache/services.json
//! ```
//!
//! `.gitkeep` placeholders are left alone.

#include "cmd_cache.hpp"

#include "cli/context.hpp"
#include "cli/utils.hpp"
#include "cmd_helpers.hpp"
#include "log/log.hpp"

#include <filesystem>
#include <optional>

namespace fs = std::filesystem;

namespace rustisan::cli {

namespace {

const char* const CACHE_DIRS[] = {
    "bootstrap/cache",
    "storage/cache",
    "storage/framework/cache",
    "storage/framework/sessions",
    "storage/framework/views",
};

const char* const CACHE_FILES[] = {
    "bootstrap/cache/routes.json",
    "bootstrap/cache/config.json",
    "bootstrap/cache/services.json",
};

/// Removes everything in `dir` except `.gitkeep`. Returns entries removed.
Result<size_t, CliError> clear_directory(const fs::path& dir) {
    std::error_code ec;
    std::vector<fs::path> victims;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (entry.path().filename() != ".gitkeep") {
            victims.push_back(entry.path());
        }
    }
    if (ec) {
        return CliError::make(ErrorKind::IoError, "cannot read " + dir.string() + ": " +
                                                      ec.message());
    }
    for (const auto& path : victims) {
        fs::remove_all(path, ec);
        if (ec) {
            return CliError::make(ErrorKind::IoError, "cannot remove " + path.string() + ": " +
                                                          ec.message());
        }
    }
    return victims.size();
}

bool is_valid_cache_key(const std::string& key) {
    return !key.empty() && key != "." && key != ".." &&
           key.find_first_of("/\\") == std::string::npos;
}

} // namespace

Status run_cache_clear(const CommandDescriptor&, CommandContext& ctx) {
    auto project = ctx.require_project();
    if (is_err(project)) {
        return project;
    }

    std::optional<CliError> first_error;
    size_t cleared = 0;
    std::error_code ec;

    for (const char* rel : CACHE_DIRS) {
        fs::path dir = ctx.cwd / rel;
        if (!fs::is_directory(dir, ec)) {
            continue;
        }
        auto removed = clear_directory(dir);
        if (is_err(removed)) {
            RUSTISAN_LOG_WARN("cache", unwrap_err(removed).message);
            if (!first_error) {
                first_error = unwrap_err(removed);
            }
            continue;
        }
        ++cleared;
        RUSTISAN_LOG_INFO("cache", "Cleared " << rel << " (" << unwrap(removed) << " entries)");
    }

    // The files may already be gone with bootstrap/cache
    for (const char* rel : CACHE_FILES) {
        fs::path file = ctx.cwd / rel;
        if (!fs::exists(file, ec)) {
            continue;
        }
        fs::remove(file, ec);
        if (ec) {
            auto err = CliError::make(ErrorKind::IoError,
                                      "cannot remove " + std::string(rel) + ": " + ec.message());
            RUSTISAN_LOG_WARN("cache", err.message);
            if (!first_error) {
                first_error = err;
            }
            continue;
        }
        ++cleared;
        RUSTISAN_LOG_INFO("cache", "Removed " << rel);
    }

    if (first_error) {
        return *first_error;
    }
    if (cleared == 0) {
        RUSTISAN_LOG_WARN("cache", "No cache files or directories found");
    } else {
        RUSTISAN_LOG_INFO("cache", "Cleared " << cleared << " cache location(s)");
    }
    return true;
}

Status run_cache_forget(const CommandDescriptor& cmd, CommandContext& ctx) {
    auto project = ctx.require_project();
    if (is_err(project)) {
        return project;
    }
    std::string key = cmd.arg(0).value_or("");
    if (!is_valid_cache_key(key)) {
        return CliError::make(ErrorKind::InvalidName, "invalid cache key '" + key + "'");
    }

    fs::path entry = ctx.cwd / "storage" / "cache" / key;
    std::error_code ec;
    if (!fs::exists(entry, ec)) {
        RUSTISAN_LOG_WARN("cache", "Cache key '" << key << "' not found");
        return true;
    }
    fs::remove_all(entry, ec);
    if (ec) {
        return CliError::make(ErrorKind::IoError, "cannot remove " +
                                                      display_path(entry, ctx.cwd) + ": " +
                                                      ec.message());
    }
    RUSTISAN_LOG_INFO("cache", "Forgot cache key '" << key << "'");
    return true;
}

Status run_cache_config(const CommandDescriptor&, CommandContext& ctx) {
    auto project = ctx.require_project();
    if (is_err(project)) {
        return project;
    }
    auto cached = write_config_cache(ctx);
    if (is_err(cached)) {
        return unwrap_err(cached);
    }
    RUSTISAN_LOG_INFO("cache", "Cached " << unwrap(cached) << " configuration file(s)");
    return true;
}

void register_cache_commands(CommandRegistry& registry) {
    registry.add(CommandSpec{"cache", "clear", {}, {}, "Clear all caches", run_cache_clear});
    registry.add(CommandSpec{"cache",
                             "forget",
                             {{"key", true, "cache entry to remove"}},
                             {},
                             "Remove one cache entry",
                             run_cache_forget});
    registry.add(CommandSpec{
        "cache", "config", {}, {}, "Cache the config/*.toml files", run_cache_config});
}

} // namespace rustisan::cli
