#include "cmd_helpers.hpp"

#include "cli/utils.hpp"
#include "config/config_store.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <cstdlib>
#include <sstream>

namespace fs = std::filesystem;

namespace rustisan::cli {

Result<config::TomlDocument, CliError> load_project_config(const CommandContext& ctx) {
    config::ConfigStore store(ctx.config_path());
    return store.load();
}

std::string config_text(const config::TomlValue& root, const std::string& key,
                        const std::string& fallback) {
    auto path = config::TomlDocument::split_key(key);
    if (is_err(path)) {
        return fallback;
    }
    const config::TomlValue* value = root.find(unwrap(path));
    return value ? value->to_display() : fallback;
}

std::string package_name(const CommandContext& ctx) {
    auto text = read_file(ctx.cwd / "Cargo.toml");
    if (is_ok(text)) {
        auto doc = config::TomlDocument::parse(unwrap(text));
        if (is_ok(doc)) {
            const config::TomlValue* name = unwrap(doc).get({"package", "name"});
            if (name && name->is_string()) {
                return name->as_string();
            }
        } else {
            RUSTISAN_LOG_WARN("cli", "Cargo.toml: " << unwrap_err(doc).to_string());
        }
    }
    return ctx.cwd.filename().string();
}

process::ShellCommand cargo(const CommandContext& ctx, std::vector<std::string> args) {
    process::ShellCommand cmd;
    cmd.program = "cargo";
    cmd.args = std::move(args);
    cmd.cwd = ctx.cwd;
    return cmd;
}

bool is_production(const CommandContext& ctx) {
    for (const char* var : {"APP_ENV", "RUSTISAN_ENV"}) {
        const char* value = std::getenv(var);
        if (value && std::string(value) == "production") {
            return true;
        }
    }
    auto doc = load_project_config(ctx);
    return is_ok(doc) && config_text(unwrap(doc).root(), "app.env") == "production";
}

Result<size_t, CliError> write_config_cache(const CommandContext& ctx) {
    fs::path dir = ctx.cwd / "config";
    std::vector<fs::path> files;
    std::error_code ec;
    if (fs::is_directory(dir, ec)) {
        for (const auto& entry : fs::directory_iterator(dir, ec)) {
            if (entry.path().extension() == ".toml") {
                files.push_back(entry.path());
            }
        }
        if (ec) {
            return CliError::make(ErrorKind::IoError,
                                  "cannot read " + dir.string() + ": " + ec.message());
        }
    }
    std::sort(files.begin(), files.end());

    std::ostringstream json;
    json << "{";
    for (size_t i = 0; i < files.size(); ++i) {
        config::ConfigStore store(files[i]);
        auto doc = store.load();
        if (is_err(doc)) {
            return unwrap_err(doc);
        }
        if (i > 0) {
            json << ",";
        }
        json << "\n  " << config::quote_string(files[i].stem().string()) << ": "
             << unwrap(doc).root().to_json();
        RUSTISAN_LOG_DEBUG("cache", "Loaded " << display_path(files[i], ctx.cwd));
    }
    json << (files.empty() ? "}\n" : "\n}\n");

    auto written = write_file(ctx.cwd / "bootstrap" / "cache" / "config.json", json.str());
    if (is_err(written)) {
        return unwrap_err(written);
    }
    return files.size();
}

} // namespace rustisan::cli
