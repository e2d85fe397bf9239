//! # Info Command
//!
//! Prints what the CLI knows about itself and the current project. Works
//! outside a project too, in which case only the tool section is shown.

#include "cmd_info.hpp"

#include "cli/context.hpp"
#include "cli/utils.hpp"
#include "cmd_helpers.hpp"
#include "common.hpp"
#include "log/log.hpp"

#include <cstdlib>
#include <iomanip>

namespace rustisan::cli {

namespace {

const char* platform_name() {
#ifdef _WIN32
    return "windows";
#elif defined(__APPLE__)
    return "macos";
#elif defined(__linux__)
    return "linux";
#else
    return "unknown";
#endif
}

void print_row(std::ostream& out, const std::string& label, const std::string& value) {
    out << "  " << std::left << std::setw(14) << label << value << "\n";
}

void print_dependencies(std::ostream& out, const config::TomlValue& manifest) {
    const config::TomlValue* deps = manifest.get("dependencies");
    if (!deps || !deps->is_table() || deps->as_table().empty()) {
        return;
    }
    out << "\nDependencies:\n";
    for (const auto& [name, spec] : deps->as_table()) {
        std::string version = spec.to_display();
        if (spec.is_table()) {
            const config::TomlValue* v = spec.get("version");
            version = v ? v->to_display() : "*";
        }
        print_row(out, name, version);
    }
}

void print_environment(std::ostream& out) {
    out << "\nEnvironment:\n";
    for (const char* var : {"APP_ENV", "RUSTISAN_ENV", "RUSTISAN_LOG", "SERVER_HOST",
                            "SERVER_PORT"}) {
        const char* value = std::getenv(var);
        print_row(out, var, value ? value : "(unset)");
    }
}

} // namespace

Status run_info(const CommandDescriptor& cmd, CommandContext& ctx) {
    ctx.out << "Rustisan CLI " << VERSION << " (" << platform_name() << ")\n";

    if (is_err(ctx.require_project())) {
        RUSTISAN_LOG_INFO("info", "Not inside a rustisan project");
        return true;
    }

    auto config = load_project_config(ctx);
    if (is_err(config)) {
        return unwrap_err(config);
    }
    const auto& root = unwrap(config).root();

    ctx.out << "\nApplication:\n";
    print_row(ctx.out, "Package", package_name(ctx));
    print_row(ctx.out, "Name", config_text(root, "app.name", "(unset)"));
    print_row(ctx.out, "Environment", config_text(root, "app.env", "(unset)"));
    print_row(ctx.out, "URL", config_text(root, "app.url", "(unset)"));
    print_row(ctx.out, "Database", config_text(root, "database.default", "(unset)"));

    if (cmd.flag_bool("detailed")) {
        auto manifest_text = read_file(ctx.cwd / "Cargo.toml");
        if (is_err(manifest_text)) {
            return unwrap_err(manifest_text);
        }
        auto manifest = config::TomlDocument::parse(unwrap(manifest_text));
        if (is_err(manifest)) {
            RUSTISAN_LOG_WARN("info", "Cargo.toml: " << unwrap_err(manifest).to_string());
        } else {
            print_dependencies(ctx.out, unwrap(manifest).root());
        }
        print_environment(ctx.out);
    }
    return true;
}

void register_info_command(CommandRegistry& registry) {
    registry.add(CommandSpec{"info",
                             std::nullopt,
                             {},
                             {{"detailed", 'd', FlagType::Bool, "", "include dependencies"}},
                             "Show information about the CLI and project",
                             run_info});
}

} // namespace rustisan::cli
