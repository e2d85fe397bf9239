//! # New Project Command
//!
//! Implements `rustisan new <name>`.
//!
//! ## Generated Structure (web)
//!
//! ```text
//! blog/
//!   ├─ Cargo.toml
//!   ├─ rustisan.toml
//!   ├─ src/{main.rs, controllers/, models/, ...}
//!   ├─ database/{migrations,seeders,factories}/
//!   ├─ resources/views/welcome.html
//!   ├─ routes/web.rs
//!   ├─ storage/{logs,cache,sessions,uploads}/
//!   └─ tests/{unit,integration}/
//! ```

#include "cmd_new.hpp"

#include "cli/context.hpp"
#include "cli/utils.hpp"
#include "common.hpp"
#include "log/log.hpp"
#include "scaffold/scaffolder.hpp"

namespace rustisan::cli {

Status run_new(const CommandDescriptor& cmd, CommandContext& ctx) {
    scaffold::ScaffoldOptions options;
    options.name = cmd.arg(0).value_or("");
    options.template_name = cmd.flag("template").value_or("web");
    if (auto path = cmd.flag("path")) {
        options.parent = *path;
    }
    options.git = cmd.flag_bool("git");

    scaffold::Scaffolder scaffolder(ctx);
    auto created = scaffolder.create(options);
    if (is_err(created)) {
        return unwrap_err(created);
    }
    const auto& root = unwrap(created);

    RUSTISAN_LOG_INFO("new", "Created project '" << options.name << "' at " << root.string());
    if (!GlobalOptions::quiet) {
        ctx.out << "\nNext steps:\n";
        ctx.out << "  cd " << display_path(root, ctx.cwd) << "\n";
        ctx.out << "  rustisan serve\n";
    }
    return true;
}

void register_new_command(CommandRegistry& registry) {
    registry.add(CommandSpec{
        "new",
        std::nullopt,
        {{"name", true, "project (package) name"}},
        {
            {"template", 't', FlagType::String, "web", "web, api, minimal or a directory"},
            {"path", 'p', FlagType::String, "", "parent directory"},
            {"git", 0, FlagType::Bool, "true", "initialize a git repository"},
        },
        "Create a new Rustisan project",
        run_new,
    });
}

} // namespace rustisan::cli
