//! # Project Scaffolder
//!
//! Materializes a new project from a named template.
//!
//! ## Templates
//!
//! | Name      | Contents                                                  |
//! |-----------|-----------------------------------------------------------|
//! | `web`     | full layout, views, `routes/web.rs` (default)             |
//! | `api`     | full layout without views, `routes/api.rs`                |
//! | `minimal` | `Cargo.toml`, `rustisan.toml`, `src/main.rs`, `tests/`    |
//! | `<dir>`   | a local directory, copied; `*.tpl` files are rendered     |
//!
//! ## Failure Model
//!
//! The name, the template and the destination are all checked before
//! anything is written. A failure after that point (a write error, a
//! failing `git` step) leaves the files already written in place.

#pragma once

#include "cli/context.hpp"
#include "cli/error.hpp"
#include "generator/template.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rustisan::scaffold {

/// A file of a project template, path relative to the project root.
struct ProjectFile {
    std::string path;
    std::string content;
};

/// A resolved project template, ready to write.
struct ProjectTemplate {
    std::string name;
    std::vector<std::string> directories;
    std::vector<ProjectFile> files;
};

/// Names of the templates shipped with the CLI, default first.
const std::vector<std::string>& builtin_template_names();

/// A built-in template with its slots filled from `vars`, or nullopt.
std::optional<ProjectTemplate> builtin_template(std::string_view name,
                                                const generator::TemplateVars& vars);

/// Slot values for a project name.
generator::TemplateVars project_variables(const std::string& name);

struct ScaffoldOptions {
    /// Package name, also the directory name.
    std::string name;

    /// Built-in template name or a path to a template directory.
    std::string template_name = "web";

    /// Directory the project directory is created in. Relative paths are
    /// resolved against the context's working directory.
    std::filesystem::path parent;

    /// Run `git init`, `git add .` and `git commit` afterwards.
    bool git = true;
};

class Scaffolder {
public:
    explicit Scaffolder(cli::CommandContext& ctx) : ctx_(ctx) {}

    /// Creates the project and returns its root directory.
    auto create(const ScaffoldOptions& options) -> Result<std::filesystem::path, cli::CliError>;

    /// Where `options` puts the project.
    std::filesystem::path destination(const ScaffoldOptions& options) const;

private:
    cli::CommandContext& ctx_;

    auto resolve_template(const ScaffoldOptions& options, const generator::TemplateVars& vars) const
        -> Result<ProjectTemplate, cli::CliError>;
    auto load_directory_template(const std::filesystem::path& dir,
                                 const generator::TemplateVars& vars) const
        -> Result<ProjectTemplate, cli::CliError>;
    auto check_destination(const std::filesystem::path& root) const -> cli::Status;
    auto materialize(const std::filesystem::path& root, const ProjectTemplate& tmpl) const
        -> cli::Status;
    auto init_git(const std::filesystem::path& root) -> cli::Status;
};

} // namespace rustisan::scaffold
