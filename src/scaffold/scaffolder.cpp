//! # Project Scaffolder
//!
//! Implements `rustisan new`: validates the request, resolves the template,
//! writes the tree and optionally commits it to a fresh git repository.

#include "scaffold/scaffolder.hpp"

#include "cli/utils.hpp"
#include "generator/naming.hpp"
#include "log/log.hpp"

#include <algorithm>

namespace fs = std::filesystem;

namespace rustisan::scaffold {

namespace {

constexpr std::string_view TEMPLATE_SUFFIX = ".tpl";

bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

} // namespace

fs::path Scaffolder::destination(const ScaffoldOptions& options) const {
    fs::path parent = options.parent.empty() ? ctx_.cwd : options.parent;
    if (parent.is_relative()) {
        parent = ctx_.cwd / parent;
    }
    return (parent / options.name).lexically_normal();
}

auto Scaffolder::load_directory_template(const fs::path& dir, const generator::TemplateVars& vars) const
    -> Result<ProjectTemplate, cli::CliError> {
    ProjectTemplate tmpl;
    tmpl.name = dir.filename().string();

    std::error_code ec;
    fs::recursive_directory_iterator it(dir, ec);
    if (ec) {
        return cli::CliError::make(cli::ErrorKind::IoError,
                                   "cannot read template " + dir.string() + ": " + ec.message());
    }
    for (auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
        const fs::path& path = it->path();
        if (path.filename() == ".git") {
            it.disable_recursion_pending();
            continue;
        }

        std::string rel = cli::to_forward_slashes(fs::relative(path, dir).string());
        if (it->is_directory(ec)) {
            tmpl.directories.push_back(rel);
            continue;
        }
        if (!it->is_regular_file(ec)) {
            continue;
        }

        auto content = cli::read_file(path);
        if (is_err(content)) {
            return unwrap_err(content);
        }
        if (ends_with(rel, TEMPLATE_SUFFIX)) {
            rel.resize(rel.size() - TEMPLATE_SUFFIX.size());
            tmpl.files.push_back({rel, generator::render(unwrap(content), vars)});
        } else {
            tmpl.files.push_back({rel, std::move(unwrap(content))});
        }
    }

    if (ec) {
        return cli::CliError::make(cli::ErrorKind::IoError,
                                   "cannot read template " + dir.string() + ": " + ec.message());
    }

    // Deterministic write order regardless of directory iteration order.
    std::sort(tmpl.directories.begin(), tmpl.directories.end());
    std::sort(tmpl.files.begin(), tmpl.files.end(),
              [](const ProjectFile& a, const ProjectFile& b) { return a.path < b.path; });
    return tmpl;
}

auto Scaffolder::resolve_template(const ScaffoldOptions& options,
                                  const generator::TemplateVars& vars) const
    -> Result<ProjectTemplate, cli::CliError> {
    if (auto builtin = builtin_template(options.template_name, vars)) {
        return std::move(*builtin);
    }

    fs::path dir = options.template_name;
    if (dir.is_relative()) {
        dir = ctx_.cwd / dir;
    }
    std::error_code ec;
    if (fs::is_directory(dir, ec)) {
        RUSTISAN_LOG_DEBUG("new", "Using template directory " << dir.string());
        return load_directory_template(dir, vars);
    }

    std::string known;
    for (const auto& name : builtin_template_names()) {
        known += known.empty() ? name : ", " + name;
    }
    return cli::CliError::make(cli::ErrorKind::UnknownTemplate,
                               "unknown template '" + options.template_name +
                                   "' (expected one of " + known + ", or a directory)");
}

auto Scaffolder::check_destination(const fs::path& root) const -> cli::Status {
    std::error_code ec;
    if (!fs::exists(root, ec)) {
        return true;
    }
    if (!fs::is_directory(root, ec)) {
        return cli::CliError::make(cli::ErrorKind::DestinationNotEmpty,
                                   root.string() + " exists and is not a directory");
    }
    if (!fs::is_empty(root, ec) || ec) {
        return cli::CliError::make(cli::ErrorKind::DestinationNotEmpty,
                                   root.string() + " already exists and is not empty");
    }
    return true;
}

auto Scaffolder::materialize(const fs::path& root, const ProjectTemplate& tmpl) const
    -> cli::Status {
    std::error_code ec;
    fs::create_directories(root, ec);
    if (ec) {
        return cli::CliError::make(cli::ErrorKind::IoError,
                                   "cannot create " + root.string() + ": " + ec.message());
    }

    for (const auto& dir : tmpl.directories) {
        fs::create_directories(root / dir, ec);
        if (ec) {
            return cli::CliError::make(cli::ErrorKind::IoError,
                                       "cannot create " + dir + ": " + ec.message());
        }
    }

    for (const auto& file : tmpl.files) {
        auto written = cli::write_file(root / file.path, file.content);
        if (is_err(written)) {
            return written;
        }
        RUSTISAN_LOG_DEBUG("new", "Created " << file.path);
    }

    // Keep otherwise empty directories under version control.
    for (const auto& dir : tmpl.directories) {
        if (fs::is_empty(root / dir, ec) && !ec) {
            auto written = cli::write_file(root / dir / ".gitkeep", "");
            if (is_err(written)) {
                return written;
            }
        }
    }
    return true;
}

auto Scaffolder::init_git(const fs::path& root) -> cli::Status {
    RUSTISAN_LOG_INFO("new", "Initializing git repository...");

    std::vector<std::vector<std::string>> steps = {
        {"init"},
        {"add", "."},
        {"commit", "-m", "Initial commit"},
    };
    for (auto& args : steps) {
        process::ShellCommand cmd{"git", std::move(args), {}, root};
        auto status = ctx_.delegate(cmd);
        if (is_err(status)) {
            return status;
        }
    }
    return true;
}

auto Scaffolder::create(const ScaffoldOptions& options) -> Result<fs::path, cli::CliError> {
    if (!generator::is_valid_package_name(options.name)) {
        return cli::CliError::make(cli::ErrorKind::InvalidName,
                                   "'" + options.name + "' is not a valid package name");
    }

    auto vars = project_variables(options.name);
    auto tmpl = resolve_template(options, vars);
    if (is_err(tmpl)) {
        return unwrap_err(tmpl);
    }

    fs::path root = destination(options);
    auto free = check_destination(root);
    if (is_err(free)) {
        return unwrap_err(free);
    }

    RUSTISAN_LOG_INFO("new", "Creating new Rustisan application '"
                                 << options.name << "' from template '" << unwrap(tmpl).name
                                 << "'...");
    auto written = materialize(root, unwrap(tmpl));
    if (is_err(written)) {
        return unwrap_err(written);
    }

    if (options.git) {
        auto git = init_git(root);
        if (is_err(git)) {
            return unwrap_err(git);
        }
    }
    return root;
}

} // namespace rustisan::scaffold
