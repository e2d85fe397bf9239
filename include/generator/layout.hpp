//! # Project Layout
//!
//! The canonical directories of a rustisan project. Every generated file
//! lands in the directory its component kind maps to here.
//!
//! | Kind        | Directory                          |
//! |-------------|------------------------------------|
//! | controller  | `src/controllers`                  |
//! | model       | `src/models`                       |
//! | middleware  | `src/middleware`                   |
//! | request     | `src/requests`                     |
//! | resource    | `src/resources`                    |
//! | job         | `src/jobs`                         |
//! | event       | `src/events`                       |
//! | listener    | `src/listeners`                    |
//! | policy      | `src/policies`                     |
//! | command     | `src/commands`                     |
//! | trait       | `src/traits`                       |
//! | migration   | `database/migrations`              |
//! | seeder      | `database/seeders`                 |
//! | factory     | `database/factories`               |
//! | test        | `tests/unit`, `tests/integration`  |

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rustisan::generator {

/// The closed set of things `make:<kind>` can generate.
enum class ComponentKind {
    Controller,
    Model,
    Middleware,
    Request,
    Resource,
    Seeder,
    Factory,
    Job,
    Event,
    Listener,
    Migration,
    Policy,
    Command,
    Trait,
    Test,
};

/// The command noun for a kind ("controller", "model", ...).
const char* kind_name(ComponentKind kind);

/// Inverse of `kind_name()`.
std::optional<ComponentKind> parse_kind(std::string_view name);

/// Every kind, in declaration order.
const std::vector<ComponentKind>& all_kinds();

class ProjectLayout {
public:
    explicit ProjectLayout(std::filesystem::path root) : root_(std::move(root)) {}

    const std::filesystem::path& root() const {
        return root_;
    }

    /// Directory for `kind` relative to the project root. Tests go to
    /// `tests/integration` when `integration` is set.
    static std::filesystem::path relative_directory(ComponentKind kind, bool integration = false);

    std::filesystem::path directory(ComponentKind kind, bool integration = false) const {
        return root_ / relative_directory(kind, integration);
    }

    /// Directories created for every new project, relative to its root.
    static const std::vector<std::string>& project_directories();

    /// Source directories that get a `mod.rs` in a new project.
    static const std::vector<std::string>& module_directories();

private:
    std::filesystem::path root_;
};

} // namespace rustisan::generator
