//! # Generator Engine
//!
//! Renders a component template into the project. Per-kind behaviour is a
//! lookup table (`KindRule`) from kind to template selector, file naming
//! rule and the secondary components a modifier may request.
//!
//! ## Generation Order
//!
//! `make:model User --migration --factory --seeder` writes, in order:
//!
//! 1. `src/models/user.rs`
//! 2. `database/migrations/<YYYY_MM_DD_HHMMSS>_create_users_table.rs`
//! 3. `database/factories/user_factory.rs`
//! 4. `database/seeders/user_seeder.rs`
//!
//! Each step checks for an existing file on its own, so a step that hits
//! `TargetExists` does not stop the others.
//!
//! ## Module Registration
//!
//! After writing a file into a `src/` directory that holds a `mod.rs`, a
//! `pub mod <snake>;` line is appended unless it is already present.

#pragma once

#include "cli/context.hpp"
#include "cli/error.hpp"
#include "generator/component.hpp"
#include "generator/template.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace rustisan::generator {

/// Chooses the template name for a spec.
using TemplateSelector = std::string (*)(const ComponentSpec&);

/// A secondary component produced when a modifier is set.
struct SideEffect {
    ComponentKind kind;
    bool Modifiers::*enabled;
};

/// Everything kind-specific the generator needs.
struct KindRule {
    ComponentKind kind;
    TemplateSelector select_template;

    /// Appended to the PascalCase name to form the type name, unless present.
    const char* type_suffix;

    /// File names carry a `YYYY_MM_DD_HHMMSS_` prefix.
    bool timestamped;

    /// Written under `src/` and listed in the directory's `mod.rs`.
    bool registers_module;

    /// Secondary generations, in the order they run.
    std::vector<SideEffect> side_effects;
};

/// The rule for a kind.
const KindRule& rule_for(ComponentKind kind);

/// Formats a time point as `YYYY_MM_DD_HHMMSS` (UTC).
std::string migration_timestamp(std::chrono::system_clock::time_point time);

class Generator {
public:
    Generator(std::filesystem::path root, cli::Clock now,
              const TemplateRegistry& templates = TemplateRegistry::builtin());

    /// Generates the component and any secondaries its modifiers request.
    /// Returns the files written, or the first failure after every step ran.
    auto generate(const ComponentSpec& spec) -> Result<std::vector<std::filesystem::path>, cli::CliError>;

    /// Name of the template a spec renders.
    static std::string template_name(const ComponentSpec& spec);

    /// Slot values for a spec, with `timestamp` taken from the clock.
    TemplateVars variables(const ComponentSpec& spec) const;
    TemplateVars variables(const ComponentSpec& spec,
                           std::chrono::system_clock::time_point at) const;

    /// Destination for a spec. For migrations this is an existing file
    /// with the same name if there is one, else a new timestamped path.
    std::filesystem::path target_path(const ComponentSpec& spec) const;
    std::filesystem::path target_path(const ComponentSpec& spec,
                                      std::chrono::system_clock::time_point at) const;

    /// The secondary specs `spec` requests, in generation order.
    static std::vector<ComponentSpec> secondaries(const ComponentSpec& spec);

    const ProjectLayout& layout() const {
        return layout_;
    }

private:
    ProjectLayout layout_;
    cli::Clock now_;
    const TemplateRegistry& templates_;

    auto generate_one(const ComponentSpec& spec) -> Result<std::filesystem::path, cli::CliError>;
    auto validate(const ComponentSpec& spec) const -> cli::Status;
    std::optional<std::filesystem::path> existing_migration(const std::string& snake) const;
    auto register_module(const std::filesystem::path& file) const -> cli::Status;
};

} // namespace rustisan::generator
