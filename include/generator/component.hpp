//! # Component Specs
//!
//! A `ComponentSpec` is what one `make:<kind>` invocation asks for: the
//! kind, the target name and the modifiers given on the command line.

#pragma once

#include "cli/command.hpp"
#include "generator/layout.hpp"

#include <string>

namespace rustisan::generator {

/// Options that change which template is used or what else is generated.
struct Modifiers {
    bool resource = false;       ///< controller with CRUD actions
    bool api = false;            ///< JSON controller
    bool migration = false;      ///< model: also create a migration
    bool factory = false;        ///< model: also create a factory
    bool seeder = false;         ///< model: also create a seeder
    bool collection = false;     ///< resource collection
    bool sync = false;           ///< synchronous job
    bool unit = false;           ///< unit test (the default)
    bool integration = false;    ///< integration test
    bool force = false;          ///< overwrite existing files

    std::string model;           ///< associated model
    std::string event;           ///< event handled by a listener
    std::string create_table;    ///< migration creating a table
    std::string modify_table;    ///< migration altering a table
};

struct ComponentSpec {
    ComponentKind kind = ComponentKind::Model;
    std::string name;
    Modifiers modifiers;
};

/// Builds a spec from a parsed `make:<kind>` command.
/// Flags the command did not declare are simply absent.
ComponentSpec spec_from_descriptor(ComponentKind kind, const cli::CommandDescriptor& descriptor);

} // namespace rustisan::generator
