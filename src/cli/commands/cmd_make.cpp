//! # Make Commands
//!
//! Registers `make:<kind>` for every `ComponentKind` and forwards the parsed
//! command to the generator. Which flags a kind accepts is decided here;
//! what they mean is decided by the generator's kind rules.
//!
//! | Command            | Flags                                      |
//! |--------------------|--------------------------------------------|
//! | `make:controller`  | `-r/--resource`, `--api`, `-m/--model`     |
//! | `make:model`       | `-m/--migration`, `-f/--factory`, `-s/--seeder` |
//! | `make:migration`   | `--create`, `--table`                      |
//! | `make:resource`    | `-c/--collection`                          |
//! | `make:seeder`      | `-m/--model`                               |
//! | `make:factory`     | `-m/--model`                               |
//! | `make:policy`      | `-m/--model`                               |
//! | `make:job`         | `--sync`                                   |
//! | `make:listener`    | `-e/--event`                               |
//! | `make:test`        | `-u/--unit`, `-i/--integration`            |
//!
//! Every kind also takes `--force`.

#include "cmd_make.hpp"

#include "cli/context.hpp"
#include "generator/component.hpp"
#include "generator/generator.hpp"
#include "log/log.hpp"

namespace rustisan::cli {

namespace {

using generator::ComponentKind;

std::vector<FlagSpec> flags_for(ComponentKind kind) {
    std::vector<FlagSpec> flags;
    switch (kind) {
    case ComponentKind::Controller:
        flags.push_back({"resource", 'r', FlagType::Bool, "", "CRUD resource controller"});
        flags.push_back({"api", 0, FlagType::Bool, "", "JSON API controller"});
        flags.push_back({"model", 'm', FlagType::String, "", "model the controller manages"});
        break;
    case ComponentKind::Model:
        flags.push_back({"migration", 'm', FlagType::Bool, "", "also create a migration"});
        flags.push_back({"factory", 'f', FlagType::Bool, "", "also create a factory"});
        flags.push_back({"seeder", 's', FlagType::Bool, "", "also create a seeder"});
        break;
    case ComponentKind::Migration:
        flags.push_back({"create", 0, FlagType::String, "", "table to create"});
        flags.push_back({"table", 0, FlagType::String, "", "table to modify"});
        break;
    case ComponentKind::Resource:
        flags.push_back({"collection", 'c', FlagType::Bool, "", "resource collection"});
        break;
    case ComponentKind::Seeder:
    case ComponentKind::Factory:
    case ComponentKind::Policy:
        flags.push_back({"model", 'm', FlagType::String, "", "associated model"});
        break;
    case ComponentKind::Job:
        flags.push_back({"sync", 0, FlagType::Bool, "", "synchronous job"});
        break;
    case ComponentKind::Listener:
        flags.push_back({"event", 'e', FlagType::String, "", "event to listen for"});
        break;
    case ComponentKind::Test:
        flags.push_back({"unit", 'u', FlagType::Bool, "", "unit test (default)"});
        flags.push_back({"integration", 'i', FlagType::Bool, "", "integration test"});
        break;
    case ComponentKind::Middleware:
    case ComponentKind::Request:
    case ComponentKind::Event:
    case ComponentKind::Command:
    case ComponentKind::Trait:
        break;
    }
    flags.push_back({"force", 0, FlagType::Bool, "", "overwrite existing files"});
    return flags;
}

} // namespace

Status run_make(ComponentKind kind, const CommandDescriptor& cmd, CommandContext& ctx) {
    auto project = ctx.require_project();
    if (is_err(project)) {
        return project;
    }

    generator::ComponentSpec spec = generator::spec_from_descriptor(kind, cmd);
    RUSTISAN_LOG_DEBUG("make", "Generating " << generator::kind_name(kind) << " '" << spec.name
                                             << "' with template "
                                             << generator::Generator::template_name(spec));

    generator::Generator gen(ctx.cwd, ctx.now);
    auto written = gen.generate(spec);
    if (is_err(written)) {
        return unwrap_err(written);
    }
    RUSTISAN_LOG_DEBUG("make", unwrap(written).size() << " file(s) written");
    return true;
}

void register_make_commands(CommandRegistry& registry) {
    for (ComponentKind kind : generator::all_kinds()) {
        std::string noun = generator::kind_name(kind);
        registry.add(CommandSpec{
            "make",
            noun,
            {{"name", true, "name of the " + noun}},
            flags_for(kind),
            "Create a new " + noun,
            [kind](const CommandDescriptor& cmd, CommandContext& ctx) {
                return run_make(kind, cmd, ctx);
            },
        });
    }
}

} // namespace rustisan::cli
