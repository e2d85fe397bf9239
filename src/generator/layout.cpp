#include "generator/layout.hpp"

namespace rustisan::generator {

const char* kind_name(ComponentKind kind) {
    switch (kind) {
    case ComponentKind::Controller:
        return "controller";
    case ComponentKind::Model:
        return "model";
    case ComponentKind::Middleware:
        return "middleware";
    case ComponentKind::Request:
        return "request";
    case ComponentKind::Resource:
        return "resource";
    case ComponentKind::Seeder:
        return "seeder";
    case ComponentKind::Factory:
        return "factory";
    case ComponentKind::Job:
        return "job";
    case ComponentKind::Event:
        return "event";
    case ComponentKind::Listener:
        return "listener";
    case ComponentKind::Migration:
        return "migration";
    case ComponentKind::Policy:
        return "policy";
    case ComponentKind::Command:
        return "command";
    case ComponentKind::Trait:
        return "trait";
    case ComponentKind::Test:
        return "test";
    }
    return "unknown";
}

std::optional<ComponentKind> parse_kind(std::string_view name) {
    for (ComponentKind kind : all_kinds()) {
        if (name == kind_name(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

const std::vector<ComponentKind>& all_kinds() {
    static const std::vector<ComponentKind> kinds = {
        ComponentKind::Controller, ComponentKind::Model,    ComponentKind::Middleware,
        ComponentKind::Request,    ComponentKind::Resource, ComponentKind::Seeder,
        ComponentKind::Factory,    ComponentKind::Job,      ComponentKind::Event,
        ComponentKind::Listener,   ComponentKind::Migration, ComponentKind::Policy,
        ComponentKind::Command,    ComponentKind::Trait,    ComponentKind::Test,
    };
    return kinds;
}

std::filesystem::path ProjectLayout::relative_directory(ComponentKind kind, bool integration) {
    switch (kind) {
    case ComponentKind::Controller:
        return "src/controllers";
    case ComponentKind::Model:
        return "src/models";
    case ComponentKind::Middleware:
        return "src/middleware";
    case ComponentKind::Request:
        return "src/requests";
    case ComponentKind::Resource:
        return "src/resources";
    case ComponentKind::Job:
        return "src/jobs";
    case ComponentKind::Event:
        return "src/events";
    case ComponentKind::Listener:
        return "src/listeners";
    case ComponentKind::Policy:
        return "src/policies";
    case ComponentKind::Command:
        return "src/commands";
    case ComponentKind::Trait:
        return "src/traits";
    case ComponentKind::Migration:
        return "database/migrations";
    case ComponentKind::Seeder:
        return "database/seeders";
    case ComponentKind::Factory:
        return "database/factories";
    case ComponentKind::Test:
        return integration ? "tests/integration" : "tests/unit";
    }
    return "src";
}

const std::vector<std::string>& ProjectLayout::project_directories() {
    static const std::vector<std::string> dirs = {
        "src/controllers",   "src/models",          "src/middleware",
        "src/requests",      "src/resources",       "src/services",
        "src/jobs",          "src/events",          "src/listeners",
        "database/migrations", "database/seeders",  "database/factories",
        "storage/logs",      "storage/cache",       "storage/sessions",
        "storage/uploads",   "resources/views",     "resources/assets",
        "config",            "routes",              "tests/unit",
        "tests/integration",
    };
    return dirs;
}

const std::vector<std::string>& ProjectLayout::module_directories() {
    static const std::vector<std::string> dirs = {
        "controllers", "models", "middleware", "requests", "resources",
        "services",    "jobs",   "events",     "listeners",
    };
    return dirs;
}

} // namespace rustisan::generator
