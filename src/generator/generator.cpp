//! # Generator Engine
//!
//! Template selection, naming and file placement for `make:<kind>`.

#include "generator/generator.hpp"

#include "cli/utils.hpp"
#include "generator/naming.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

namespace rustisan::generator {

namespace {

// ============================================================================
// Template Selectors
// ============================================================================

/// Table a migration creates, including the one implied by a
/// `create_<table>_table` name.
std::string created_table(const ComponentSpec& spec) {
    if (!spec.modifiers.create_table.empty()) {
        return spec.modifiers.create_table;
    }
    if (!spec.modifiers.modify_table.empty()) {
        return "";
    }
    std::string snake = to_snake(spec.name);
    const std::string prefix = "create_";
    const std::string suffix = "_table";
    if (snake.size() > prefix.size() + suffix.size() && snake.rfind(prefix, 0) == 0 &&
        snake.compare(snake.size() - suffix.size(), suffix.size(), suffix) == 0) {
        return snake.substr(prefix.size(), snake.size() - prefix.size() - suffix.size());
    }
    return "";
}

std::string select_controller(const ComponentSpec& spec) {
    if (spec.modifiers.api) {
        return "controller_api";
    }
    if (spec.modifiers.resource) {
        return "controller_resource";
    }
    return "controller";
}

std::string select_resource(const ComponentSpec& spec) {
    return spec.modifiers.collection ? "resource_collection" : "resource";
}

std::string select_job(const ComponentSpec& spec) {
    return spec.modifiers.sync ? "job_sync" : "job";
}

std::string select_listener(const ComponentSpec& spec) {
    return spec.modifiers.event.empty() ? "listener" : "listener_event";
}

std::string select_migration(const ComponentSpec& spec) {
    if (!created_table(spec).empty()) {
        return "migration_create";
    }
    if (!spec.modifiers.modify_table.empty()) {
        return "migration_update";
    }
    return "migration";
}

std::string select_test(const ComponentSpec& spec) {
    return spec.modifiers.integration ? "test_integration" : "test_unit";
}

std::string select_by_kind(const ComponentSpec& spec) {
    return kind_name(spec.kind);
}

bool is_migration_file(const std::string& filename, const std::string& snake) {
    // YYYY_MM_DD_HHMMSS_<snake>.rs
    static constexpr std::string_view pattern = "0000_00_00_000000_";
    if (filename.size() != pattern.size() + snake.size() + 3) {
        return false;
    }
    for (size_t i = 0; i < pattern.size(); ++i) {
        bool digit = std::isdigit(static_cast<unsigned char>(filename[i])) != 0;
        if (pattern[i] == '0' ? !digit : filename[i] != '_') {
            return false;
        }
    }
    return filename.compare(pattern.size(), snake.size(), snake) == 0 &&
           filename.compare(filename.size() - 3, 3, ".rs") == 0;
}

bool has_line(const std::string& content, const std::string& line) {
    std::istringstream iss(content);
    std::string current;
    while (std::getline(iss, current)) {
        if (!current.empty() && current.back() == '\r') {
            current.pop_back();
        }
        if (current == line) {
            return true;
        }
    }
    return false;
}

} // namespace

// ============================================================================
// Kind Rules
// ============================================================================

const KindRule& rule_for(ComponentKind kind) {
    static const std::vector<KindRule> rules = {
        {ComponentKind::Controller, select_controller, "Controller", false, true, {}},
        {ComponentKind::Model,
         select_by_kind,
         "",
         false,
         true,
         {
             {ComponentKind::Migration, &Modifiers::migration},
             {ComponentKind::Factory, &Modifiers::factory},
             {ComponentKind::Seeder, &Modifiers::seeder},
         }},
        {ComponentKind::Middleware, select_by_kind, "", false, true, {}},
        {ComponentKind::Request, select_by_kind, "Request", false, true, {}},
        {ComponentKind::Resource, select_resource, "Resource", false, true, {}},
        {ComponentKind::Seeder, select_by_kind, "Seeder", false, false, {}},
        {ComponentKind::Factory, select_by_kind, "Factory", false, false, {}},
        {ComponentKind::Job, select_job, "Job", false, true, {}},
        {ComponentKind::Event, select_by_kind, "", false, true, {}},
        {ComponentKind::Listener, select_listener, "Listener", false, true, {}},
        {ComponentKind::Migration, select_migration, "", true, false, {}},
        {ComponentKind::Policy, select_by_kind, "Policy", false, true, {}},
        {ComponentKind::Command, select_by_kind, "Command", false, true, {}},
        {ComponentKind::Trait, select_by_kind, "", false, true, {}},
        {ComponentKind::Test, select_test, "", false, false, {}},
    };
    for (const auto& rule : rules) {
        if (rule.kind == kind) {
            return rule;
        }
    }
    return rules.front();
}

std::string migration_timestamp(std::chrono::system_clock::time_point time) {
    auto t = std::chrono::system_clock::to_time_t(time);
    std::tm tm_buf;
#ifdef _WIN32
    gmtime_s(&tm_buf, &t);
#else
    gmtime_r(&t, &tm_buf);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y_%m_%d_%H%M%S");
    return oss.str();
}

// ============================================================================
// Generator
// ============================================================================

Generator::Generator(fs::path root, cli::Clock now, const TemplateRegistry& templates)
    : layout_(std::move(root)), now_(std::move(now)), templates_(templates) {}

std::string Generator::template_name(const ComponentSpec& spec) {
    return rule_for(spec.kind).select_template(spec);
}

TemplateVars Generator::variables(const ComponentSpec& spec) const {
    return variables(spec, now_());
}

TemplateVars Generator::variables(const ComponentSpec& spec,
                                  std::chrono::system_clock::time_point at) const {
    const KindRule& rule = rule_for(spec.kind);
    TemplateVars vars = name_variables(spec.name);
    const std::string pascal = vars["pascal"];

    std::string suffix = rule.type_suffix;
    std::string base = suffix.empty() ? pascal : strip_suffix(pascal, suffix);
    vars["class"] = base + suffix;

    std::string model;
    if (!spec.modifiers.model.empty()) {
        model = to_pascal(spec.modifiers.model);
    } else if (spec.kind == ComponentKind::Controller) {
        model = to_pascal(singularize(base));
    } else {
        model = base;
    }
    vars["model"] = model;
    vars["model_snake"] = to_snake(model);
    vars["model_plural_snake"] = pluralize_snake(to_snake(model));

    vars["event"] = to_pascal(spec.modifiers.event);
    vars["event_snake"] = to_snake(spec.modifiers.event);

    std::string table = created_table(spec);
    if (table.empty()) {
        table = spec.modifiers.modify_table;
    }
    if (table.empty()) {
        table = vars["plural_snake"];
    }
    vars["table"] = table;
    vars["timestamp"] = migration_timestamp(at);
    return vars;
}

std::optional<fs::path> Generator::existing_migration(const std::string& snake) const {
    fs::path dir = layout_.directory(ComponentKind::Migration);
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return std::nullopt;
    }

    std::optional<fs::path> found;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        std::string filename = entry.path().filename().string();
        if (is_migration_file(filename, snake) && (!found || entry.path() < *found)) {
            found = entry.path();
        }
    }
    return found;
}

fs::path Generator::target_path(const ComponentSpec& spec) const {
    return target_path(spec, now_());
}

fs::path Generator::target_path(const ComponentSpec& spec,
                                std::chrono::system_clock::time_point at) const {
    const KindRule& rule = rule_for(spec.kind);
    std::string snake = to_snake(spec.name);
    fs::path dir = layout_.directory(spec.kind, spec.modifiers.integration);

    if (rule.timestamped) {
        if (auto existing = existing_migration(snake)) {
            return *existing;
        }
        return dir / (migration_timestamp(at) + "_" + snake + ".rs");
    }
    return dir / (snake + ".rs");
}

std::vector<ComponentSpec> Generator::secondaries(const ComponentSpec& spec) {
    std::vector<ComponentSpec> result;
    std::string pascal = to_pascal(spec.name);
    std::string plural = pluralize_snake(to_snake(spec.name));

    for (const auto& effect : rule_for(spec.kind).side_effects) {
        if (!(spec.modifiers.*effect.enabled)) {
            continue;
        }
        ComponentSpec secondary;
        secondary.kind = effect.kind;
        secondary.modifiers.force = spec.modifiers.force;
        switch (effect.kind) {
        case ComponentKind::Migration:
            secondary.name = "create_" + plural + "_table";
            secondary.modifiers.create_table = plural;
            break;
        case ComponentKind::Factory:
            secondary.name = pascal + "Factory";
            secondary.modifiers.model = pascal;
            break;
        case ComponentKind::Seeder:
            secondary.name = pascal + "Seeder";
            secondary.modifiers.model = pascal;
            break;
        default:
            secondary.name = spec.name;
            break;
        }
        result.push_back(std::move(secondary));
    }
    return result;
}

auto Generator::validate(const ComponentSpec& spec) const -> cli::Status {
    using cli::CliError;
    using cli::ErrorKind;

    if (!is_valid_identifier(spec.name) || to_snake(spec.name).empty()) {
        return CliError::make(ErrorKind::InvalidName,
                              "'" + spec.name + "' is not a valid identifier");
    }
    const Modifiers& m = spec.modifiers;
    for (const auto* value : {&m.model, &m.event, &m.create_table, &m.modify_table}) {
        if (!value->empty() && (!is_valid_identifier(*value) || to_snake(*value).empty())) {
            return CliError::make(ErrorKind::InvalidName,
                                  "'" + *value + "' is not a valid identifier");
        }
    }
    if (!m.create_table.empty() && !m.modify_table.empty()) {
        return CliError::make(ErrorKind::ParseError, "--create and --table cannot be combined");
    }
    if (m.unit && m.integration) {
        return CliError::make(ErrorKind::ParseError, "--unit and --integration cannot be combined");
    }
    return true;
}

auto Generator::register_module(const fs::path& file) const -> cli::Status {
    fs::path mod_file = file.parent_path() / "mod.rs";
    std::error_code ec;
    if (!fs::exists(mod_file, ec)) {
        return true;
    }

    auto content = cli::read_file(mod_file);
    if (is_err(content)) {
        return unwrap_err(content);
    }
    std::string text = unwrap(content);
    std::string line = "pub mod " + file.stem().string() + ";";
    if (has_line(text, line)) {
        return true;
    }

    if (!text.empty() && text.back() != '\n') {
        text += '\n';
    }
    text += line + "\n";
    RUSTISAN_LOG_DEBUG("make", "Registering " << line << " in "
                                              << cli::display_path(mod_file, layout_.root()));
    return cli::write_file(mod_file, text);
}

auto Generator::generate_one(const ComponentSpec& spec) -> Result<fs::path, cli::CliError> {
    auto valid = validate(spec);
    if (is_err(valid)) {
        return unwrap_err(valid);
    }

    std::string name = template_name(spec);
    const Template* tmpl = templates_.find(name);
    if (!tmpl) {
        return cli::CliError::make(cli::ErrorKind::UnknownTemplate,
                                   "no template named '" + name + "'");
    }

    auto at = now_();
    fs::path path = target_path(spec, at);
    std::error_code ec;
    if (fs::exists(path, ec) && !spec.modifiers.force) {
        return cli::CliError::make(cli::ErrorKind::TargetExists,
                                   cli::display_path(path, layout_.root()) +
                                       " already exists (use --force to overwrite)");
    }

    RUSTISAN_LOG_DEBUG("make", "Rendering template " << tmpl->name << " v" << tmpl->version);
    auto written = cli::write_file(path, render(tmpl->text, variables(spec, at)));
    if (is_err(written)) {
        return unwrap_err(written);
    }
    RUSTISAN_LOG_INFO("make", "Created " << kind_name(spec.kind) << ": "
                                         << cli::display_path(path, layout_.root()));

    if (rule_for(spec.kind).registers_module) {
        auto registered = register_module(path);
        if (is_err(registered)) {
            return unwrap_err(registered);
        }
    }
    return path;
}

auto Generator::generate(const ComponentSpec& spec) -> Result<std::vector<fs::path>, cli::CliError> {
    std::vector<fs::path> written;
    std::optional<cli::CliError> first_error;

    auto record = [&](Result<fs::path, cli::CliError> result) {
        if (is_ok(result)) {
            written.push_back(unwrap(result));
        } else if (!first_error) {
            first_error = unwrap_err(result);
        } else {
            RUSTISAN_LOG_ERROR("make", unwrap_err(result).to_string());
        }
    };

    // An invalid primary name fails before any file is touched.
    auto valid = validate(spec);
    if (is_err(valid)) {
        return unwrap_err(valid);
    }

    record(generate_one(spec));
    for (const auto& secondary : secondaries(spec)) {
        record(generate_one(secondary));
    }

    if (first_error) {
        return *first_error;
    }
    return written;
}

} // namespace rustisan::generator
