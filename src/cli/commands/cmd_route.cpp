//! # Route Commands
//!
//! Routes are read from the registrations in `routes/*.rs`:
//!
//! ```rust
//! router.get("/users", users::index).name("users.index").middleware("auth");
//! ```
//!
//! The HTTP method is the call name, the URI its first string argument.
//! `.name(...)` and `.middleware(...)` count when they follow on the same
//! line. Comment lines are skipped.
//!
//! `route:cache` writes the discovered routes to `bootstrap/cache/routes.json`;
//! `route:clear` removes that file.

#include "cmd_route.hpp"

#include "cli/context.hpp"
#include "cli/utils.hpp"
#include "config/toml_value.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

namespace rustisan::cli {

namespace {

const char* const ROUTE_METHODS[] = {"get", "post", "put", "patch", "delete", "options", "any"};

constexpr const char* ROUTE_CACHE = "bootstrap/cache/routes.json";

std::string upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

/// The string literal starting at `pos` (after optional blanks), if any.
std::optional<std::string> string_literal(std::string_view line, size_t pos) {
    while (pos < line.size() && (line[pos] == ' ' || line[pos] == '\t')) {
        ++pos;
    }
    if (pos >= line.size() || line[pos] != '"') {
        return std::nullopt;
    }
    std::string value;
    for (++pos; pos < line.size(); ++pos) {
        char c = line[pos];
        if (c == '\\' && pos + 1 < line.size()) {
            value += line[++pos];
        } else if (c == '"') {
            return value;
        } else {
            value += c;
        }
    }
    return std::nullopt;
}

/// Every string argument of `.<call>("...")` at or after `from`.
std::vector<std::string> call_arguments(std::string_view line, std::string_view call,
                                        size_t from) {
    std::vector<std::string> values;
    std::string needle = "." + std::string(call) + "(";
    for (size_t pos = line.find(needle, from); pos != std::string_view::npos;
         pos = line.find(needle, pos + needle.size())) {
        if (auto value = string_literal(line, pos + needle.size())) {
            values.push_back(*value);
        }
    }
    return values;
}

bool is_comment(std::string_view line) {
    size_t first = line.find_first_not_of(" \t");
    return first != std::string_view::npos && line.substr(first, 2) == "//";
}

void scan_line(std::string_view line, const std::string& source,
               std::vector<RouteEntry>& routes) {
    for (const char* method : ROUTE_METHODS) {
        std::string needle = "." + std::string(method) + "(";
        size_t pos = line.find(needle);
        if (pos == std::string_view::npos) {
            continue;
        }
        auto uri = string_literal(line, pos + needle.size());
        if (!uri) {
            continue;
        }
        RouteEntry route;
        route.method = upper(method);
        route.uri = *uri;
        auto names = call_arguments(line, "name", pos);
        if (!names.empty()) {
            route.name = names.front();
        }
        route.middleware = call_arguments(line, "middleware", pos);
        route.source = source;
        routes.push_back(std::move(route));
        return;
    }
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result += sep;
        }
        result += parts[i];
    }
    return result;
}

void print_routes(std::ostream& out, const std::vector<RouteEntry>& routes,
                  bool show_middleware) {
    std::vector<std::vector<std::string>> rows;
    std::vector<std::string> header = {"Method", "URI", "Name", "Source"};
    if (show_middleware) {
        header.insert(header.begin() + 3, "Middleware");
    }
    rows.push_back(header);
    for (const auto& route : routes) {
        std::vector<std::string> row = {route.method, route.uri, route.name.value_or("-"),
                                        route.source};
        if (show_middleware) {
            row.insert(row.begin() + 3,
                       route.middleware.empty() ? "-" : join(route.middleware, ", "));
        }
        rows.push_back(std::move(row));
    }

    std::vector<size_t> widths(header.size(), 0);
    for (const auto& row : rows) {
        for (size_t i = 0; i < row.size(); ++i) {
            widths[i] = std::max(widths[i], row[i].size());
        }
    }
    for (const auto& row : rows) {
        for (size_t i = 0; i + 1 < row.size(); ++i) {
            out << std::left << std::setw(static_cast<int>(widths[i] + 2)) << row[i];
        }
        out << row.back() << "\n";
    }
}

} // namespace

Result<std::vector<RouteEntry>, CliError> discover_routes(const fs::path& root) {
    std::vector<RouteEntry> routes;
    fs::path dir = root / "routes";
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return routes;
    }

    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (entry.path().extension() == ".rs") {
            files.push_back(entry.path());
        }
    }
    if (ec) {
        return CliError::make(ErrorKind::IoError,
                              "cannot read " + display_path(dir, root) + ": " + ec.message());
    }
    std::sort(files.begin(), files.end());

    for (const auto& file : files) {
        auto text = read_file(file);
        if (is_err(text)) {
            return unwrap_err(text);
        }
        std::istringstream lines(unwrap(text));
        std::string line;
        size_t number = 0;
        while (std::getline(lines, line)) {
            ++number;
            if (is_comment(line)) {
                continue;
            }
            scan_line(line, display_path(file, root) + ":" + std::to_string(number), routes);
        }
        RUSTISAN_LOG_DEBUG("route", "Scanned " << display_path(file, root));
    }
    return routes;
}

std::vector<RouteEntry> filter_routes(std::vector<RouteEntry> routes,
                                      const std::optional<std::string>& method,
                                      const std::optional<std::string>& name) {
    std::string wanted = method ? upper(*method) : "";
    routes.erase(std::remove_if(routes.begin(), routes.end(),
                                [&](const RouteEntry& route) {
                                    if (method && route.method != wanted) {
                                        return true;
                                    }
                                    if (name && (!route.name ||
                                                 route.name->find(*name) == std::string::npos)) {
                                        return true;
                                    }
                                    return false;
                                }),
                 routes.end());
    return routes;
}

std::string routes_json(const std::vector<RouteEntry>& routes) {
    std::ostringstream json;
    json << "[";
    for (size_t i = 0; i < routes.size(); ++i) {
        const auto& route = routes[i];
        json << (i > 0 ? ",\n  " : "\n  ");
        json << "{\"method\": " << config::quote_string(route.method)
             << ", \"uri\": " << config::quote_string(route.uri) << ", \"name\": "
             << (route.name ? config::quote_string(*route.name) : "null")
             << ", \"middleware\": [";
        for (size_t m = 0; m < route.middleware.size(); ++m) {
            json << (m > 0 ? ", " : "") << config::quote_string(route.middleware[m]);
        }
        json << "], \"source\": " << config::quote_string(route.source) << "}";
    }
    json << (routes.empty() ? "]\n" : "\n]\n");
    return json.str();
}

Status run_route_list(const CommandDescriptor& cmd, CommandContext& ctx) {
    auto project = ctx.require_project();
    if (is_err(project)) {
        return project;
    }
    auto routes = discover_routes(ctx.cwd);
    if (is_err(routes)) {
        return unwrap_err(routes);
    }
    auto shown = filter_routes(unwrap(routes), cmd.flag("method"), cmd.flag("name"));
    if (shown.empty()) {
        RUSTISAN_LOG_WARN("route", "No routes found");
        return true;
    }
    print_routes(ctx.out, shown, cmd.flag_bool("middleware"));
    return true;
}

Status run_route_cache(const CommandDescriptor&, CommandContext& ctx) {
    auto project = ctx.require_project();
    if (is_err(project)) {
        return project;
    }
    auto routes = discover_routes(ctx.cwd);
    if (is_err(routes)) {
        return unwrap_err(routes);
    }
    auto written = write_file(ctx.cwd / ROUTE_CACHE, routes_json(unwrap(routes)));
    if (is_err(written)) {
        return written;
    }
    RUSTISAN_LOG_INFO("route", "Cached " << unwrap(routes).size() << " route(s) in "
                                         << ROUTE_CACHE);
    return true;
}

Status run_route_clear(const CommandDescriptor&, CommandContext& ctx) {
    auto project = ctx.require_project();
    if (is_err(project)) {
        return project;
    }
    fs::path cache = ctx.cwd / ROUTE_CACHE;
    std::error_code ec;
    if (!fs::exists(cache, ec)) {
        RUSTISAN_LOG_WARN("route", "Route cache not found");
        return true;
    }
    fs::remove(cache, ec);
    if (ec) {
        return CliError::make(ErrorKind::IoError,
                              "cannot remove " + std::string(ROUTE_CACHE) + ": " + ec.message());
    }
    RUSTISAN_LOG_INFO("route", "Route cache cleared");
    return true;
}

void register_route_commands(CommandRegistry& registry) {
    registry.add(CommandSpec{"route",
                             "list",
                             {},
                             {
                                 {"method", 0, FlagType::String, "", "only this HTTP method"},
                                 {"name", 0, FlagType::String, "", "only names containing this"},
                                 {"middleware", 0, FlagType::Bool, "", "show middleware"},
                             },
                             "List the application routes",
                             run_route_list});
    registry.add(CommandSpec{
        "route", "cache", {}, {}, "Cache the application routes", run_route_cache});
    registry.add(
        CommandSpec{"route", "clear", {}, {}, "Remove the route cache", run_route_clear});
}

} // namespace rustisan::cli
