//! # Route Command Interface
//!
//! - `rustisan route:list [--method M] [--name N] [--middleware]`
//! - `rustisan route:cache`, `route:clear`

#ifndef RUSTISAN_CLI_CMD_ROUTE_HPP
#define RUSTISAN_CLI_CMD_ROUTE_HPP

#include "cli/command.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace rustisan::cli {

/// A route registration found in a `routes/*.rs` file.
struct RouteEntry {
    std::string method; ///< upper case, "GET"
    std::string uri;
    std::optional<std::string> name;
    std::vector<std::string> middleware;
    std::string source; ///< "routes/web.rs:7"
};

/// Routes registered in `<root>/routes/*.rs`, ordered by file then line.
/// A project without a `routes` directory has no routes.
Result<std::vector<RouteEntry>, CliError> discover_routes(const std::filesystem::path& root);

/// Keeps routes whose method equals `method` (any case) and whose name
/// contains `name`. Unnamed routes never match a name filter.
std::vector<RouteEntry> filter_routes(std::vector<RouteEntry> routes,
                                      const std::optional<std::string>& method,
                                      const std::optional<std::string>& name);

/// The route cache file contents, a JSON array.
std::string routes_json(const std::vector<RouteEntry>& routes);

Status run_route_list(const CommandDescriptor& cmd, CommandContext& ctx);
Status run_route_cache(const CommandDescriptor& cmd, CommandContext& ctx);
Status run_route_clear(const CommandDescriptor& cmd, CommandContext& ctx);

void register_route_commands(CommandRegistry& registry);

} // namespace rustisan::cli

#endif // RUSTISAN_CLI_CMD_ROUTE_HPP
