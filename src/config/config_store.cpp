//! # Config Store
//!
//! Read-modify-write access to `rustisan.toml`, plus the helpers behind
//! `config:show`, `config:validate` and `config:generate-key`.

#include "config/config_store.hpp"

#include "cli/utils.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <random>
#include <sstream>

namespace rustisan::config {

namespace {

std::string to_lower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

void flatten_into(const TomlValue& value, std::vector<std::string>& path,
                  std::vector<ConfigEntry>& out) {
    if (!value.is_table()) {
        std::string key = format_key_path(path);
        out.push_back(ConfigEntry{key, value.to_toml(), is_sensitive_key(key)});
        return;
    }
    for (const auto& [name, child] : value.as_table()) {
        path.push_back(name);
        flatten_into(child, path, out);
        path.pop_back();
    }
}

const TomlValue* lookup(const TomlValue& root, std::string_view dotted) {
    auto path = TomlDocument::split_key(dotted);
    if (is_err(path)) {
        return nullptr;
    }
    return root.find(unwrap(path));
}

auto split_or_error(std::string_view key) -> Result<std::vector<std::string>, cli::CliError> {
    auto path = TomlDocument::split_key(key);
    if (is_err(path)) {
        return cli::CliError::make(cli::ErrorKind::ParseError,
                                   "invalid key '" + std::string(key) +
                                       "': " + unwrap_err(path).message);
    }
    return std::move(unwrap(path));
}

} // namespace

// ============================================================================
// Free Helpers
// ============================================================================

bool is_sensitive_key(std::string_view dotted) {
    std::string key = to_lower(dotted);
    auto dot = key.rfind('.');
    std::string last = dot == std::string::npos ? key : key.substr(dot + 1);
    if (last == "key") {
        return true;
    }

    // "api.key" and "api-key" read the same as "api_key".
    std::string normalized = key;
    std::replace(normalized.begin(), normalized.end(), '.', '_');
    std::replace(normalized.begin(), normalized.end(), '-', '_');

    static constexpr std::array<std::string_view, 6> markers = {
        "password", "secret", "token", "api_key", "private_key", "dsn"};
    return std::any_of(markers.begin(), markers.end(), [&](std::string_view marker) {
        return normalized.find(marker) != std::string::npos;
    });
}

std::vector<ConfigEntry> flatten(const TomlValue& root) {
    std::vector<ConfigEntry> entries;
    std::vector<std::string> path;
    if (root.is_table()) {
        flatten_into(root, path, entries);
    }
    return entries;
}

ValidationReport validate(const TomlValue& root) {
    ValidationReport report;

    static constexpr std::array<std::string_view, 7> required = {
        "app.name",
        "app.env",
        "app.key",
        "database.default",
        "database.connections.default.driver",
        "database.connections.default.host",
        "database.connections.default.database",
    };
    for (auto key : required) {
        const TomlValue* value = lookup(root, key);
        if (!value) {
            report.errors.push_back("Required key '" + std::string(key) + "' is missing");
        } else if (value->is_string() && value->as_string().empty()) {
            report.warnings.push_back("'" + std::string(key) + "' is empty");
        }
    }

    if (const TomlValue* key = lookup(root, "app.key"); key && key->is_string()) {
        const std::string& text = key->as_string();
        if (!text.empty()) {
            if (text.rfind("base64:", 0) != 0) {
                report.warnings.push_back("app.key should start with 'base64:'");
            }
            if (text.size() < 32) {
                report.warnings.push_back("app.key appears to be too short for security");
            }
        }
    }

    if (const TomlValue* driver = lookup(root, "database.connections.default.driver");
        driver && driver->is_string()) {
        const std::string& name = driver->as_string();
        if (name != "mysql" && name != "postgres" && name != "sqlite") {
            report.warnings.push_back("Unsupported database driver: " + name);
        }
    }

    if (const TomlValue* env = lookup(root, "app.env"); env && env->is_string()) {
        const std::string& name = env->as_string();
        if (name != "development" && name != "testing" && name != "production") {
            report.warnings.push_back("Unknown environment: " + name);
        }
        if (name == "production") {
            const TomlValue* debug = lookup(root, "app.debug");
            if (debug && debug->is_bool() && debug->as_bool()) {
                report.errors.push_back("app.debug should be false in production");
            }
            const TomlValue* level = lookup(root, "logging.level");
            if (level && level->is_string() &&
                (level->as_string() == "debug" || level->as_string() == "trace")) {
                report.warnings.push_back(
                    "Consider using 'info' or 'warn' log level in production");
            }
        }
    }

    if (const TomlValue* port = lookup(root, "server.port")) {
        if (!port->is_integer() || port->as_integer() < 1 || port->as_integer() > 65535) {
            report.errors.push_back("server.port must be between 1 and 65535");
        }
    }

    return report;
}

std::string base64_encode(const std::vector<uint8_t>& bytes) {
    static constexpr char alphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string out;
    out.reserve((bytes.size() + 2) / 3 * 4);
    size_t i = 0;
    for (; i + 2 < bytes.size(); i += 3) {
        uint32_t n = (uint32_t{bytes[i]} << 16) | (uint32_t{bytes[i + 1]} << 8) | bytes[i + 2];
        out += alphabet[(n >> 18) & 0x3F];
        out += alphabet[(n >> 12) & 0x3F];
        out += alphabet[(n >> 6) & 0x3F];
        out += alphabet[n & 0x3F];
    }
    size_t rest = bytes.size() - i;
    if (rest == 1) {
        uint32_t n = uint32_t{bytes[i]} << 16;
        out += alphabet[(n >> 18) & 0x3F];
        out += alphabet[(n >> 12) & 0x3F];
        out += "==";
    } else if (rest == 2) {
        uint32_t n = (uint32_t{bytes[i]} << 16) | (uint32_t{bytes[i + 1]} << 8);
        out += alphabet[(n >> 18) & 0x3F];
        out += alphabet[(n >> 12) & 0x3F];
        out += alphabet[(n >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

std::string generate_app_key() {
    std::random_device device;
    std::uniform_int_distribution<int> byte(0, 255);
    std::vector<uint8_t> bytes(32);
    for (auto& b : bytes) {
        b = static_cast<uint8_t>(byte(device));
    }
    return "base64:" + base64_encode(bytes);
}

std::string default_config(const std::string& app_name) {
    std::ostringstream oss;

    oss << "[app]\n";
    oss << "name = " << quote_string(app_name) << "\n";
    oss << "env = \"development\"\n";
    oss << "debug = true\n";
    oss << "url = \"http://localhost:3000\"\n";
    oss << "timezone = \"UTC\"\n";
    oss << "locale = \"en\"\n";
    oss << "key = \"\"\n";
    oss << "cors_enabled = true\n";
    oss << "\n";

    oss << "[server]\n";
    oss << "host = \"127.0.0.1\"\n";
    oss << "port = 3000\n";
    oss << "timeout = 60\n";
    oss << "max_connections = 1000\n";
    oss << "https_enabled = false\n";
    oss << "\n";

    oss << "[database]\n";
    oss << "default = \"default\"\n";
    oss << "\n";

    oss << "[database.connections.default]\n";
    oss << "driver = \"mysql\"\n";
    oss << "host = \"localhost\"\n";
    oss << "port = 3306\n";
    oss << "database = \"rustisan_app\"\n";
    oss << "username = \"root\"\n";
    oss << "password = \"\"\n";
    oss << "charset = \"utf8mb4\"\n";
    oss << "pool_min = 1\n";
    oss << "pool_max = 10\n";
    oss << "timeout = 30\n";
    oss << "\n";

    oss << "[cache]\n";
    oss << "default = \"memory\"\n";
    oss << "ttl = 3600\n";
    oss << "\n";

    oss << "[session]\n";
    oss << "driver = \"cookie\"\n";
    oss << "lifetime = 120\n";
    oss << "expire_on_close = false\n";
    oss << "encrypt = true\n";
    oss << "cookie_name = \"rustisan_session\"\n";
    oss << "cookie_path = \"/\"\n";
    oss << "cookie_secure = false\n";
    oss << "cookie_http_only = true\n";
    oss << "\n";

    oss << "[logging]\n";
    oss << "level = \"info\"\n";
    oss << "default = \"console\"\n";
    oss << "\n";

    oss << "# Additional sections can be added here, for example:\n";
    oss << "# [mail]\n";
    oss << "# driver = \"smtp\"\n";
    oss << "# host = \"localhost\"\n";
    oss << "# port = 587\n";
    oss << "#\n";
    oss << "# [redis]\n";
    oss << "# host = \"localhost\"\n";
    oss << "# port = 6379\n";

    return oss.str();
}

cli::CliError to_cli_error(const TomlError& error, const std::filesystem::path& path) {
    switch (error.kind) {
    case TomlErrorKind::KeyNotFound:
        return cli::CliError::make(cli::ErrorKind::KeyNotFound, error.message);
    case TomlErrorKind::TypeConflict:
        return cli::CliError::make(cli::ErrorKind::TypeConflict, error.message);
    case TomlErrorKind::Syntax:
        break;
    }
    return cli::CliError::make(cli::ErrorKind::ConfigSyntax,
                               path.filename().string() + ": " + error.to_string());
}

// ============================================================================
// Config Store
// ============================================================================

auto ConfigStore::load() const -> Result<TomlDocument, cli::CliError> {
    auto text = cli::read_file(path_);
    if (is_err(text)) {
        return unwrap_err(text);
    }
    auto doc = TomlDocument::parse(unwrap(text));
    if (is_err(doc)) {
        return to_cli_error(unwrap_err(doc), path_);
    }
    return std::move(unwrap(doc));
}

auto ConfigStore::get(std::string_view key) const -> Result<TomlValue, cli::CliError> {
    auto path = split_or_error(key);
    if (is_err(path)) {
        return unwrap_err(path);
    }
    auto doc = load();
    if (is_err(doc)) {
        return unwrap_err(doc);
    }
    const TomlValue* value = unwrap(doc).get(unwrap(path));
    if (!value) {
        return cli::CliError::make(cli::ErrorKind::KeyNotFound,
                                   "configuration key '" + std::string(key) + "' not found");
    }
    return value->clone();
}

auto ConfigStore::set(std::string_view key, const TomlValue& value) -> cli::Status {
    auto path = split_or_error(key);
    if (is_err(path)) {
        return unwrap_err(path);
    }
    auto doc = load();
    if (is_err(doc)) {
        return unwrap_err(doc);
    }
    auto& document = unwrap(doc);
    auto result = document.set(unwrap(path), value);
    if (is_err(result)) {
        return to_cli_error(unwrap_err(result), path_);
    }
    RUSTISAN_LOG_DEBUG("config", "Set " << key << " = "
                                         << (is_sensitive_key(key) ? std::string(MASKED_VALUE)
                                                                   : value.to_toml()));
    return cli::write_file(path_, document.to_string());
}

auto ConfigStore::overwrite(std::string_view content) -> cli::Status {
    auto check = TomlDocument::parse(content);
    if (is_err(check)) {
        return to_cli_error(unwrap_err(check), path_);
    }
    return cli::write_file(path_, content);
}

} // namespace rustisan::config
