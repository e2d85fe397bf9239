//! # Config Store
//!
//! Dotted-key access to a project's `rustisan.toml`. Every `set` reads the
//! file, edits it through `TomlDocument` and writes it back, so keys the
//! edit does not touch keep their text, comments and order.
//!
//! ## Example
//!
//! ```cpp
//! ConfigStore store(project / "rustisan.toml");
//! auto set = store.set("app.name", parse_cli_value("New App"));
//! auto name = store.get("app.name");
//! if (is_ok(name)) {
//!     std::cout << unwrap(name).to_display();  // New App
//! }
//! ```

#pragma once

#include "cli/error.hpp"
#include "config/toml_document.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace rustisan::config {

// ============================================================================
// Free Helpers
// ============================================================================

/// One leaf of the configuration as shown by `config:show`.
struct ConfigEntry {
    std::string key;   ///< dotted key
    std::string value; ///< TOML rendering of the value
    bool sensitive = false;
};

/// Outcome of `validate()`. Errors fail the command, warnings do not.
struct ValidationReport {
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    [[nodiscard]] auto ok() const -> bool {
        return errors.empty();
    }
};

/// Text shown instead of a sensitive value.
constexpr const char* MASKED_VALUE = "********";

/// True for keys whose values are secrets: a last segment of `key`, or a
/// key mentioning a password, secret, token, api key, private key or dsn.
bool is_sensitive_key(std::string_view dotted);

/// Every non-table value under `root`, sorted by key within each table.
/// Arrays are leaves.
std::vector<ConfigEntry> flatten(const TomlValue& root);

/// Checks required keys, the app key, the database driver, the environment
/// and the server port.
ValidationReport validate(const TomlValue& root);

/// Standard Base64 with padding.
std::string base64_encode(const std::vector<uint8_t>& bytes);

/// A fresh application key: `base64:` followed by 32 random bytes.
std::string generate_app_key();

/// The `rustisan.toml` written by `new` and `config:reset`.
std::string default_config(const std::string& app_name = "Rustisan App");

/// Maps a document error onto the CLI taxonomy.
cli::CliError to_cli_error(const TomlError& error, const std::filesystem::path& path);

// ============================================================================
// Config Store
// ============================================================================

class ConfigStore {
public:
    explicit ConfigStore(std::filesystem::path path) : path_(std::move(path)) {}

    [[nodiscard]] auto path() const -> const std::filesystem::path& {
        return path_;
    }

    /// Reads and parses the file.
    [[nodiscard]] auto load() const -> Result<TomlDocument, cli::CliError>;

    /// Value at a dotted key, or `KeyNotFound`.
    [[nodiscard]] auto get(std::string_view key) const -> Result<TomlValue, cli::CliError>;

    /// Writes a value at a dotted key, creating tables as needed.
    /// Fails with `TypeConflict` when the key runs through a non-table.
    auto set(std::string_view key, const TomlValue& value) -> cli::Status;

    /// Replaces the whole file.
    auto overwrite(std::string_view content) -> cli::Status;

private:
    std::filesystem::path path_;
};

} // namespace rustisan::config
