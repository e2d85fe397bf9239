//! # TOML Value Types
//!
//! The value tree produced by parsing `rustisan.toml`. `TomlValue` is a
//! variant over the TOML scalar types plus boxed arrays and tables.
//!
//! ## Type Mapping
//!
//! | TOML                  | Storage         |
//! |-----------------------|-----------------|
//! | `"text"`, `'text'`    | `std::string`   |
//! | `42`, `0xff`, `1_000` | `int64_t`       |
//! | `3.14`, `1e6`, `inf`  | `double`        |
//! | `true`, `false`       | `bool`          |
//! | `1979-05-27T07:32:00Z`| `TomlDatetime`  |
//! | `[1, 2]`              | `Box<TomlArray>`|
//! | `{ a = 1 }`, `[table]`| `Box<TomlTable>`|
//!
//! ## Example
//!
//! ```cpp
//! auto port = TomlValue(int64_t{3000});
//! std::cout << port.to_toml();     // 3000
//! auto name = TomlValue("New App");
//! std::cout << name.to_toml();     // "New App"
//! std::cout << name.to_display();  // New App
//! ```

#pragma once

#include "common.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace rustisan::config {

struct TomlValue;

using TomlArray = std::vector<TomlValue>;

using TomlTable = std::map<std::string, TomlValue>;

/// An offset or local date/time, kept as written.
struct TomlDatetime {
    std::string text;

    [[nodiscard]] auto operator==(const TomlDatetime& other) const -> bool {
        return text == other.text;
    }
};

struct TomlValue {
    using ValueVariant = std::variant<std::string,     // string
                                      int64_t,         // integer
                                      double,          // float
                                      bool,            // boolean
                                      TomlDatetime,    // date/time
                                      Box<TomlArray>,  // array (boxed)
                                      Box<TomlTable>>; // table (boxed)

    ValueVariant data;

    // ========================================================================
    // Constructors
    // ========================================================================

    TomlValue() : data(make_box<TomlTable>()) {}

    explicit TomlValue(const char* value) : data(std::string(value)) {}

    explicit TomlValue(std::string value) : data(std::move(value)) {}

    explicit TomlValue(int64_t value) : data(value) {}

    explicit TomlValue(int value) : data(static_cast<int64_t>(value)) {}

    explicit TomlValue(double value) : data(value) {}

    explicit TomlValue(bool value) : data(value) {}

    explicit TomlValue(TomlDatetime value) : data(std::move(value)) {}

    explicit TomlValue(TomlArray value) : data(make_box<TomlArray>(std::move(value))) {}

    explicit TomlValue(TomlTable value) : data(make_box<TomlTable>(std::move(value))) {}

    // ========================================================================
    // Type Queries
    // ========================================================================

    [[nodiscard]] auto is_string() const -> bool {
        return std::holds_alternative<std::string>(data);
    }

    [[nodiscard]] auto is_integer() const -> bool {
        return std::holds_alternative<int64_t>(data);
    }

    [[nodiscard]] auto is_float() const -> bool {
        return std::holds_alternative<double>(data);
    }

    [[nodiscard]] auto is_bool() const -> bool {
        return std::holds_alternative<bool>(data);
    }

    [[nodiscard]] auto is_datetime() const -> bool {
        return std::holds_alternative<TomlDatetime>(data);
    }

    [[nodiscard]] auto is_array() const -> bool {
        return std::holds_alternative<Box<TomlArray>>(data);
    }

    [[nodiscard]] auto is_table() const -> bool {
        return std::holds_alternative<Box<TomlTable>>(data);
    }

    /// Name of the stored type ("string", "integer", "table", ...).
    [[nodiscard]] auto type_name() const -> const char*;

    // ========================================================================
    // Accessors
    // ========================================================================

    [[nodiscard]] auto as_string() const -> const std::string& {
        return std::get<std::string>(data);
    }

    [[nodiscard]] auto as_integer() const -> int64_t {
        return std::get<int64_t>(data);
    }

    [[nodiscard]] auto as_float() const -> double {
        return std::get<double>(data);
    }

    [[nodiscard]] auto as_bool() const -> bool {
        return std::get<bool>(data);
    }

    [[nodiscard]] auto as_array() const -> const TomlArray& {
        return *std::get<Box<TomlArray>>(data);
    }

    [[nodiscard]] auto as_array_mut() -> TomlArray& {
        return *std::get<Box<TomlArray>>(data);
    }

    [[nodiscard]] auto as_table() const -> const TomlTable& {
        return *std::get<Box<TomlTable>>(data);
    }

    [[nodiscard]] auto as_table_mut() -> TomlTable& {
        return *std::get<Box<TomlTable>>(data);
    }

    /// String value, or nullopt for any other type.
    [[nodiscard]] auto try_as_string() const -> std::optional<std::string> {
        if (auto* s = std::get_if<std::string>(&data)) {
            return *s;
        }
        return std::nullopt;
    }

    // ========================================================================
    // Table Access
    // ========================================================================

    /// Member of a table, or nullptr if absent or not a table.
    [[nodiscard]] auto get(const std::string& key) const -> const TomlValue*;

    [[nodiscard]] auto get_mut(const std::string& key) -> TomlValue*;

    /// Follows a key path through nested tables. Never descends into arrays.
    [[nodiscard]] auto find(const std::vector<std::string>& path) const -> const TomlValue*;

    // ========================================================================
    // Serialization
    // ========================================================================

    /// TOML source text for this value. Tables render inline.
    [[nodiscard]] auto to_toml() const -> std::string;

    /// Text for showing to a user: strings without quotes, the rest as TOML.
    [[nodiscard]] auto to_display() const -> std::string;

    /// JSON text for this value. Datetimes become strings.
    [[nodiscard]] auto to_json() const -> std::string;

    [[nodiscard]] auto clone() const -> TomlValue;

    [[nodiscard]] auto operator==(const TomlValue& other) const -> bool;
};

/// Renders a key segment bare when it only holds `A-Za-z0-9_-`, else quoted.
std::string format_key(std::string_view key);

/// Renders a key path as dotted TOML key text.
std::string format_key_path(const std::vector<std::string>& path);

/// Quotes a string as a TOML basic string.
std::string quote_string(std::string_view s);

/// Types a command-line value: `true`/`false` become booleans, integer
/// literals integers, float literals floats, anything else a string.
TomlValue parse_cli_value(std::string_view text);

} // namespace rustisan::config
