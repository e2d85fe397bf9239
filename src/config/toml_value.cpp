//! # TOML Value Implementation
//!
//! Serialization, cloning and comparison for `TomlValue`, plus typing of
//! command-line values.

#include "config/toml_value.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <type_traits>

namespace rustisan::config {

// ============================================================================
// Helpers
// ============================================================================

namespace {

std::string format_float(double value) {
    if (std::isnan(value)) {
        return "nan";
    }
    if (std::isinf(value)) {
        return value < 0 ? "-inf" : "inf";
    }

    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    std::string text(buf, ec == std::errc() ? ptr : buf);

    // TOML floats need a fraction or an exponent
    if (text.find_first_of(".eE") == std::string::npos) {
        text += ".0";
    }
    return text;
}

void append_json_string(std::string& out, std::string_view s) {
    out += '"';
    for (char c : s) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char esc[8];
                std::snprintf(esc, sizeof(esc), "\\u%04x", static_cast<unsigned char>(c));
                out += esc;
            } else {
                out += c;
            }
        }
    }
    out += '"';
}

bool is_bare_key(std::string_view key) {
    if (key.empty()) {
        return false;
    }
    return std::all_of(key.begin(), key.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-';
    });
}

} // namespace

std::string quote_string(std::string_view s) {
    std::string out = "\"";
    for (char c : s) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        case '\b':
            out += "\\b";
            break;
        case '\f':
            out += "\\f";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f) {
                char esc[8];
                std::snprintf(esc, sizeof(esc), "\\u%04X", static_cast<unsigned char>(c));
                out += esc;
            } else {
                out += c;
            }
        }
    }
    out += '"';
    return out;
}

std::string format_key(std::string_view key) {
    return is_bare_key(key) ? std::string(key) : quote_string(key);
}

std::string format_key_path(const std::vector<std::string>& path) {
    std::string out;
    for (size_t i = 0; i < path.size(); ++i) {
        if (i > 0) {
            out += '.';
        }
        out += format_key(path[i]);
    }
    return out;
}

// ============================================================================
// TomlValue
// ============================================================================

auto TomlValue::type_name() const -> const char* {
    switch (data.index()) {
    case 0:
        return "string";
    case 1:
        return "integer";
    case 2:
        return "float";
    case 3:
        return "boolean";
    case 4:
        return "datetime";
    case 5:
        return "array";
    case 6:
        return "table";
    }
    return "unknown";
}

auto TomlValue::get(const std::string& key) const -> const TomlValue* {
    if (auto* table = std::get_if<Box<TomlTable>>(&data)) {
        auto it = (*table)->find(key);
        if (it != (*table)->end()) {
            return &it->second;
        }
    }
    return nullptr;
}

auto TomlValue::get_mut(const std::string& key) -> TomlValue* {
    if (auto* table = std::get_if<Box<TomlTable>>(&data)) {
        auto it = (*table)->find(key);
        if (it != (*table)->end()) {
            return &it->second;
        }
    }
    return nullptr;
}

auto TomlValue::find(const std::vector<std::string>& path) const -> const TomlValue* {
    const TomlValue* current = this;
    for (const auto& segment : path) {
        current = current->get(segment);
        if (!current) {
            return nullptr;
        }
    }
    return current;
}

auto TomlValue::to_toml() const -> std::string {
    if (auto* s = std::get_if<std::string>(&data)) {
        return quote_string(*s);
    }
    if (auto* i = std::get_if<int64_t>(&data)) {
        return std::to_string(*i);
    }
    if (auto* f = std::get_if<double>(&data)) {
        return format_float(*f);
    }
    if (auto* b = std::get_if<bool>(&data)) {
        return *b ? "true" : "false";
    }
    if (auto* dt = std::get_if<TomlDatetime>(&data)) {
        return dt->text;
    }
    if (is_array()) {
        std::string out = "[";
        const auto& arr = as_array();
        for (size_t i = 0; i < arr.size(); ++i) {
            if (i > 0) {
                out += ", ";
            }
            out += arr[i].to_toml();
        }
        out += "]";
        return out;
    }

    const auto& table = as_table();
    if (table.empty()) {
        return "{}";
    }
    std::string out = "{ ";
    bool first = true;
    for (const auto& [key, value] : table) {
        if (!first) {
            out += ", ";
        }
        first = false;
        out += format_key(key) + " = " + value.to_toml();
    }
    out += " }";
    return out;
}

auto TomlValue::to_display() const -> std::string {
    if (auto* s = std::get_if<std::string>(&data)) {
        return *s;
    }
    return to_toml();
}

auto TomlValue::to_json() const -> std::string {
    std::string out;
    if (auto* s = std::get_if<std::string>(&data)) {
        append_json_string(out, *s);
    } else if (auto* i = std::get_if<int64_t>(&data)) {
        out = std::to_string(*i);
    } else if (auto* f = std::get_if<double>(&data)) {
        // JSON has no inf or nan
        out = std::isfinite(*f) ? format_float(*f) : "null";
    } else if (auto* b = std::get_if<bool>(&data)) {
        out = *b ? "true" : "false";
    } else if (auto* dt = std::get_if<TomlDatetime>(&data)) {
        append_json_string(out, dt->text);
    } else if (is_array()) {
        out = "[";
        const auto& arr = as_array();
        for (size_t i = 0; i < arr.size(); ++i) {
            if (i > 0) {
                out += ",";
            }
            out += arr[i].to_json();
        }
        out += "]";
    } else {
        out = "{";
        bool first = true;
        for (const auto& [key, value] : as_table()) {
            if (!first) {
                out += ",";
            }
            first = false;
            append_json_string(out, key);
            out += ":" + value.to_json();
        }
        out += "}";
    }
    return out;
}

auto TomlValue::clone() const -> TomlValue {
    if (is_array()) {
        TomlArray arr;
        arr.reserve(as_array().size());
        for (const auto& elem : as_array()) {
            arr.push_back(elem.clone());
        }
        return TomlValue(std::move(arr));
    }
    if (is_table()) {
        TomlTable table;
        for (const auto& [key, value] : as_table()) {
            table.emplace(key, value.clone());
        }
        return TomlValue(std::move(table));
    }

    TomlValue copy;
    std::visit(
        [&copy](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (!std::is_same_v<T, Box<TomlArray>> && !std::is_same_v<T, Box<TomlTable>>) {
                copy.data = v;
            }
        },
        data);
    return copy;
}

auto TomlValue::operator==(const TomlValue& other) const -> bool {
    if (data.index() != other.data.index()) {
        return false;
    }
    if (is_array()) {
        return as_array() == other.as_array();
    }
    if (is_table()) {
        return as_table() == other.as_table();
    }
    if (is_string()) {
        return as_string() == other.as_string();
    }
    if (is_integer()) {
        return as_integer() == other.as_integer();
    }
    if (is_float()) {
        return as_float() == other.as_float();
    }
    if (is_bool()) {
        return as_bool() == other.as_bool();
    }
    return std::get<TomlDatetime>(data) == std::get<TomlDatetime>(other.data);
}

// ============================================================================
// Command-line values
// ============================================================================

namespace {

bool looks_like_float(std::string_view s) {
    size_t i = 0;
    if (i < s.size() && (s[i] == '+' || s[i] == '-')) {
        ++i;
    }
    size_t digits = 0;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
        ++i;
        ++digits;
    }
    bool has_fraction = false;
    if (i < s.size() && s[i] == '.') {
        has_fraction = true;
        ++i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
            ++i;
            ++digits;
        }
    }
    if (digits == 0) {
        return false;
    }
    bool has_exponent = false;
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
        has_exponent = true;
        ++i;
        if (i < s.size() && (s[i] == '+' || s[i] == '-')) {
            ++i;
        }
        size_t exp_digits = 0;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
            ++i;
            ++exp_digits;
        }
        if (exp_digits == 0) {
            return false;
        }
    }
    return i == s.size() && (has_fraction || has_exponent);
}

} // namespace

TomlValue parse_cli_value(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "true") {
        return TomlValue(true);
    }
    if (lower == "false") {
        return TomlValue(false);
    }

    std::string_view digits = text;
    if (!digits.empty() && digits.front() == '+') {
        digits.remove_prefix(1);
    }
    int64_t integer = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), integer);
    if (!digits.empty() && ec == std::errc() && ptr == digits.data() + digits.size() &&
        digits.front() != '+') {
        return TomlValue(integer);
    }

    if (looks_like_float(text)) {
        std::string buf(text);
        return TomlValue(std::strtod(buf.c_str(), nullptr));
    }

    return TomlValue(std::string(text));
}

} // namespace rustisan::config
