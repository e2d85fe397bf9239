//! # TOML Document Implementation
//!
//! `TomlParser` walks the text once, recording every logical line with the
//! span of its value, and builds the value tree together with an index that
//! remembers where each addressable key and table was defined. The editing
//! operations of `TomlDocument` use that index to decide which line to
//! rewrite or where to insert a new one.

#include "config/toml_document.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <optional>

namespace rustisan::config {

// ============================================================================
// TomlParser
// ============================================================================

class TomlParser {
public:
    explicit TomlParser(std::string_view content) : content_(content) {}

    auto parse() -> Result<TomlDocument, TomlError>;

    auto parse_key_only() -> Result<std::vector<std::string>, TomlError>;

private:
    std::string_view content_;
    size_t pos_ = 0;
    size_t line_ = 1;
    std::optional<TomlError> error_;

    TomlDocument doc_;

    // Current section state
    TomlValue* current_ = nullptr;
    std::vector<std::string> current_path_;
    bool addressable_ = true;
    int section_ = -1;

    // Character helpers
    bool is_eof() const {
        return pos_ >= content_.size();
    }
    char peek(size_t ahead = 0) const {
        return pos_ + ahead < content_.size() ? content_[pos_ + ahead] : '\0';
    }
    char advance() {
        char c = content_[pos_++];
        if (c == '\n') {
            ++line_;
        }
        return c;
    }
    bool at_line_end() const {
        return is_eof() || peek() == '\n' || (peek() == '\r' && peek(1) == '\n');
    }

    void skip_whitespace();
    void skip_comment();
    void skip_array_space();
    bool finish_line();

    void set_error(const std::string& message) {
        if (!error_) {
            error_ = TomlError::syntax(message, line_);
        }
    }

    // Grammar
    std::optional<std::string> parse_simple_key();
    std::optional<std::vector<std::string>> parse_key_path();
    std::optional<std::string> parse_basic_string();
    std::optional<std::string> parse_literal_string();
    std::optional<TomlValue> parse_value();
    std::optional<TomlValue> parse_array();
    std::optional<TomlValue> parse_inline_table();
    std::optional<TomlValue> parse_scalar_token();

    bool insert_dotted(TomlTable& table, const std::vector<std::string>& key, TomlValue value);

    // Tree building
    bool open_table(const std::vector<std::string>& path, bool array, int line_index);
    bool add_key_value(const std::vector<std::string>& key, TomlValue value, int line_index);
    void index_inline(const std::vector<std::string>& path, const TomlValue& value,
                      const std::vector<std::string>& inline_root, int line_index);
    TomlValue* descend(TomlValue* table, const std::vector<std::string>& prefix,
                       const std::string& segment, TableOrigin create_as, int line_index,
                       bool& addressable);
};

void TomlParser::skip_whitespace() {
    while (!is_eof() && (peek() == ' ' || peek() == '\t')) {
        advance();
    }
}

void TomlParser::skip_comment() {
    if (peek() == '#') {
        while (!is_eof() && peek() != '\n') {
            advance();
        }
    }
}

void TomlParser::skip_array_space() {
    for (;;) {
        skip_whitespace();
        if (peek() == '#') {
            skip_comment();
        } else if (peek() == '\n') {
            advance();
        } else if (peek() == '\r' && peek(1) == '\n') {
            advance();
            advance();
        } else {
            return;
        }
    }
}

bool TomlParser::finish_line() {
    skip_whitespace();
    skip_comment();
    if (peek() == '\r' && peek(1) == '\n') {
        // The '\r' stays part of the line text
        return true;
    }
    if (!at_line_end()) {
        set_error(std::string("unexpected character '") + peek() + "'");
        return false;
    }
    return true;
}

// ============================================================================
// Keys and Strings
// ============================================================================

std::optional<std::string> TomlParser::parse_simple_key() {
    char c = peek();
    if (c == '"') {
        return parse_basic_string();
    }
    if (c == '\'') {
        return parse_literal_string();
    }

    size_t start = pos_;
    while (!is_eof()) {
        unsigned char ch = static_cast<unsigned char>(peek());
        if (std::isalnum(ch) || ch == '_' || ch == '-') {
            advance();
        } else {
            break;
        }
    }
    if (pos_ == start) {
        set_error("expected a key");
        return std::nullopt;
    }
    return std::string(content_.substr(start, pos_ - start));
}

std::optional<std::vector<std::string>> TomlParser::parse_key_path() {
    std::vector<std::string> path;
    for (;;) {
        skip_whitespace();
        auto key = parse_simple_key();
        if (!key) {
            return std::nullopt;
        }
        path.push_back(std::move(*key));
        skip_whitespace();
        if (peek() != '.') {
            return path;
        }
        advance();
    }
}

std::optional<std::string> TomlParser::parse_basic_string() {
    if (peek(1) == '"' && peek(2) == '"') {
        set_error("multi-line strings are not supported");
        return std::nullopt;
    }
    advance(); // opening quote

    std::string result;
    while (!is_eof() && peek() != '"') {
        char c = advance();
        if (c == '\n') {
            set_error("unterminated string");
            return std::nullopt;
        }
        if (c != '\\') {
            result += c;
            continue;
        }
        if (is_eof()) {
            break;
        }
        char esc = advance();
        switch (esc) {
        case '"':
            result += '"';
            break;
        case '\\':
            result += '\\';
            break;
        case 'n':
            result += '\n';
            break;
        case 't':
            result += '\t';
            break;
        case 'r':
            result += '\r';
            break;
        case 'b':
            result += '\b';
            break;
        case 'f':
            result += '\f';
            break;
        case 'u':
        case 'U': {
            size_t len = esc == 'u' ? 4 : 8;
            if (pos_ + len > content_.size()) {
                set_error("truncated unicode escape");
                return std::nullopt;
            }
            uint32_t cp = 0;
            auto hex = content_.substr(pos_, len);
            auto [ptr, ec] = std::from_chars(hex.data(), hex.data() + len, cp, 16);
            if (ec != std::errc() || ptr != hex.data() + len || cp > 0x10FFFF ||
                (cp >= 0xD800 && cp <= 0xDFFF)) {
                set_error("invalid unicode escape");
                return std::nullopt;
            }
            pos_ += len;
            // UTF-8 encode
            if (cp < 0x80) {
                result += static_cast<char>(cp);
            } else if (cp < 0x800) {
                result += static_cast<char>(0xC0 | (cp >> 6));
                result += static_cast<char>(0x80 | (cp & 0x3F));
            } else if (cp < 0x10000) {
                result += static_cast<char>(0xE0 | (cp >> 12));
                result += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
                result += static_cast<char>(0x80 | (cp & 0x3F));
            } else {
                result += static_cast<char>(0xF0 | (cp >> 18));
                result += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
                result += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
                result += static_cast<char>(0x80 | (cp & 0x3F));
            }
            break;
        }
        default:
            set_error(std::string("invalid escape '\\") + esc + "'");
            return std::nullopt;
        }
    }
    if (is_eof()) {
        set_error("unterminated string");
        return std::nullopt;
    }
    advance(); // closing quote
    return result;
}

std::optional<std::string> TomlParser::parse_literal_string() {
    if (peek(1) == '\'' && peek(2) == '\'') {
        set_error("multi-line strings are not supported");
        return std::nullopt;
    }
    advance();
    size_t start = pos_;
    while (!is_eof() && peek() != '\'' && peek() != '\n') {
        advance();
    }
    if (peek() != '\'') {
        set_error("unterminated string");
        return std::nullopt;
    }
    std::string result(content_.substr(start, pos_ - start));
    advance();
    return result;
}

// ============================================================================
// Values
// ============================================================================

std::optional<TomlValue> TomlParser::parse_value() {
    char c = peek();
    if (c == '"') {
        auto s = parse_basic_string();
        if (!s) {
            return std::nullopt;
        }
        return TomlValue(std::move(*s));
    }
    if (c == '\'') {
        auto s = parse_literal_string();
        if (!s) {
            return std::nullopt;
        }
        return TomlValue(std::move(*s));
    }
    if (c == '[') {
        return parse_array();
    }
    if (c == '{') {
        return parse_inline_table();
    }
    return parse_scalar_token();
}

std::optional<TomlValue> TomlParser::parse_array() {
    advance(); // '['
    TomlArray items;
    for (;;) {
        skip_array_space();
        if (is_eof()) {
            set_error("unterminated array");
            return std::nullopt;
        }
        if (peek() == ']') {
            advance();
            return TomlValue(std::move(items));
        }
        auto item = parse_value();
        if (!item) {
            return std::nullopt;
        }
        items.push_back(std::move(*item));
        skip_array_space();
        if (peek() == ',') {
            advance();
        } else if (peek() != ']') {
            set_error("expected ',' or ']' in array");
            return std::nullopt;
        }
    }
}

bool TomlParser::insert_dotted(TomlTable& table, const std::vector<std::string>& key,
                               TomlValue value) {
    TomlTable* current = &table;
    for (size_t i = 0; i + 1 < key.size(); ++i) {
        auto it = current->find(key[i]);
        if (it == current->end()) {
            it = current->emplace(key[i], TomlValue()).first;
        } else if (!it->second.is_table()) {
            set_error("key '" + key[i] + "' is not a table");
            return false;
        }
        current = &it->second.as_table_mut();
    }
    if (current->count(key.back())) {
        set_error("duplicate key '" + format_key_path(key) + "'");
        return false;
    }
    current->emplace(key.back(), std::move(value));
    return true;
}

std::optional<TomlValue> TomlParser::parse_inline_table() {
    advance(); // '{'
    TomlTable table;
    skip_whitespace();
    if (peek() == '}') {
        advance();
        return TomlValue(std::move(table));
    }
    for (;;) {
        auto key = parse_key_path();
        if (!key) {
            return std::nullopt;
        }
        skip_whitespace();
        if (peek() != '=') {
            set_error("expected '=' in inline table");
            return std::nullopt;
        }
        advance();
        skip_whitespace();
        auto value = parse_value();
        if (!value) {
            return std::nullopt;
        }
        if (!insert_dotted(table, *key, std::move(*value))) {
            return std::nullopt;
        }
        skip_whitespace();
        if (peek() == ',') {
            advance();
            skip_whitespace();
            continue;
        }
        if (peek() == '}') {
            advance();
            return TomlValue(std::move(table));
        }
        set_error("expected ',' or '}' in inline table");
        return std::nullopt;
    }
}

namespace {

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

/// `YYYY-MM-DD` or `HH:MM` at the start of a token.
bool looks_like_datetime(std::string_view token) {
    if (token.size() >= 10 && is_digit(token[0]) && is_digit(token[1]) && is_digit(token[2]) &&
        is_digit(token[3]) && token[4] == '-') {
        return true;
    }
    return token.size() >= 5 && is_digit(token[0]) && is_digit(token[1]) && token[2] == ':';
}

std::string strip_underscores(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c != '_') {
            out += c;
        }
    }
    return out;
}

} // namespace

std::optional<TomlValue> TomlParser::parse_scalar_token() {
    size_t start = pos_;
    while (!is_eof()) {
        unsigned char c = static_cast<unsigned char>(peek());
        if (std::isalnum(c) || c == '_' || c == '+' || c == '-' || c == '.' || c == ':') {
            advance();
        } else if (c == ' ' && pos_ - start == 10 && looks_like_datetime(content_.substr(start)) &&
                   is_digit(peek(1)) && is_digit(peek(2)) && peek(3) == ':') {
            // "1979-05-27 07:32:00" uses a space as the date/time separator
            advance();
        } else {
            break;
        }
    }
    std::string_view token = content_.substr(start, pos_ - start);
    if (token.empty()) {
        set_error("expected a value");
        return std::nullopt;
    }

    if (token == "true") {
        return TomlValue(true);
    }
    if (token == "false") {
        return TomlValue(false);
    }
    if (token == "inf" || token == "+inf") {
        return TomlValue(std::numeric_limits<double>::infinity());
    }
    if (token == "-inf") {
        return TomlValue(-std::numeric_limits<double>::infinity());
    }
    if (token == "nan" || token == "+nan" || token == "-nan") {
        return TomlValue(std::numeric_limits<double>::quiet_NaN());
    }
    if (looks_like_datetime(token)) {
        return TomlValue(TomlDatetime{std::string(token)});
    }

    std::string digits = strip_underscores(token);

    // Prefixed integers
    if (digits.size() > 2 && digits[0] == '0' &&
        (digits[1] == 'x' || digits[1] == 'o' || digits[1] == 'b')) {
        int base = digits[1] == 'x' ? 16 : (digits[1] == 'o' ? 8 : 2);
        int64_t value = 0;
        auto [ptr, ec] =
            std::from_chars(digits.data() + 2, digits.data() + digits.size(), value, base);
        if (ec == std::errc() && ptr == digits.data() + digits.size()) {
            return TomlValue(value);
        }
        set_error("invalid integer '" + std::string(token) + "'");
        return std::nullopt;
    }

    bool is_float = digits.find_first_of(".eE") != std::string::npos;
    const char* begin = digits.data();
    const char* end = digits.data() + digits.size();
    if (!digits.empty() && digits[0] == '+') {
        ++begin;
    }

    if (is_float) {
        char* parse_end = nullptr;
        double value = std::strtod(digits.c_str(), &parse_end);
        if (parse_end == digits.c_str() + digits.size() && is_digit(*begin == '-' ? begin[1] : *begin)) {
            return TomlValue(value);
        }
    } else {
        int64_t value = 0;
        auto [ptr, ec] = std::from_chars(begin, end, value);
        if (ec == std::errc() && ptr == end) {
            return TomlValue(value);
        }
    }

    set_error("invalid value '" + std::string(token) + "'");
    return std::nullopt;
}

// ============================================================================
// Tree Building
// ============================================================================

TomlValue* TomlParser::descend(TomlValue* table, const std::vector<std::string>& prefix,
                               const std::string& segment, TableOrigin create_as,
                               int line_index, bool& addressable) {
    TomlValue* child = table->get_mut(segment);
    if (!child) {
        child = &table->as_table_mut().emplace(segment, TomlValue()).first->second;
        if (addressable) {
            doc_.index_[prefix] = NodeInfo{NodeKind::Table, create_as, line_index, section_, {}};
        }
        return child;
    }

    if (child->is_table()) {
        if (addressable) {
            auto it = doc_.index_.find(prefix);
            if (it != doc_.index_.end() && it->second.origin == TableOrigin::Inline) {
                set_error("inline table '" + format_key_path(prefix) + "' cannot be extended");
                return nullptr;
            }
        }
        return child;
    }

    if (child->is_array() && !child->as_array().empty() && child->as_array().back().is_table()) {
        bool array_of_tables = true;
        if (addressable) {
            auto it = doc_.index_.find(prefix);
            array_of_tables = it != doc_.index_.end() && it->second.kind == NodeKind::ArrayOfTables;
        }
        if (array_of_tables) {
            // Keys below an array of tables address its last element
            addressable = false;
            return &child->as_array_mut().back();
        }
    }

    set_error("key '" + format_key_path(prefix) + "' is already defined as " +
              child->type_name());
    return nullptr;
}

bool TomlParser::open_table(const std::vector<std::string>& path, bool array, int line_index) {
    TomlValue* table = &doc_.root_;
    bool addressable = true;
    std::vector<std::string> prefix;

    section_ = line_index;
    for (size_t i = 0; i + 1 < path.size(); ++i) {
        prefix.push_back(path[i]);
        table = descend(table, prefix, path[i], TableOrigin::Implicit, line_index, addressable);
        if (!table) {
            return false;
        }
    }

    const std::string& last = path.back();
    TomlValue* child = table->get_mut(last);

    if (array) {
        if (!child) {
            child = &table->as_table_mut().emplace(last, TomlValue(TomlArray{})).first->second;
            if (addressable) {
                doc_.index_[path] =
                    NodeInfo{NodeKind::ArrayOfTables, TableOrigin::Header, line_index, line_index, {}};
            }
        } else {
            bool ok = child->is_array();
            if (ok && addressable) {
                auto it = doc_.index_.find(path);
                ok = it != doc_.index_.end() && it->second.kind == NodeKind::ArrayOfTables;
            }
            if (!ok) {
                set_error("key '" + format_key_path(path) + "' is not an array of tables");
                return false;
            }
        }
        child->as_array_mut().push_back(TomlValue());
        current_ = &child->as_array_mut().back();
        addressable_ = false;
        current_path_ = path;
        return true;
    }

    if (!child) {
        child = &table->as_table_mut().emplace(last, TomlValue()).first->second;
        if (addressable) {
            doc_.index_[path] = NodeInfo{NodeKind::Table, TableOrigin::Header, line_index, line_index, {}};
        }
    } else if (child->is_table()) {
        if (addressable) {
            auto& info = doc_.index_[path];
            if (info.origin != TableOrigin::Implicit) {
                set_error("table [" + format_key_path(path) + "] is defined more than once");
                return false;
            }
            info.origin = TableOrigin::Header;
            info.line = line_index;
            info.section = line_index;
        }
    } else {
        set_error("key '" + format_key_path(path) + "' is already defined as " +
                  child->type_name());
        return false;
    }

    current_ = child;
    addressable_ = addressable;
    current_path_ = path;
    return true;
}

void TomlParser::index_inline(const std::vector<std::string>& path, const TomlValue& value,
                              const std::vector<std::string>& inline_root, int line_index) {
    if (!value.is_table()) {
        doc_.index_[path] =
            NodeInfo{NodeKind::Value, TableOrigin::Inline, line_index, section_, inline_root};
        return;
    }
    doc_.index_[path] =
        NodeInfo{NodeKind::Table, TableOrigin::Inline, line_index, section_, inline_root};
    for (const auto& [key, child] : value.as_table()) {
        auto child_path = path;
        child_path.push_back(key);
        index_inline(child_path, child, inline_root, line_index);
    }
}

bool TomlParser::add_key_value(const std::vector<std::string>& key, TomlValue value,
                               int line_index) {
    TomlValue* table = current_;
    bool addressable = addressable_;
    std::vector<std::string> full = current_path_;

    for (size_t i = 0; i + 1 < key.size(); ++i) {
        full.push_back(key[i]);
        table = descend(table, full, key[i], TableOrigin::Dotted, line_index, addressable);
        if (!table) {
            return false;
        }
    }

    full.push_back(key.back());
    if (table->get(key.back())) {
        set_error("duplicate key '" + format_key_path(full) + "'");
        return false;
    }

    if (addressable) {
        if (value.is_table()) {
            index_inline(full, value, full, line_index);
        } else {
            doc_.index_[full] =
                NodeInfo{NodeKind::Value, TableOrigin::Root, line_index, section_, {}};
        }
    }
    table->as_table_mut().emplace(key.back(), std::move(value));
    return true;
}

// ============================================================================
// Entry Points
// ============================================================================

auto TomlParser::parse() -> Result<TomlDocument, TomlError> {
    current_ = &doc_.root_;
    doc_.index_[std::vector<std::string>{}] = NodeInfo{NodeKind::Table, TableOrigin::Root, -1, -1, {}};
    doc_.trailing_newline_ = content_.empty() || content_.back() == '\n';

    while (!is_eof() && !error_) {
        size_t start = pos_;
        int line_index = static_cast<int>(doc_.lines_.size());
        TomlLine line;
        line.section = section_;

        skip_whitespace();
        if (at_line_end() || (peek() == '\r' && peek(1) == '\n')) {
            line.kind = LineKind::Blank;
        } else if (peek() == '#') {
            line.kind = LineKind::Comment;
            skip_comment();
        } else if (peek() == '[') {
            bool array = peek(1) == '[';
            advance();
            if (array) {
                advance();
            }
            auto path = parse_key_path();
            if (!path) {
                break;
            }
            skip_whitespace();
            if (peek() != ']' || (array && peek(1) != ']')) {
                set_error(array ? "expected ']]'" : "expected ']'");
                break;
            }
            advance();
            if (array) {
                advance();
            }
            if (!finish_line()) {
                break;
            }
            line.kind = array ? LineKind::ArrayTable : LineKind::Table;
            line.key = *path;
            if (!open_table(*path, array, line_index)) {
                break;
            }
            line.section = line_index;
        } else {
            auto key = parse_key_path();
            if (!key) {
                break;
            }
            skip_whitespace();
            if (peek() != '=') {
                set_error("expected '=' after key '" + format_key_path(*key) + "'");
                break;
            }
            advance();
            skip_whitespace();
            if (at_line_end()) {
                set_error("missing value for key '" + format_key_path(*key) + "'");
                break;
            }
            line.value_begin = pos_ - start;
            auto value = parse_value();
            if (!value) {
                break;
            }
            line.value_end = pos_ - start;
            if (!finish_line()) {
                break;
            }
            line.kind = LineKind::KeyValue;
            line.key = *key;
            if (!add_key_value(*key, std::move(*value), line_index)) {
                break;
            }
        }

        // Consume the rest of the physical line, keeping any '\r'
        while (!is_eof() && peek() != '\n') {
            advance();
        }
        line.text = std::string(content_.substr(start, pos_ - start));
        doc_.lines_.push_back(std::move(line));
        if (!is_eof()) {
            advance(); // '\n'
        }
    }

    if (error_) {
        return *error_;
    }
    return std::move(doc_);
}

auto TomlParser::parse_key_only() -> Result<std::vector<std::string>, TomlError> {
    auto path = parse_key_path();
    if (path && !is_eof()) {
        set_error(std::string("unexpected character '") + peek() + "' in key");
    }
    if (error_ || !path) {
        return TomlError::syntax("invalid key: " + (error_ ? error_->message : std::string()));
    }
    return *path;
}

// ============================================================================
// TomlDocument
// ============================================================================

auto TomlDocument::parse(std::string_view text) -> Result<TomlDocument, TomlError> {
    TomlParser parser(text);
    return parser.parse();
}

auto TomlDocument::split_key(std::string_view dotted)
    -> Result<std::vector<std::string>, TomlError> {
    TomlParser parser(dotted);
    return parser.parse_key_only();
}

auto TomlDocument::get(const std::vector<std::string>& path) const -> const TomlValue* {
    return root_.find(path);
}

auto TomlDocument::node(const std::vector<std::string>& path) const -> const NodeInfo* {
    auto it = index_.find(path);
    return it == index_.end() ? nullptr : &it->second;
}

auto TomlDocument::to_string() const -> std::string {
    std::string out;
    for (size_t i = 0; i < lines_.size(); ++i) {
        if (i > 0) {
            out += '\n';
        }
        out += lines_[i].text;
    }
    if (trailing_newline_ && !lines_.empty()) {
        out += '\n';
    }
    return out;
}

void TomlDocument::replace_value_text(int line, const std::string& value_text) {
    auto& l = lines_[static_cast<size_t>(line)];
    l.text.replace(l.value_begin, l.value_end - l.value_begin, value_text);
}

void TomlDocument::insert_in_section(int section, const std::string& text) {
    TomlLine line;
    line.kind = LineKind::KeyValue;
    line.text = text;

    // After the section's last key/value line
    int last_kv = -1;
    size_t first_header = lines_.size();
    for (size_t i = 0; i < lines_.size(); ++i) {
        const auto& l = lines_[i];
        if ((l.kind == LineKind::Table || l.kind == LineKind::ArrayTable) && first_header == lines_.size()) {
            first_header = i;
        }
        if (l.kind == LineKind::KeyValue && l.section == section) {
            last_kv = static_cast<int>(i);
        }
    }

    size_t pos;
    if (last_kv >= 0) {
        pos = static_cast<size_t>(last_kv) + 1;
    } else if (section >= 0) {
        pos = static_cast<size_t>(section) + 1;
    } else if (first_header == lines_.size()) {
        pos = lines_.size();
    } else {
        // Empty root section: above the first header and its leading comments
        pos = first_header;
        while (pos > 0 && lines_[pos - 1].kind == LineKind::Comment) {
            --pos;
        }
        lines_.insert(lines_.begin() + static_cast<std::ptrdiff_t>(pos), TomlLine{});
    }
    lines_.insert(lines_.begin() + static_cast<std::ptrdiff_t>(pos), std::move(line));
}

void TomlDocument::append_section(const std::vector<std::string>& header,
                                  const std::string& text) {
    if (!lines_.empty() && lines_.back().kind != LineKind::Blank) {
        lines_.push_back(TomlLine{});
    }
    TomlLine head;
    head.kind = LineKind::Table;
    head.text = "[" + format_key_path(header) + "]";
    lines_.push_back(std::move(head));

    TomlLine line;
    line.kind = LineKind::KeyValue;
    line.text = text;
    lines_.push_back(std::move(line));
    trailing_newline_ = true;
}

auto TomlDocument::reload() -> Result<bool, TomlError> {
    auto parsed = parse(to_string());
    if (is_err(parsed)) {
        return unwrap_err(parsed);
    }
    *this = std::move(unwrap(parsed));
    return true;
}

auto TomlDocument::set(const std::vector<std::string>& path, const TomlValue& value)
    -> Result<bool, TomlError> {
    if (path.empty()) {
        return TomlError::syntax("empty key");
    }

    // Every existing parent must be a plain table
    size_t existing = 0;
    for (size_t i = 1; i < path.size(); ++i) {
        std::vector<std::string> prefix(path.begin(), path.begin() + static_cast<std::ptrdiff_t>(i));
        auto it = index_.find(prefix);
        if (it == index_.end()) {
            break;
        }
        if (it->second.kind != NodeKind::Table) {
            const TomlValue* v = root_.find(prefix);
            std::string what = it->second.kind == NodeKind::ArrayOfTables
                                   ? "an array of tables"
                                   : std::string("a ") + (v ? v->type_name() : "value");
            return TomlError::type_conflict("'" + format_key_path(prefix) + "' is " + what +
                                            ", not a table");
        }
        existing = i;
    }

    auto target = index_.find(path);
    if (target != index_.end()) {
        const NodeInfo& info = target->second;
        if (info.kind == NodeKind::ArrayOfTables) {
            return TomlError::type_conflict("'" + format_key_path(path) +
                                            "' is an array of tables");
        }
        if (info.kind == NodeKind::Table) {
            return TomlError::type_conflict("'" + format_key_path(path) +
                                            "' is a table; set one of its keys instead");
        }
        if (info.inline_root.empty()) {
            replace_value_text(info.line, value.to_toml());
        } else {
            TomlValue inline_copy = root_.find(info.inline_root)->clone();
            TomlValue* slot = &inline_copy;
            for (size_t i = info.inline_root.size(); i < path.size(); ++i) {
                slot = slot->get_mut(path[i]);
            }
            *slot = value.clone();
            replace_value_text(info.line, inline_copy.to_toml());
        }
        return reload();
    }

    std::vector<std::string> parent(path.begin(), path.begin() + static_cast<std::ptrdiff_t>(existing));
    std::vector<std::string> rest(path.begin() + static_cast<std::ptrdiff_t>(existing), path.end());
    const NodeInfo& owner = index_.at(parent);
    std::string assignment = " = " + value.to_toml();

    switch (owner.origin) {
    case TableOrigin::Inline: {
        TomlValue inline_copy = root_.find(owner.inline_root)->clone();
        TomlValue* slot = &inline_copy;
        for (size_t i = owner.inline_root.size(); i < parent.size(); ++i) {
            slot = slot->get_mut(path[i]);
        }
        for (size_t i = 0; i + 1 < rest.size(); ++i) {
            slot = &slot->as_table_mut().emplace(rest[i], TomlValue()).first->second;
        }
        slot->as_table_mut().emplace(rest.back(), value.clone());
        replace_value_text(owner.line, inline_copy.to_toml());
        break;
    }
    case TableOrigin::Dotted: {
        size_t depth = owner.section >= 0 ? lines_[static_cast<size_t>(owner.section)].key.size() : 0;
        std::vector<std::string> relative(path.begin() + static_cast<std::ptrdiff_t>(depth), path.end());
        insert_in_section(owner.section, format_key_path(relative) + assignment);
        break;
    }
    case TableOrigin::Root:
    case TableOrigin::Header:
        if (rest.size() == 1) {
            insert_in_section(owner.origin == TableOrigin::Root ? -1 : owner.line,
                              format_key(rest.back()) + assignment);
            break;
        }
        [[fallthrough]];
    case TableOrigin::Implicit: {
        std::vector<std::string> header(path.begin(), path.end() - 1);
        append_section(header, format_key(path.back()) + assignment);
        break;
    }
    }

    return reload();
}

} // namespace rustisan::config
