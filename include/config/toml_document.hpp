//! # TOML Document
//!
//! A TOML file held as its original lines plus the value tree parsed from
//! them. Edits are made to the lines, so everything the edit does not
//! address (comments, blank lines, key order, quoting style, spacing) is
//! written back byte for byte. After each edit the text is parsed again,
//! so the tree always matches what will be written.
//!
//! ## Supported TOML
//!
//! | Construct                         | Support                      |
//! |-----------------------------------|------------------------------|
//! | `[table]`, `[[array.of.tables]]`  | yes                          |
//! | dotted and quoted keys            | yes                          |
//! | basic and literal strings         | yes                          |
//! | multi-line strings                | rejected (`Syntax`)          |
//! | integers, floats, booleans        | yes (hex, octal, binary, `_`)|
//! | date/times                        | kept as written              |
//! | arrays (multi-line, comments)     | yes                          |
//! | inline tables                     | yes                          |
//!
//! ## Example
//!
//! ```cpp
//! auto doc = TomlDocument::parse(text);
//! if (is_ok(doc)) {
//!     auto& d = unwrap(doc);
//!     auto set = d.set({"app", "name"}, TomlValue("New App"));
//!     write_file(path, d.to_string());
//! }
//! ```

#pragma once

#include "config/toml_value.hpp"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace rustisan::config {

// ============================================================================
// Errors
// ============================================================================

/// Category of a document error.
enum class TomlErrorKind {
    Syntax,       ///< malformed or unsupported TOML
    KeyNotFound,  ///< no value at the key path
    TypeConflict, ///< a key path runs through a non-table value
};

/// An error from parsing or editing a TOML document.
struct TomlError {
    TomlErrorKind kind = TomlErrorKind::Syntax;

    /// Human-readable error description.
    std::string message;

    /// Line number where the error occurred (1-based, 0 if unknown).
    size_t line = 0;

    /// Creates a syntax error at a line.
    static auto syntax(std::string msg, size_t line = 0) -> TomlError {
        return TomlError{TomlErrorKind::Syntax, std::move(msg), line};
    }

    static auto not_found(std::string msg) -> TomlError {
        return TomlError{TomlErrorKind::KeyNotFound, std::move(msg), 0};
    }

    static auto type_conflict(std::string msg) -> TomlError {
        return TomlError{TomlErrorKind::TypeConflict, std::move(msg), 0};
    }

    /// "line 5: expected '='" or just the message when the line is unknown.
    [[nodiscard]] auto to_string() const -> std::string {
        if (line > 0) {
            return "line " + std::to_string(line) + ": " + message;
        }
        return message;
    }
};

// ============================================================================
// Document Model
// ============================================================================

/// Classification of a logical line.
enum class LineKind {
    Blank,
    Comment,
    Table,      ///< `[a.b]`
    ArrayTable, ///< `[[a.b]]`
    KeyValue,   ///< `key = value`, possibly spanning several physical lines
};

/// How a table came to exist.
enum class TableOrigin {
    Root,     ///< the document itself
    Header,   ///< declared by a `[table]` header
    Implicit, ///< created as the parent of a deeper header
    Dotted,   ///< created by a dotted key inside some section
    Inline,   ///< an inline table `{ ... }` or a table inside one
};

/// One logical line of the document.
struct TomlLine {
    LineKind kind = LineKind::Blank;

    /// Source text without the final newline. Multi-line arrays keep
    /// their inner newlines.
    std::string text;

    /// Header path for tables, the (relative) key path for key/values.
    std::vector<std::string> key;

    /// Byte span of the value inside `text` (key/value lines only).
    size_t value_begin = 0;
    size_t value_end = 0;

    /// Index of the header line owning this line, -1 for the root section.
    int section = -1;
};

/// What a key path resolves to.
enum class NodeKind { Value, Table, ArrayOfTables };

/// Where an addressable node was defined.
struct NodeInfo {
    NodeKind kind = NodeKind::Value;
    TableOrigin origin = TableOrigin::Root;

    /// Line that defined the node (header line or key/value line).
    int line = -1;

    /// Section the node belongs to, -1 for the root section.
    int section = -1;

    /// For nodes inside an inline table, the path of the outermost inline table.
    std::vector<std::string> inline_root;
};

/// A parsed TOML file that can be edited without disturbing its layout.
class TomlDocument {
public:
    TomlDocument() = default;

    /// Parses TOML text. Duplicate keys and multi-line strings are errors.
    static auto parse(std::string_view text) -> Result<TomlDocument, TomlError>;

    /// Splits a dotted key such as `database.connections."eu-1".host`.
    static auto split_key(std::string_view dotted) -> Result<std::vector<std::string>, TomlError>;

    /// The document's value tree.
    [[nodiscard]] auto root() const -> const TomlValue& {
        return root_;
    }

    /// Value at a key path, or nullptr. Paths through arrays never resolve.
    [[nodiscard]] auto get(const std::vector<std::string>& path) const -> const TomlValue*;

    /// Sets the value at a key path, creating missing tables.
    ///
    /// An existing value has only its value text replaced. A new key goes to
    /// the end of the section that owns its parent table; when that parent
    /// only exists implicitly, or several tables have to be created, a new
    /// `[table]` section is appended instead. Fails with `TypeConflict` when
    /// a segment of the path is a scalar, an array, or the target is a table.
    auto set(const std::vector<std::string>& path, const TomlValue& value)
        -> Result<bool, TomlError>;

    /// Source text, identical to the input when nothing was set.
    [[nodiscard]] auto to_string() const -> std::string;

    [[nodiscard]] auto lines() const -> const std::vector<TomlLine>& {
        return lines_;
    }

    /// Definition info for an addressable key path, or nullptr.
    [[nodiscard]] auto node(const std::vector<std::string>& path) const -> const NodeInfo*;

private:
    friend class TomlParser;

    std::vector<TomlLine> lines_;
    TomlValue root_;
    std::map<std::vector<std::string>, NodeInfo> index_;
    bool trailing_newline_ = true;

    void insert_in_section(int section, const std::string& text);
    void append_section(const std::vector<std::string>& header, const std::string& text);
    void replace_value_text(int line, const std::string& value_text);
    auto reload() -> Result<bool, TomlError>;
};

} // namespace rustisan::config
