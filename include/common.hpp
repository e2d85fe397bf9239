//! # Common Definitions
//!
//! Version string, process-wide switches and the `Result` type shared by
//! every rustisan module.
//!
//! Errors are values: fallible operations return `Result<T, E>` and callers
//! test it with `is_ok` / `is_err` before unwrapping. Nothing in the CLI
//! throws across a module boundary.

#ifndef RUSTISAN_COMMON_HPP
#define RUSTISAN_COMMON_HPP

#include <memory>
#include <string>
#include <utility>
#include <variant>

namespace rustisan {

/// Reported by `rustisan --version` and `rustisan info`.
constexpr const char* VERSION = "0.1.1";

/// Marks a project root; every project command looks for it in the cwd.
constexpr const char* CONFIG_FILE_NAME = "rustisan.toml";

/// Switches read from the command line before dispatch.
struct GlobalOptions {
    /// `-q` / `--quiet`: skip banners and "next steps" hints.
    static inline bool quiet = false;
};

// ============================================================================
// Result
// ============================================================================

/// Success value or error.
///
/// ```cpp
/// auto doc = config::TomlDocument::parse(text);
/// if (is_err(doc)) {
///     return unwrap_err(doc);
/// }
/// const auto& root = unwrap(doc).root();
/// ```
///
/// `unwrap` only binds to lvalues; keep the result in a named variable.
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Throws `std::bad_variant_access` on an error; check `is_ok` first.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Ownership
// ============================================================================

/// Owning pointer for recursive values (TOML arrays and tables).
template <typename T> using Box = std::unique_ptr<T>;

template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

} // namespace rustisan

#endif // RUSTISAN_COMMON_HPP
