//! # CLI Error Types
//!
//! Every failure a rustisan command can report is a `CliError` value that
//! travels back to the top level inside a `Result`. The top level logs it
//! once and maps it to the process exit code.
//!
//! ## Exit Codes
//!
//! | Kind                          | Exit code                       |
//! |-------------------------------|---------------------------------|
//! | `ParseError`, `UnknownCommand`| 2                               |
//! | `DelegatedFailure`            | child exit status (1 if absent) |
//! | everything else               | 1                               |
//!
//! ## Example
//!
//! ```cpp
//! if (fs::exists(path) && !force) {
//!     return CliError::make(ErrorKind::TargetExists, path.string() + " already exists");
//! }
//! ```

#pragma once

#include "common.hpp"

#include <string>

namespace rustisan::cli {

/// The closed set of failure categories.
enum class ErrorKind {
    ParseError,
    UnknownCommand,
    InvalidName,
    TargetExists,
    DestinationNotEmpty,
    KeyNotFound,
    TypeConflict,
    DelegatedFailure,
    NotAProject,
    UnknownTemplate,
    ConfigSyntax,
    IoError,
    ValidationFailed,
    Cancelled,
};

/// Returns a stable display name for an error kind (e.g. "TargetExistsError").
const char* error_kind_name(ErrorKind kind);

/// An error reported by a command.
struct CliError {
    /// Failure category.
    ErrorKind kind = ErrorKind::IoError;

    /// Human-readable description.
    std::string message;

    /// Exit status of the external tool for `DelegatedFailure` (-1 if unknown).
    int exit_status = -1;

    /// Creates an error of the given kind.
    static auto make(ErrorKind kind, std::string msg) -> CliError {
        return CliError{kind, std::move(msg), -1};
    }

    /// Creates a `DelegatedFailure` carrying the child's exit status.
    static auto delegated(std::string msg, int status) -> CliError {
        return CliError{ErrorKind::DelegatedFailure, std::move(msg), status};
    }

    /// Formats as "TargetExistsError: src/models/user.rs already exists".
    [[nodiscard]] auto to_string() const -> std::string;

    /// Process exit code for this error.
    [[nodiscard]] auto exit_code() const -> int;
};

/// Result of a command step with no payload.
using Status = Result<bool, CliError>;

/// Convenience success value for `Status`.
inline auto ok() -> Status {
    return true;
}

} // namespace rustisan::cli
