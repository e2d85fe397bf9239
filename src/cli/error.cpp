//! # CLI Errors
//!
//! Display names and exit-code mapping for `CliError`.

#include "cli/error.hpp"

namespace rustisan::cli {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::ParseError:
        return "ParseError";
    case ErrorKind::UnknownCommand:
        return "UnknownCommand";
    case ErrorKind::InvalidName:
        return "InvalidNameError";
    case ErrorKind::TargetExists:
        return "TargetExistsError";
    case ErrorKind::DestinationNotEmpty:
        return "DestinationNotEmptyError";
    case ErrorKind::KeyNotFound:
        return "KeyNotFoundError";
    case ErrorKind::TypeConflict:
        return "TypeConflictError";
    case ErrorKind::DelegatedFailure:
        return "DelegatedFailure";
    case ErrorKind::NotAProject:
        return "NotAProject";
    case ErrorKind::UnknownTemplate:
        return "UnknownTemplate";
    case ErrorKind::ConfigSyntax:
        return "ConfigSyntax";
    case ErrorKind::IoError:
        return "IoError";
    case ErrorKind::ValidationFailed:
        return "ValidationFailed";
    case ErrorKind::Cancelled:
        return "Cancelled";
    }
    return "Error";
}

auto CliError::to_string() const -> std::string {
    std::string result = error_kind_name(kind);
    if (!message.empty()) {
        result += ": ";
        result += message;
    }
    return result;
}

auto CliError::exit_code() const -> int {
    switch (kind) {
    case ErrorKind::ParseError:
    case ErrorKind::UnknownCommand:
        return 2;
    case ErrorKind::DelegatedFailure:
        return exit_status > 0 ? exit_status : 1;
    default:
        return 1;
    }
}

} // namespace rustisan::cli
