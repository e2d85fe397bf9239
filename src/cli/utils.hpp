//! # CLI Utilities Interface
//!
//! This header defines shared utility functions for the CLI.
//!
//! ## Functions
//!
//! | Function              | Description                          |
//! |-----------------------|--------------------------------------|
//! | `to_forward_slashes()`| Convert backslashes to forward       |
//! | `read_file()`         | Read entire file to string           |
//! | `write_file()`        | Write a file, creating parent dirs   |
//! | `print_usage()`       | Print CLI help text                  |
//! | `print_version()`     | Print CLI version                    |

#pragma once

#include "cli/error.hpp"

#include <filesystem>
#include <ostream>
#include <string>
#include <string_view>

namespace rustisan::cli {

class CommandRegistry;

// Path utilities
std::string to_forward_slashes(const std::string& path);

/// Path relative to `base` with forward slashes, for log messages.
std::string display_path(const std::filesystem::path& path, const std::filesystem::path& base);

// File I/O
Result<std::string, CliError> read_file(const std::filesystem::path& path);
Status write_file(const std::filesystem::path& path, std::string_view content);

// Help text
void print_usage(const CommandRegistry& registry, std::ostream& out);
void print_version(std::ostream& out);

} // namespace rustisan::cli
