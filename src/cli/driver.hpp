//! # CLI Driver Interface
//!
//! `rustisan_main()` parses the command line and dispatches to the command
//! handler registered for its `verb[:noun]`.

#pragma once

#include "cli/command.hpp"

namespace rustisan::cli {

/// Registry holding every built-in command.
CommandRegistry build_registry();

} // namespace rustisan::cli

// Main CLI entry point
int rustisan_main(int argc, char* argv[]);
