//! # rustisan Entry Point
//!
//! The `main()` function only forwards to the CLI driver
//! (`cli/driver.hpp`), which parses arguments, configures logging and
//! dispatches to the command handlers.
//!
//! ## Usage
//!
//! ```bash
//! rustisan new blog
//! rustisan make:controller PostController --resource
//! rustisan migrate
//! rustisan serve --port 8080
//! ```

#include "cli/driver.hpp"

/// Main entry point for the rustisan CLI.
///
/// @return Exit code: 0 for success, non-zero for errors
int main(int argc, char* argv[]) {
    return rustisan_main(argc, argv);
}
