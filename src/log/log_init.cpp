//! # Logging Options
//!
//! Builds a `LogConfig` from the command line and `RUSTISAN_LOG`.
//!
//! | Option               | Effect                                  |
//! |----------------------|-----------------------------------------|
//! | `-v`, `--verbose`    | debug                                   |
//! | `-vv`                | trace                                   |
//! | `-vvv`               | trace, console lines carry the time     |
//! | `-q`, `--quiet`      | errors only                             |
//! | `--log-level=L`      | explicit level                          |
//! | `--log-filter=SPEC`  | per-module levels, `make=debug,warn`    |
//! | `--log-file=PATH`    | also append to PATH                     |
//! | `--log-format=json`  | JSON lines on every sink                |

#include "log/log.hpp"

#include <algorithm>
#include <cstdlib>

namespace rustisan::log {

namespace {

constexpr std::string_view LEVEL_OPT = "--log-level=";
constexpr std::string_view FILTER_OPT = "--log-filter=";
constexpr std::string_view FILE_OPT = "--log-file=";
constexpr std::string_view FORMAT_OPT = "--log-format=";

/// Number of `v`s in "-v", "-vv", "-vvv"; 0 for anything else.
size_t verbosity(std::string_view arg) {
    if (arg.size() < 2 || arg[0] != '-') {
        return 0;
    }
    auto flags = arg.substr(1);
    return flags.find_first_not_of('v') == std::string_view::npos ? flags.size() : 0;
}

} // namespace

bool is_log_option(std::string_view arg) {
    for (auto prefix : {LEVEL_OPT, FILTER_OPT, FILE_OPT, FORMAT_OPT}) {
        if (arg.starts_with(prefix)) {
            return true;
        }
    }
    return arg == "-q" || arg == "--quiet" || arg == "--verbose" || verbosity(arg) > 0;
}

LogConfig parse_log_options(int argc, char* argv[]) {
    LogConfig config;
    std::optional<LogLevel> explicit_level;
    size_t verbose = 0;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "--") {
            break;
        }
        if (arg.starts_with(LEVEL_OPT)) {
            explicit_level = parse_level(arg.substr(LEVEL_OPT.size())).value_or(LogLevel::Info);
        } else if (arg.starts_with(FILTER_OPT)) {
            config.filter_spec = std::string(arg.substr(FILTER_OPT.size()));
        } else if (arg.starts_with(FILE_OPT)) {
            config.log_file = std::string(arg.substr(FILE_OPT.size()));
        } else if (arg.starts_with(FORMAT_OPT)) {
            config.format =
                arg.substr(FORMAT_OPT.size()) == "json" ? LogFormat::JSON : LogFormat::Text;
        } else if (arg == "-q" || arg == "--quiet") {
            explicit_level = LogLevel::Error;
        } else if (arg == "--verbose") {
            verbose = std::max<size_t>(verbose, 1);
        } else {
            verbose = std::max(verbose, verbosity(arg));
        }
    }

    if (explicit_level) {
        config.level = *explicit_level;
    } else if (verbose > 0) {
        config.level = verbose >= 2 ? LogLevel::Trace : LogLevel::Debug;
        config.timestamps = verbose >= 3;
    } else if (config.filter_spec.empty()) {
        if (const char* env = std::getenv("RUSTISAN_LOG"); env && *env) {
            config.filter_spec = env;
        }
    }
    return config;
}

} // namespace rustisan::log
