//! # Command Descriptors and Registry
//!
//! A rustisan command line has the shape `verb[:noun] [args...] [--flags]`.
//! `CommandRegistry` owns the table of known `(verb, noun)` pairs together
//! with the arguments and flags each accepts. It turns raw tokens into an
//! immutable `CommandDescriptor` and routes that descriptor to the handler
//! registered for it.
//!
//! ## Flag Grammar
//!
//! | Form              | Meaning                                      |
//! |-------------------|----------------------------------------------|
//! | `--name`          | boolean flag set to true                     |
//! | `--name=value`    | value flag, or `true`/`false` for a boolean  |
//! | `--name value`    | value flag                                   |
//! | `-x`, `-x value`  | single-letter alias                          |
//! | `--`              | everything after is positional               |
//!
//! Logging options (`-v`, `-q`, `--log-level=...`) are consumed by the
//! logger and skipped here.

#pragma once

#include "cli/error.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace rustisan::cli {

struct CommandContext;

/// Value type accepted by a flag.
enum class FlagType {
    Bool,   ///< `--name` or `--name=true|false`
    String, ///< free text
    Int,    ///< non-negative integer literal
};

/// Declaration of a named flag.
struct FlagSpec {
    std::string name;          ///< long name without dashes
    char short_name = 0;       ///< single-letter alias, 0 if none
    FlagType type = FlagType::Bool;
    std::string default_value; ///< applied when the flag is absent
    std::string help;
};

/// Declaration of a positional argument.
struct ArgSpec {
    std::string name;
    bool required = true;
    std::string help;
};

/// A parsed command line. Immutable once produced by the registry.
class CommandDescriptor {
public:
    CommandDescriptor() = default;
    CommandDescriptor(std::string verb, std::optional<std::string> noun,
                      std::vector<std::string> args, std::map<std::string, std::string> flags)
        : verb_(std::move(verb)), noun_(std::move(noun)), args_(std::move(args)),
          flags_(std::move(flags)) {}

    const std::string& verb() const {
        return verb_;
    }
    const std::optional<std::string>& noun() const {
        return noun_;
    }
    const std::vector<std::string>& args() const {
        return args_;
    }
    const std::map<std::string, std::string>& flags() const {
        return flags_;
    }

    /// "make:model" or "serve".
    std::string name() const;

    /// Positional argument at `index`, if present.
    std::optional<std::string> arg(size_t index) const;

    /// Value of a flag, if given on the command line or defaulted.
    std::optional<std::string> flag(const std::string& name) const;

    /// Boolean flag; absent flags are false.
    bool flag_bool(const std::string& name) const;

    /// Integer flag, `fallback` when absent.
    int64_t flag_int(const std::string& name, int64_t fallback = 0) const;

private:
    std::string verb_;
    std::optional<std::string> noun_;
    std::vector<std::string> args_;
    std::map<std::string, std::string> flags_;
};

/// Signature shared by every command handler.
using CommandHandler = std::function<Status(const CommandDescriptor&, CommandContext&)>;

/// One registered command.
struct CommandSpec {
    std::string verb;
    std::optional<std::string> noun;
    std::vector<ArgSpec> args;
    std::vector<FlagSpec> flags;
    std::string summary;
    CommandHandler handler;

    /// "make:model" or "serve".
    std::string name() const;

    /// Multi-line usage text for `--help`.
    std::string usage() const;
};

/// Outcome of parsing a token list.
struct ParsedCommand {
    const CommandSpec* spec = nullptr;
    CommandDescriptor descriptor;
    bool help_requested = false;
};

/// Table of commands keyed by `(verb, noun)`.
class CommandRegistry {
public:
    /// Registers a command. A later registration of the same pair replaces it.
    void add(CommandSpec spec);

    /// Looks up the command for a `(verb, noun)` pair.
    const CommandSpec* find(const std::string& verb,
                            const std::optional<std::string>& noun) const;

    /// True if any command uses this verb.
    bool has_verb(const std::string& verb) const;

    /// All commands in registration order.
    const std::vector<CommandSpec>& commands() const {
        return commands_;
    }

    /// Parses tokens (argv without the program name) into a descriptor.
    ///
    /// Fails with `ParseError` for an unknown verb, malformed command or
    /// flag, missing or surplus positional arguments, and non-numeric
    /// values for integer flags. Fails with `UnknownCommand` when the verb
    /// is known but the noun is not.
    Result<ParsedCommand, CliError> parse(const std::vector<std::string>& tokens) const;

    /// Invokes the handler registered for the descriptor's `(verb, noun)`.
    Status dispatch(const CommandDescriptor& descriptor, CommandContext& ctx) const;

private:
    std::vector<CommandSpec> commands_;
};

} // namespace rustisan::cli
