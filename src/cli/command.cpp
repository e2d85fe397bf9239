//! # Command Parsing
//!
//! Turns raw argv tokens into a `CommandDescriptor` using the argument and
//! flag declarations of the matching `CommandSpec`, and routes parsed
//! descriptors to their handlers.

#include "cli/command.hpp"

#include "cli/context.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace rustisan::cli {

// ============================================================================
// CommandDescriptor
// ============================================================================

std::string CommandDescriptor::name() const {
    return noun_ ? verb_ + ":" + *noun_ : verb_;
}

std::optional<std::string> CommandDescriptor::arg(size_t index) const {
    if (index < args_.size()) {
        return args_[index];
    }
    return std::nullopt;
}

std::optional<std::string> CommandDescriptor::flag(const std::string& name) const {
    auto it = flags_.find(name);
    if (it == flags_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool CommandDescriptor::flag_bool(const std::string& name) const {
    auto it = flags_.find(name);
    return it != flags_.end() && it->second == "true";
}

int64_t CommandDescriptor::flag_int(const std::string& name, int64_t fallback) const {
    auto it = flags_.find(name);
    if (it == flags_.end() || it->second.empty()) {
        return fallback;
    }
    // Values were validated at parse time
    return std::stoll(it->second);
}

// ============================================================================
// CommandSpec
// ============================================================================

std::string CommandSpec::name() const {
    return noun ? verb + ":" + *noun : verb;
}

std::string CommandSpec::usage() const {
    std::ostringstream oss;
    oss << "Usage: rustisan " << name();
    for (const auto& a : args) {
        oss << (a.required ? " <" : " [") << a.name << (a.required ? ">" : "]");
    }
    if (!flags.empty()) {
        oss << " [options]";
    }
    oss << "\n";
    if (!summary.empty()) {
        oss << "\n" << summary << "\n";
    }
    if (!args.empty()) {
        oss << "\nArguments:\n";
        for (const auto& a : args) {
            oss << "  " << a.name;
            if (!a.help.empty()) {
                oss << std::string(a.name.size() < 20 ? 20 - a.name.size() : 1, ' ') << a.help;
            }
            oss << "\n";
        }
    }
    oss << "\nOptions:\n";
    for (const auto& f : flags) {
        std::string left = "--" + f.name;
        if (f.type != FlagType::Bool) {
            left += " <" + std::string(f.type == FlagType::Int ? "N" : "value") + ">";
        }
        if (f.short_name) {
            left = std::string("-") + f.short_name + ", " + left;
        }
        oss << "  " << left << std::string(left.size() < 24 ? 24 - left.size() : 1, ' ')
            << f.help;
        if (!f.default_value.empty() && f.type != FlagType::Bool) {
            oss << " (default: " << f.default_value << ")";
        }
        oss << "\n";
    }
    oss << "  -h, --help" << std::string(14, ' ') << "Show this help\n";
    return oss.str();
}

// ============================================================================
// CommandRegistry
// ============================================================================

namespace {

bool is_integer(std::string_view s) {
    // Anything longer could overflow int64_t
    if (s.empty() || s.size() > 18) {
        return false;
    }
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

bool is_command_word(std::string_view s) {
    if (s.empty()) {
        return false;
    }
    return std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::islower(c) || std::isdigit(c) || c == '-' || c == '_';
    });
}

const FlagSpec* find_flag(const CommandSpec& spec, std::string_view name) {
    for (const auto& f : spec.flags) {
        if (f.name == name) {
            return &f;
        }
    }
    return nullptr;
}

const FlagSpec* find_short_flag(const CommandSpec& spec, char c) {
    for (const auto& f : spec.flags) {
        if (f.short_name == c) {
            return &f;
        }
    }
    return nullptr;
}

CliError parse_error(const CommandSpec& spec, const std::string& msg) {
    return CliError::make(ErrorKind::ParseError, spec.name() + ": " + msg);
}

} // namespace

void CommandRegistry::add(CommandSpec spec) {
    for (auto& existing : commands_) {
        if (existing.verb == spec.verb && existing.noun == spec.noun) {
            existing = std::move(spec);
            return;
        }
    }
    commands_.push_back(std::move(spec));
}

const CommandSpec* CommandRegistry::find(const std::string& verb,
                                         const std::optional<std::string>& noun) const {
    for (const auto& spec : commands_) {
        if (spec.verb == verb && spec.noun == noun) {
            return &spec;
        }
    }
    return nullptr;
}

bool CommandRegistry::has_verb(const std::string& verb) const {
    return std::any_of(commands_.begin(), commands_.end(),
                       [&](const CommandSpec& spec) { return spec.verb == verb; });
}

Result<ParsedCommand, CliError>
CommandRegistry::parse(const std::vector<std::string>& tokens) const {
    // Leading logging options may precede the command word
    size_t pos = 0;
    while (pos < tokens.size() && log::is_log_option(tokens[pos])) {
        ++pos;
    }
    if (pos >= tokens.size()) {
        return CliError::make(ErrorKind::ParseError, "no command given");
    }

    // verb[:noun]
    const std::string& head = tokens[pos++];
    std::string verb = head;
    std::optional<std::string> noun;
    auto colon = head.find(':');
    if (colon != std::string::npos) {
        verb = head.substr(0, colon);
        noun = head.substr(colon + 1);
        if (!is_command_word(*noun)) {
            return CliError::make(ErrorKind::ParseError, "malformed command '" + head + "'");
        }
    }
    if (!is_command_word(verb)) {
        return CliError::make(ErrorKind::ParseError, "malformed command '" + head + "'");
    }
    if (!has_verb(verb)) {
        return CliError::make(ErrorKind::ParseError, "unknown command '" + verb + "'");
    }

    const CommandSpec* spec = find(verb, noun);
    if (!spec) {
        return CliError::make(ErrorKind::UnknownCommand,
                              "'" + head + "' is not a " + verb + " command");
    }

    ParsedCommand parsed;
    parsed.spec = spec;
    std::vector<std::string> args;
    std::map<std::string, std::string> flags;

    auto assign = [&](const FlagSpec& f, const std::string& value) -> std::optional<CliError> {
        if (f.type == FlagType::Bool && value != "true" && value != "false") {
            return parse_error(*spec, "flag --" + f.name + " expects true or false, got '" +
                                          value + "'");
        }
        if (f.type == FlagType::Int && !is_integer(value)) {
            return parse_error(*spec,
                               "flag --" + f.name + " expects a number, got '" + value + "'");
        }
        flags[f.name] = value;
        return std::nullopt;
    };

    bool positional_only = false;
    while (pos < tokens.size()) {
        const std::string& tok = tokens[pos++];

        // Negative numbers are values, not flags
        if (positional_only || tok.size() < 2 || tok[0] != '-' ||
            std::isdigit(static_cast<unsigned char>(tok[1]))) {
            args.push_back(tok);
            continue;
        }
        if (tok == "--") {
            positional_only = true;
            continue;
        }
        if (log::is_log_option(tok)) {
            continue;
        }
        if (tok == "--help" || tok == "-h") {
            parsed.help_requested = true;
            continue;
        }

        const FlagSpec* f = nullptr;
        std::optional<std::string> inline_value;
        if (tok.starts_with("--")) {
            std::string body = tok.substr(2);
            auto eq = body.find('=');
            if (eq != std::string::npos) {
                inline_value = body.substr(eq + 1);
                body = body.substr(0, eq);
            }
            if (body.empty()) {
                return parse_error(*spec, "malformed flag '" + tok + "'");
            }
            f = find_flag(*spec, body);
        } else {
            if (tok.size() != 2) {
                return parse_error(*spec, "malformed flag '" + tok + "'");
            }
            f = find_short_flag(*spec, tok[1]);
        }
        if (!f) {
            return parse_error(*spec, "unknown flag '" + tok + "'");
        }

        std::string value;
        if (inline_value) {
            value = *inline_value;
        } else if (f->type == FlagType::Bool) {
            value = "true";
        } else if (pos < tokens.size()) {
            value = tokens[pos++];
        } else {
            return parse_error(*spec, "flag --" + f->name + " requires a value");
        }
        if (auto err = assign(*f, value)) {
            return *err;
        }
    }

    // Help short-circuits argument validation
    if (!parsed.help_requested) {
        size_t required = static_cast<size_t>(std::count_if(
            spec->args.begin(), spec->args.end(), [](const ArgSpec& a) { return a.required; }));
        if (args.size() < required) {
            return parse_error(*spec, "missing required argument <" +
                                          spec->args[args.size()].name + ">");
        }
        if (args.size() > spec->args.size()) {
            return parse_error(*spec, "unexpected argument '" + args[spec->args.size()] + "'");
        }
    }

    for (const auto& f : spec->flags) {
        if (flags.count(f.name)) {
            continue;
        }
        if (f.type == FlagType::Bool) {
            flags[f.name] = f.default_value.empty() ? "false" : f.default_value;
        } else if (!f.default_value.empty()) {
            flags[f.name] = f.default_value;
        }
    }

    parsed.descriptor = CommandDescriptor(verb, noun, std::move(args), std::move(flags));
    RUSTISAN_LOG_DEBUG("cli", "Parsed " << parsed.descriptor.name() << " with "
                                        << parsed.descriptor.args().size() << " argument(s)");
    return parsed;
}

Status CommandRegistry::dispatch(const CommandDescriptor& descriptor, CommandContext& ctx) const {
    const CommandSpec* spec = find(descriptor.verb(), descriptor.noun());
    if (!spec || !spec->handler) {
        return CliError::make(ErrorKind::UnknownCommand,
                              "no handler for '" + descriptor.name() + "'");
    }
    return spec->handler(descriptor, ctx);
}

} // namespace rustisan::cli
