#include "cli/utils.hpp"

#include "cli/command.hpp"
#include "common.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

namespace rustisan::cli {

std::string to_forward_slashes(const std::string& path) {
    std::string result = path;
    for (char& c : result) {
        if (c == '\\')
            c = '/';
    }
    return result;
}

std::string display_path(const fs::path& path, const fs::path& base) {
    std::error_code ec;
    fs::path rel = fs::relative(path, base, ec);
    if (ec || rel.empty() || rel.native().rfind("..", 0) == 0) {
        return to_forward_slashes(path.string());
    }
    return to_forward_slashes(rel.string());
}

Result<std::string, CliError> read_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return CliError::make(ErrorKind::IoError, "cannot open file: " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

Status write_file(const fs::path& path, std::string_view content) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return CliError::make(ErrorKind::IoError, "cannot create directory " +
                                                          path.parent_path().string() + ": " +
                                                          ec.message());
        }
    }
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return CliError::make(ErrorKind::IoError, "cannot write file: " + path.string());
    }
    file << content;
    file.close();
    if (!file) {
        return CliError::make(ErrorKind::IoError, "failed writing file: " + path.string());
    }
    return true;
}

void print_usage(const CommandRegistry& registry, std::ostream& out) {
    out << "rustisan " << VERSION << "\n\n";
    out << "Usage: rustisan <command> [arguments] [options]\n\n";
    out << "Commands:\n";
    for (const auto& spec : registry.commands()) {
        out << "  " << std::left << std::setw(18) << spec.name() << " " << spec.summary << "\n";
    }
    out << "\nOptions:\n";
    out << "  --help, -h         Show this help (or a command's help)\n";
    out << "  --version, -V      Show version\n";
    out << "  -v, -vv, -vvv      Increase log verbosity\n";
    out << "  -q, --quiet        Only log errors\n";
    out << "  --log-level=LEVEL  trace, debug, info, warn, error, off\n";
    out << "  --log-filter=SPEC  Per-module levels, e.g. make=debug,*=warn\n";
    out << "  --log-file=PATH    Also write log lines to PATH\n";
    out << "  --log-format=FMT   text or json\n";
}

void print_version(std::ostream& out) {
    out << "rustisan " << VERSION << "\n";
}

} // namespace rustisan::cli
