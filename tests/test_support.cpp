#include "test_support.hpp"

#include "common.hpp"
#include "config/config_store.hpp"

#include <atomic>
#include <fstream>
#include <random>

namespace rustisan::testing {

std::chrono::system_clock::time_point fixed_time() {
    // 2024-03-05T14:07:09Z
    return std::chrono::system_clock::time_point(std::chrono::seconds(1709647629));
}

fs::path make_temp_dir(const std::string& prefix) {
    static std::atomic<int> counter{0};
    std::random_device rd;
    fs::path dir;
    do {
        dir = fs::temp_directory_path() /
              (prefix + "_" + std::to_string(rd()) + "_" + std::to_string(counter++));
    } while (fs::exists(dir));
    fs::create_directories(dir);
    return dir;
}

std::string read_text(const fs::path& path) {
    std::ifstream f(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

void write_text(const fs::path& path, const std::string& content) {
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }
    std::ofstream f(path, std::ios::binary);
    f << content;
}

void ProjectTest::SetUp() {
    root = make_temp_dir("rustisan_project");
    write_text(root / "Cargo.toml", "[package]\nname = \"blog\"\nversion = \"0.1.0\"\n"
                                    "edition = \"2021\"\n\n[dependencies]\n"
                                    "tokio = { version = \"1\", features = [\"full\"] }\n"
                                    "serde = \"1.0\"\n");
    write_text(root / "rustisan.toml", config::default_config("Blog"));

    GlobalOptions::quiet = false;

    log::LogConfig config;
    config.level = log::LogLevel::Debug;
    config.console = false;
    log::Logger::init(config);
    auto sink = std::make_unique<CaptureSink>();
    logs = sink.get();
    log::Logger::instance().add_sink(std::move(sink));
}

void ProjectTest::TearDown() {
    log::Logger::instance().clear_sinks();
    logs = nullptr;
    std::error_code ec;
    fs::remove_all(root, ec);
}

cli::CommandContext ProjectTest::context() {
    cli::CommandContext ctx{root, runner, output, input};
    ctx.now = fixed_time;
    return ctx;
}

} // namespace rustisan::testing
