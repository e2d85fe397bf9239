//! # Tooling Command Tests
//!
//! Route discovery and the route cache, dependency management through
//! cargo, and the `dev:*` tools.

#include "cli/commands/cmd_package.hpp"
#include "cli/commands/cmd_route.hpp"
#include "cli/driver.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <gtest/gtest.h>

using namespace rustisan;
using namespace rustisan::cli;
using rustisan::testing::ProjectTest;
using rustisan::testing::read_text;
using rustisan::testing::write_text;

namespace fs = std::filesystem;

namespace {

const char* const WEB_ROUTES = R"rs(//! Web routes
use rustisan_core::{routing::Router, Response, Result};

pub async fn register(router: &mut Router) -> Result<()> {
    router.get("/", home::index).name("home").middleware("web");
    // router.get("/old", legacy::index);
    router.post("/login", auth::login).name("login").middleware("web").middleware("guest");
    router.delete("/users/{id}", users::destroy);
    Ok(())
}
)rs";

const char* const API_ROUTES = R"rs(pub fn register(group: &mut RouteGroup) {
    group.put("/posts/{id}", posts::update).name("posts.update");
}
)rs";

} // namespace

class ToolingTest : public ProjectTest {
protected:
    void SetUp() override {
        ProjectTest::SetUp();
        registry = build_registry();
    }

    Status run(const std::vector<std::string>& tokens) {
        auto parsed = registry.parse(tokens);
        if (is_err(parsed)) {
            return unwrap_err(parsed);
        }
        auto ctx = context();
        return registry.dispatch(unwrap(parsed).descriptor, ctx);
    }

    void write_routes() {
        write_text(root / "routes/web.rs", WEB_ROUTES);
        write_text(root / "routes/api.rs", API_ROUTES);
    }

    std::vector<RouteEntry> routes() {
        auto found = discover_routes(root);
        EXPECT_TRUE(is_ok(found));
        return is_ok(found) ? unwrap(found) : std::vector<RouteEntry>{};
    }

    std::string env_of(const process::ShellCommand& cmd, const std::string& name) {
        for (const auto& [key, value] : cmd.env) {
            if (key == name) {
                return value;
            }
        }
        return "";
    }

    CommandRegistry registry;
};

// ============================================================================
// route:*
// ============================================================================

TEST_F(ToolingTest, DiscoverRoutesInFileThenLineOrder) {
    write_routes();
    auto found = routes();
    ASSERT_EQ(found.size(), 4u);

    EXPECT_EQ(found[0].method, "PUT");
    EXPECT_EQ(found[0].uri, "/posts/{id}");
    EXPECT_EQ(found[0].source, "routes/api.rs:2");

    EXPECT_EQ(found[1].method, "GET");
    EXPECT_EQ(found[1].uri, "/");
    EXPECT_EQ(found[1].name, "home");
    EXPECT_EQ(found[1].middleware, (std::vector<std::string>{"web"}));
    EXPECT_EQ(found[1].source, "routes/web.rs:5");

    EXPECT_EQ(found[2].uri, "/login");
    EXPECT_EQ(found[2].middleware, (std::vector<std::string>{"web", "guest"}));
    EXPECT_EQ(found[2].source, "routes/web.rs:7");

    EXPECT_EQ(found[3].method, "DELETE");
    EXPECT_FALSE(found[3].name.has_value());
    EXPECT_TRUE(found[3].middleware.empty());
}

TEST_F(ToolingTest, NoRoutesDirectoryMeansNoRoutes) {
    EXPECT_TRUE(routes().empty());
}

TEST_F(ToolingTest, FilterRoutes) {
    write_routes();
    auto by_method = filter_routes(routes(), std::string("get"), std::nullopt);
    ASSERT_EQ(by_method.size(), 1u);
    EXPECT_EQ(by_method[0].uri, "/");

    auto by_name = filter_routes(routes(), std::nullopt, std::string("posts"));
    ASSERT_EQ(by_name.size(), 1u);
    EXPECT_EQ(by_name[0].name, "posts.update");

    EXPECT_TRUE(filter_routes(routes(), std::string("DELETE"), std::string("users")).empty());
}

TEST_F(ToolingTest, RouteListPrintsTable) {
    write_routes();
    ASSERT_TRUE(is_ok(run({"route:list", "--middleware"})));
    std::string out = output.str();
    EXPECT_EQ(out.rfind("Method", 0), 0u);
    EXPECT_NE(out.find("Middleware"), std::string::npos);
    EXPECT_NE(out.find("web, guest"), std::string::npos);
    EXPECT_NE(out.find("routes/web.rs:8"), std::string::npos);
    EXPECT_EQ(std::count(out.begin(), out.end(), '\n'), 5);
}

TEST_F(ToolingTest, RouteListFiltersByMethod) {
    write_routes();
    ASSERT_TRUE(is_ok(run({"route:list", "--method", "post"})));
    std::string out = output.str();
    EXPECT_NE(out.find("/login"), std::string::npos);
    EXPECT_EQ(out.find("/posts/{id}"), std::string::npos);
    EXPECT_EQ(out.find("Middleware"), std::string::npos);
}

TEST_F(ToolingTest, RouteListWithoutRoutes) {
    ASSERT_TRUE(is_ok(run({"route:list"})));
    EXPECT_EQ(output.str(), "");
    EXPECT_TRUE(logs->contains("No routes found"));
}

TEST_F(ToolingTest, RouteCacheThenClear) {
    write_text(root / "routes/api.rs", API_ROUTES);
    ASSERT_TRUE(is_ok(run({"route:cache"})));
    EXPECT_EQ(read_text(root / "bootstrap/cache/routes.json"),
              "[\n  {\"method\": \"PUT\", \"uri\": \"/posts/{id}\", \"name\": \"posts.update\", "
              "\"middleware\": [], \"source\": \"routes/api.rs:2\"}\n]\n");

    ASSERT_TRUE(is_ok(run({"route:clear"})));
    EXPECT_FALSE(fs::exists(root / "bootstrap/cache/routes.json"));

    ASSERT_TRUE(is_ok(run({"route:clear"})));
    EXPECT_TRUE(logs->contains("Route cache not found"));
}

TEST_F(ToolingTest, RouteCommandsNeedProject) {
    fs::remove(root / "rustisan.toml");
    auto result = run({"route:list"});
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::NotAProject);
}

// ============================================================================
// package:*
// ============================================================================

TEST_F(ToolingTest, InstalledPackagesFromManifest) {
    auto packages = installed_packages(root);
    ASSERT_TRUE(is_ok(packages));
    const auto& list = unwrap(packages);
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0].name, "serde");
    EXPECT_EQ(list[0].version, "1.0");
    EXPECT_TRUE(list[0].features.empty());
    EXPECT_EQ(list[1].name, "tokio");
    EXPECT_EQ(list[1].version, "1");
    EXPECT_EQ(list[1].features, (std::vector<std::string>{"full"}));
}

TEST_F(ToolingTest, PackageInstall) {
    ASSERT_TRUE(is_ok(run({"package:install", "serde_json"})));
    ASSERT_TRUE(is_ok(run({"package:install", "sqlx", "--version", "0.7"})));
    EXPECT_EQ(runner.lines(),
              (std::vector<std::string>{"cargo add serde_json", "cargo add sqlx@0.7"}));
    EXPECT_TRUE(logs->contains("Package sqlx installed"));
}

TEST_F(ToolingTest, PackageInstallSkipsInstalled) {
    ASSERT_TRUE(is_ok(run({"package:install", "tokio"})));
    EXPECT_TRUE(runner.commands.empty());
    EXPECT_TRUE(logs->contains("Package tokio is already installed"));
}

TEST_F(ToolingTest, PackageInstallRejectsBadName) {
    auto result = run({"package:install", "../evil"});
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::InvalidName);
    EXPECT_TRUE(runner.commands.empty());
}

TEST_F(ToolingTest, PackageInstallFailure) {
    runner.exit_codes["cargo"] = 101;
    auto result = run({"package:install", "serde_json"});
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::DelegatedFailure);
    EXPECT_EQ(unwrap_err(result).exit_code(), 101);
    EXPECT_FALSE(logs->contains("installed"));
}

TEST_F(ToolingTest, PackageRemove) {
    ASSERT_TRUE(is_ok(run({"package:remove", "serde"})));
    ASSERT_TRUE(is_ok(run({"package:remove", "rand"})));
    EXPECT_EQ(runner.lines(), (std::vector<std::string>{"cargo remove serde"}));
    EXPECT_TRUE(logs->contains("Package rand is not installed"));
}

TEST_F(ToolingTest, PackageList) {
    ASSERT_TRUE(is_ok(run({"package:list"})));
    EXPECT_EQ(output.str(), "Name   Version  Features\n"
                            "serde  1.0      default\n"
                            "tokio  1        full\n");
}

TEST_F(ToolingTest, PackageListReportsBrokenManifest) {
    write_text(root / "Cargo.toml", "[package\nname = \"blog\"\n");
    auto result = run({"package:list"});
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::ConfigSyntax);
}

TEST_F(ToolingTest, PackageUpdate) {
    ASSERT_TRUE(is_ok(run({"package:update"})));
    EXPECT_EQ(runner.lines(), (std::vector<std::string>{"cargo update"}));
}

// ============================================================================
// dev:*
// ============================================================================

TEST_F(ToolingTest, DevServerReloadsWhenCargoWatchInstalled) {
    runner.installed.insert("cargo-watch");
    ASSERT_TRUE(is_ok(run({"dev:server", "--port", "8080"})));
    ASSERT_EQ(runner.commands.size(), 1u);
    const auto& cmd = runner.commands[0];
    EXPECT_EQ(cmd.args[0], "watch");
    EXPECT_EQ(env_of(cmd, "SERVER_HOST"), "127.0.0.1");
    EXPECT_EQ(env_of(cmd, "SERVER_PORT"), "8080");
    EXPECT_EQ(env_of(cmd, "APP_ENV"), "development");
}

TEST_F(ToolingTest, DevServerWithoutCargoWatch) {
    ASSERT_TRUE(is_ok(run({"dev:server", "--host", "0.0.0.0"})));
    EXPECT_EQ(runner.lines(), (std::vector<std::string>{"cargo run"}));
    EXPECT_EQ(env_of(runner.commands[0], "SERVER_HOST"), "0.0.0.0");
    EXPECT_TRUE(logs->contains("cargo-watch not found"));
}

TEST_F(ToolingTest, DevServerRejectsBadPort) {
    auto result = run({"dev:server", "--port", "70000"});
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::ParseError);
    EXPECT_TRUE(runner.commands.empty());
}

TEST_F(ToolingTest, DevWatchNeedsCargoWatch) {
    auto result = run({"dev:watch"});
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::ValidationFailed);

    runner.installed.insert("cargo-watch");
    ASSERT_TRUE(is_ok(run({"dev:watch"})));
    EXPECT_EQ(runner.lines(), (std::vector<std::string>{"cargo watch -x check -x test"}));
}

TEST_F(ToolingTest, DevTools) {
    ASSERT_TRUE(is_ok(run({"dev:format"})));
    ASSERT_TRUE(is_ok(run({"dev:check"})));
    ASSERT_TRUE(is_ok(run({"dev:docs"})));
    ASSERT_TRUE(is_ok(run({"dev:docs", "--open"})));
    EXPECT_EQ(runner.lines(),
              (std::vector<std::string>{
                  "cargo fmt", "cargo clippy --all-targets --all-features -- -D warnings",
                  "cargo doc --no-deps", "cargo doc --no-deps --open"}));
    EXPECT_TRUE(logs->contains("Code formatted"));
    EXPECT_TRUE(logs->contains("Documentation available at target/doc/"));
}

TEST_F(ToolingTest, DevCheckFailure) {
    runner.exit_codes["cargo"] = 1;
    auto result = run({"dev:check"});
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::DelegatedFailure);
    EXPECT_FALSE(logs->contains("Code check passed"));
}
