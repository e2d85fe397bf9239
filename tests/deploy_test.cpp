//! # Deploy Tests
//!
//! Deploy config parsing, deployment planning for each strategy, and the
//! `deploy` / `deploy:init` commands.

#include "cli/commands/cmd_deploy.hpp"
#include "cli/driver.hpp"
#include "config/toml_document.hpp"
#include "test_support.hpp"

#include <cstdlib>
#include <gtest/gtest.h>

using namespace rustisan;
using namespace rustisan::cli;
using rustisan::testing::ProjectTest;
using rustisan::testing::read_text;
using rustisan::testing::write_text;

namespace fs = std::filesystem;

namespace {

config::TomlDocument document(const std::string& text) {
    auto doc = config::TomlDocument::parse(text);
    EXPECT_TRUE(is_ok(doc)) << (is_err(doc) ? unwrap_err(doc).to_string() : "");
    return std::move(unwrap(doc));
}

std::vector<std::string> displays(const std::vector<process::ShellCommand>& plan) {
    std::vector<std::string> out;
    for (const auto& cmd : plan) {
        out.push_back(cmd.display());
    }
    return out;
}

} // namespace

class DeployTest : public ProjectTest {
protected:
    void SetUp() override {
        ProjectTest::SetUp();
        unsetenv("DOCKER_REGISTRY");
        write_text(root / "src/main.rs", "fn main() {}\n");
        registry = build_registry();
    }

    void TearDown() override {
        unsetenv("DOCKER_REGISTRY");
        ProjectTest::TearDown();
    }

    DeployConfig parse(const std::string& text) {
        auto config = parse_deploy_config(document(text).root());
        EXPECT_TRUE(is_ok(config));
        return is_ok(config) ? unwrap(config) : DeployConfig{};
    }

    std::vector<std::string> plan(const DeployConfig& config, DeployOptions options = {}) {
        auto ctx = context();
        auto result = plan_deployment(ctx, config, options);
        EXPECT_TRUE(is_ok(result)) << (is_err(result) ? unwrap_err(result).to_string() : "");
        return is_ok(result) ? displays(unwrap(result)) : std::vector<std::string>{};
    }

    Status run(const std::vector<std::string>& tokens) {
        auto parsed = registry.parse(tokens);
        if (is_err(parsed)) {
            return unwrap_err(parsed);
        }
        auto ctx = context();
        return registry.dispatch(unwrap(parsed).descriptor, ctx);
    }

    CommandRegistry registry;
};

// ============================================================================
// Config
// ============================================================================

TEST_F(DeployTest, ParseDefaults) {
    DeployConfig config = parse("");
    EXPECT_EQ(config.type, "server");
    EXPECT_EQ(config.port, 22);
    EXPECT_EQ(config.namespace_name, "default");
    EXPECT_TRUE(config.environment.empty());
    EXPECT_TRUE(config.pre_deploy_commands.empty());
}

TEST_F(DeployTest, ParseFullConfig) {
    DeployConfig config = parse(R"(deployment_type = "kubernetes"
kubernetes_namespace = "web"
port = 2222
pre_deploy_commands = ["npm run build"]
post_deploy_commands = ["echo done", "curl -f http://localhost/health"]

[environment_variables]
APP_ENV = "staging"
WORKERS = 4
)");
    EXPECT_EQ(config.type, "kubernetes");
    EXPECT_EQ(config.namespace_name, "web");
    EXPECT_EQ(config.port, 2222);
    EXPECT_EQ(config.pre_deploy_commands, (std::vector<std::string>{"npm run build"}));
    EXPECT_EQ(config.post_deploy_commands.size(), 2u);
    ASSERT_EQ(config.environment.size(), 2u);
    EXPECT_EQ(config.environment[0], (std::pair<std::string, std::string>{"APP_ENV", "staging"}));
    EXPECT_EQ(config.environment[1], (std::pair<std::string, std::string>{"WORKERS", "4"}));
}

TEST_F(DeployTest, ParseRejectsWrongTypes) {
    for (const char* text : {"host = 1\n", "port = \"22\"\n", "port = 0\n",
                             "pre_deploy_commands = \"make\"\n",
                             "post_deploy_commands = [1]\n", "environment_variables = 3\n"}) {
        auto result = parse_deploy_config(document(text).root());
        ASSERT_TRUE(is_err(result)) << text;
        EXPECT_EQ(unwrap_err(result).kind, ErrorKind::ValidationFailed) << text;
    }
}

TEST_F(DeployTest, ConfigTemplateParses) {
    std::string text = deploy_config_template("staging", "blog");
    DeployConfig config = parse(text);
    EXPECT_EQ(config.type, "server");
    EXPECT_EQ(config.host, "your-server.com");
    EXPECT_EQ(config.user, "deploy");
    EXPECT_EQ(config.path, "/opt/blog");
    EXPECT_EQ(config.docker_image, "blog");
    ASSERT_EQ(config.environment.size(), 1u);
    EXPECT_EQ(config.environment[0].second, "staging");
}

// ============================================================================
// Planning
// ============================================================================

TEST_F(DeployTest, PlanServer) {
    DeployConfig config;
    config.host = "example.com";
    config.user = "deploy";
    config.path = "/opt/blog";
    config.pre_deploy_commands = {"npm ci"};
    config.post_deploy_commands = {"echo done"};

    EXPECT_EQ(plan(config), (std::vector<std::string>{
                                "sh -c \"npm ci\"",
                                "cargo build --release",
                                "cargo test --release",
                                "scp -P 22 target/release/blog deploy@example.com:/opt/blog/",
                                "ssh -p 22 deploy@example.com \"sudo systemctl restart blog\"",
                                "cargo run --bin migrate -- up",
                                "sh -c \"echo done\"",
                            }));
}

TEST_F(DeployTest, PlanSkipBuild) {
    DeployConfig config;
    config.type = "kubernetes";
    DeployOptions options;
    options.skip_build = true;

    EXPECT_EQ(plan(config, options),
              (std::vector<std::string>{"cargo test --release",
                                        "kubectl apply -f k8s/ -n default",
                                        "kubectl rollout status deployment/blog -n default",
                                        "cargo run --bin migrate -- up"}));
}

TEST_F(DeployTest, PlanDocker) {
    DeployConfig config;
    config.type = "docker";
    config.docker_image = "blog:1.0";
    auto steps = plan(config);
    ASSERT_EQ(steps.size(), 4u);
    EXPECT_EQ(steps[2], "docker build -t blog:1.0 .");

    setenv("DOCKER_REGISTRY", "registry.example.com", 1);
    steps = plan(config);
    ASSERT_EQ(steps.size(), 6u);
    EXPECT_EQ(steps[3], "docker tag blog:1.0 registry.example.com/blog:1.0");
    EXPECT_EQ(steps[4], "docker push registry.example.com/blog:1.0");
}

TEST_F(DeployTest, PlanPassesEnvironmentToEveryStep) {
    DeployConfig config;
    config.type = "kubernetes";
    config.environment = {{"APP_ENV", "production"}};

    auto ctx = context();
    auto result = plan_deployment(ctx, config, {});
    ASSERT_TRUE(is_ok(result));
    for (const auto& cmd : unwrap(result)) {
        ASSERT_EQ(cmd.env.size(), 1u) << cmd.display();
        EXPECT_EQ(cmd.env[0].first, "APP_ENV");
        EXPECT_EQ(cmd.cwd, root);
    }
}

TEST_F(DeployTest, PlanRejectsIncompleteOrUnknownConfig) {
    auto ctx = context();

    DeployConfig server;
    server.host = "example.com";
    auto missing_user = plan_deployment(ctx, server, {});
    ASSERT_TRUE(is_err(missing_user));
    EXPECT_EQ(unwrap_err(missing_user).kind, ErrorKind::ValidationFailed);
    EXPECT_NE(unwrap_err(missing_user).message.find("'user'"), std::string::npos);

    DeployConfig docker;
    docker.type = "docker";
    EXPECT_TRUE(is_err(plan_deployment(ctx, docker, {})));

    DeployConfig cloud;
    cloud.type = "cloud";
    auto unknown = plan_deployment(ctx, cloud, {});
    ASSERT_TRUE(is_err(unknown));
    EXPECT_NE(unwrap_err(unknown).message.find("unsupported deployment type 'cloud'"),
              std::string::npos);
}

// ============================================================================
// Commands
// ============================================================================

TEST_F(DeployTest, InitWritesConfig) {
    ASSERT_TRUE(is_ok(run({"deploy:init"})));
    std::string text = read_text(root / "deploy/production.toml");
    EXPECT_EQ(text, deploy_config_template("production", "blog"));

    auto again = run({"deploy:init"});
    ASSERT_TRUE(is_err(again));
    EXPECT_EQ(unwrap_err(again).kind, ErrorKind::TargetExists);

    write_text(root / "deploy/production.toml", "# edited\n");
    ASSERT_TRUE(is_ok(run({"deploy:init", "--force"})));
    EXPECT_EQ(read_text(root / "deploy/production.toml"), text);
}

TEST_F(DeployTest, InitRejectsBadTarget) {
    auto result = run({"deploy:init", "../prod"});
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::InvalidName);
}

TEST_F(DeployTest, DeployRejectsBadTarget) {
    write_text(root / "outside.toml", "deployment_type = \"server\"\n");
    for (const char* target : {"../outside", "a/b"}) {
        auto result = run({"deploy", target});
        ASSERT_TRUE(is_err(result)) << target;
        EXPECT_EQ(unwrap_err(result).kind, ErrorKind::InvalidName) << target;
    }
    EXPECT_TRUE(runner.commands.empty());
}

TEST_F(DeployTest, DeployWithoutConfig) {
    auto result = run({"deploy", "staging"});
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::ValidationFailed);
    EXPECT_NE(unwrap_err(result).message.find("rustisan deploy:init staging"), std::string::npos);
    EXPECT_TRUE(runner.commands.empty());
}

TEST_F(DeployTest, DeployNeedsMainSource) {
    ASSERT_TRUE(is_ok(run({"deploy:init"})));
    fs::remove(root / "src/main.rs");
    auto result = run({"deploy"});
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::ValidationFailed);
}

TEST_F(DeployTest, DryRunRunsNothing) {
    ASSERT_TRUE(is_ok(run({"deploy:init"})));
    ASSERT_TRUE(is_ok(run({"deploy", "--dry-run"})));
    EXPECT_TRUE(runner.commands.empty());
    EXPECT_TRUE(logs->contains("[dry-run] cargo build --release"));
    EXPECT_TRUE(logs->contains("[dry-run] cargo run --bin migrate -- up"));
    EXPECT_TRUE(logs->contains("Dry run completed"));
}

TEST_F(DeployTest, DeployRunsPlan) {
    write_text(root / "deploy/staging.toml",
               "deployment_type = \"kubernetes\"\nkubernetes_namespace = \"web\"\n");
    ASSERT_TRUE(is_ok(run({"deploy", "staging", "--skip-build"})));
    EXPECT_EQ(runner.lines(),
              (std::vector<std::string>{"cargo test --release", "kubectl apply -f k8s/ -n web",
                                        "kubectl rollout status deployment/blog -n web",
                                        "cargo run --bin migrate -- up"}));
    EXPECT_TRUE(logs->contains("Deployment completed"));
    EXPECT_FALSE(logs->contains("Dry run completed"));
}

TEST_F(DeployTest, DeployStopsAtFirstFailure) {
    write_text(root / "deploy/production.toml", "deployment_type = \"kubernetes\"\n");
    runner.exit_codes["kubectl"] = 1;
    auto result = run({"deploy"});
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::DelegatedFailure);
    ASSERT_EQ(runner.commands.size(), 3u);
    EXPECT_EQ(runner.commands.back().program, "kubectl");
}

TEST_F(DeployTest, DeployReportsConfigErrors) {
    write_text(root / "deploy/production.toml", "deployment_type = \"ftp\"\n");
    auto result = run({"deploy"});
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::ValidationFailed);
    EXPECT_TRUE(runner.commands.empty());
}
