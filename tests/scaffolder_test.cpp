//! # Scaffolder Tests
//!
//! `rustisan new`: template contents, destination checks, directory
//! templates and the git steps.

#include "config/toml_document.hpp"
#include "scaffold/scaffolder.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace rustisan;
using namespace rustisan::scaffold;
using rustisan::testing::ProjectTest;
using rustisan::testing::read_text;
using rustisan::testing::write_text;

namespace fs = std::filesystem;

class ScaffolderTest : public ProjectTest {
protected:
    Result<fs::path, cli::CliError> create(const ScaffoldOptions& options) {
        auto ctx = context();
        Scaffolder scaffolder(ctx);
        return scaffolder.create(options);
    }

    ScaffoldOptions options(const std::string& name, const std::string& tmpl = "web") {
        ScaffoldOptions opts;
        opts.name = name;
        opts.template_name = tmpl;
        return opts;
    }
};

TEST_F(ScaffolderTest, WebTemplate) {
    auto result = create(options("my-blog"));
    ASSERT_TRUE(is_ok(result));
    fs::path project = root / "my-blog";
    EXPECT_EQ(unwrap(result), project);

    EXPECT_NE(read_text(project / "Cargo.toml").find("name = \"my-blog\""), std::string::npos);
    EXPECT_TRUE(fs::exists(project / "src/main.rs"));
    EXPECT_TRUE(fs::exists(project / "routes/web.rs"));
    EXPECT_TRUE(fs::exists(project / "resources/views/welcome.html"));
    EXPECT_TRUE(fs::exists(project / ".gitignore"));
    EXPECT_TRUE(fs::exists(project / "README.md"));
    EXPECT_EQ(read_text(project / "src/controllers/mod.rs"), "//! Application controllers\n");
    EXPECT_TRUE(fs::exists(project / "storage/logs/.gitkeep"));
    EXPECT_FALSE(fs::exists(project / "src/controllers/.gitkeep"));

    auto config = config::TomlDocument::parse(read_text(project / "rustisan.toml"));
    ASSERT_TRUE(is_ok(config));
    EXPECT_EQ(unwrap(config).get({"app", "name"})->as_string(), "My Blog");
}

TEST_F(ScaffolderTest, RendersNoLeftoverSlots) {
    ASSERT_TRUE(is_ok(create(options("shop", "api"))));
    for (const auto& entry : fs::recursive_directory_iterator(root / "shop")) {
        if (entry.is_regular_file()) {
            EXPECT_EQ(read_text(entry.path()).find("{{"), std::string::npos) << entry.path();
        }
    }
}

TEST_F(ScaffolderTest, ApiTemplateHasNoViews) {
    ASSERT_TRUE(is_ok(create(options("shop", "api"))));
    EXPECT_TRUE(fs::exists(root / "shop/routes/api.rs"));
    EXPECT_FALSE(fs::exists(root / "shop/routes/web.rs"));
    EXPECT_FALSE(fs::exists(root / "shop/resources"));
}

TEST_F(ScaffolderTest, MinimalTemplate) {
    ASSERT_TRUE(is_ok(create(options("tiny", "minimal"))));
    EXPECT_TRUE(fs::exists(root / "tiny/src/main.rs"));
    EXPECT_TRUE(fs::exists(root / "tiny/tests/smoke.rs"));
    EXPECT_TRUE(fs::exists(root / "tiny/rustisan.toml"));
    EXPECT_FALSE(fs::exists(root / "tiny/src/controllers"));
}

TEST_F(ScaffolderTest, RunsGitSteps) {
    ASSERT_TRUE(is_ok(create(options("my-blog"))));
    EXPECT_EQ(runner.lines(), (std::vector<std::string>{"git init", "git add .",
                                                        "git commit -m \"Initial commit\""}));
    for (const auto& cmd : runner.commands) {
        EXPECT_EQ(cmd.cwd, root / "my-blog");
    }
}

TEST_F(ScaffolderTest, SkipsGitWhenDisabled) {
    auto opts = options("my-blog");
    opts.git = false;
    ASSERT_TRUE(is_ok(create(opts)));
    EXPECT_TRUE(runner.commands.empty());
}

TEST_F(ScaffolderTest, GitFailureKeepsFiles) {
    runner.exit_codes["git"] = 128;
    auto result = create(options("my-blog"));
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, cli::ErrorKind::DelegatedFailure);
    EXPECT_EQ(unwrap_err(result).exit_code(), 128);
    EXPECT_EQ(runner.commands.size(), 1u);
    EXPECT_TRUE(fs::exists(root / "my-blog/Cargo.toml"));
}

TEST_F(ScaffolderTest, InvalidNameWritesNothing) {
    for (const char* name : {"1blog", "my blog", "", "../escape"}) {
        auto result = create(options(name));
        ASSERT_TRUE(is_err(result)) << name;
        EXPECT_EQ(unwrap_err(result).kind, cli::ErrorKind::InvalidName) << name;
    }
    EXPECT_FALSE(fs::exists(root / "1blog"));
    EXPECT_FALSE(fs::exists(root.parent_path() / "escape"));
    EXPECT_TRUE(runner.commands.empty());
}

TEST_F(ScaffolderTest, UnknownTemplate) {
    auto result = create(options("my-blog", "react"));
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, cli::ErrorKind::UnknownTemplate);
    EXPECT_NE(unwrap_err(result).message.find("web, api, minimal"), std::string::npos);
    EXPECT_FALSE(fs::exists(root / "my-blog"));
}

TEST_F(ScaffolderTest, NonEmptyDestinationFailsBeforeWriting) {
    write_text(root / "my-blog/notes.txt", "keep me");
    auto result = create(options("my-blog"));
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, cli::ErrorKind::DestinationNotEmpty);
    EXPECT_EQ(read_text(root / "my-blog/notes.txt"), "keep me");
    EXPECT_FALSE(fs::exists(root / "my-blog/Cargo.toml"));
    EXPECT_TRUE(runner.commands.empty());
}

TEST_F(ScaffolderTest, DestinationThatIsAFile) {
    write_text(root / "my-blog", "file");
    auto result = create(options("my-blog"));
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, cli::ErrorKind::DestinationNotEmpty);
}

TEST_F(ScaffolderTest, EmptyDestinationIsAllowed) {
    fs::create_directories(root / "my-blog");
    ASSERT_TRUE(is_ok(create(options("my-blog"))));
    EXPECT_TRUE(fs::exists(root / "my-blog/src/main.rs"));
}

TEST_F(ScaffolderTest, RelativeParentIsResolvedAgainstCwd) {
    auto opts = options("my-blog");
    opts.parent = "apps";
    auto result = create(opts);
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result), root / "apps/my-blog");
    EXPECT_TRUE(fs::exists(root / "apps/my-blog/Cargo.toml"));
}

TEST_F(ScaffolderTest, DirectoryTemplate) {
    write_text(root / "starter/Cargo.toml.tpl", "[package]\nname = \"{{package}}\"\n");
    write_text(root / "starter/static/logo.txt", "{{package}} stays literal");
    fs::create_directories(root / "starter/empty");

    auto result = create(options("my-blog", "starter"));
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(read_text(root / "my-blog/Cargo.toml"), "[package]\nname = \"my-blog\"\n");
    EXPECT_FALSE(fs::exists(root / "my-blog/Cargo.toml.tpl"));
    EXPECT_EQ(read_text(root / "my-blog/static/logo.txt"), "{{package}} stays literal");
    EXPECT_TRUE(fs::exists(root / "my-blog/empty/.gitkeep"));
}

TEST(ProjectTemplatesTest, BuiltinNames) {
    EXPECT_EQ(builtin_template_names(), (std::vector<std::string>{"web", "api", "minimal"}));
    auto vars = project_variables("blog");
    EXPECT_EQ(vars["package"], "blog");
    EXPECT_TRUE(builtin_template("web", vars).has_value());
    EXPECT_FALSE(builtin_template("react", vars).has_value());
}
