//! # Generator Tests
//!
//! Template selection, naming, file placement, secondary components and
//! module registration for `make:<kind>`.

#include "generator/generator.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <memory>

using namespace rustisan;
using namespace rustisan::generator;
using rustisan::testing::fixed_time;
using rustisan::testing::ProjectTest;
using rustisan::testing::read_text;
using rustisan::testing::write_text;

namespace fs = std::filesystem;

namespace {

ComponentSpec spec_of(ComponentKind kind, const std::string& name) {
    ComponentSpec spec;
    spec.kind = kind;
    spec.name = name;
    return spec;
}

size_t count_files(const fs::path& dir) {
    std::error_code ec;
    size_t n = 0;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        (void)entry;
        ++n;
    }
    return n;
}

} // namespace

class GeneratorTest : public ProjectTest {
protected:
    Generator generator() {
        return Generator(root, [] { return fixed_time(); });
    }

    Result<std::vector<fs::path>, cli::CliError> generate(const ComponentSpec& spec) {
        auto gen = generator();
        return gen.generate(spec);
    }
};

// ============================================================================
// Selection and Naming
// ============================================================================

TEST(GeneratorRulesTest, TemplateSelection) {
    auto controller = spec_of(ComponentKind::Controller, "User");
    EXPECT_EQ(Generator::template_name(controller), "controller");
    controller.modifiers.resource = true;
    EXPECT_EQ(Generator::template_name(controller), "controller_resource");
    controller.modifiers.api = true;
    EXPECT_EQ(Generator::template_name(controller), "controller_api");

    auto migration = spec_of(ComponentKind::Migration, "add_email_to_users");
    EXPECT_EQ(Generator::template_name(migration), "migration");
    migration.modifiers.modify_table = "users";
    EXPECT_EQ(Generator::template_name(migration), "migration_update");
    EXPECT_EQ(Generator::template_name(spec_of(ComponentKind::Migration, "create_posts_table")),
              "migration_create");

    auto job = spec_of(ComponentKind::Job, "SendEmail");
    job.modifiers.sync = true;
    EXPECT_EQ(Generator::template_name(job), "job_sync");

    auto listener = spec_of(ComponentKind::Listener, "SendWelcome");
    EXPECT_EQ(Generator::template_name(listener), "listener");
    listener.modifiers.event = "UserRegistered";
    EXPECT_EQ(Generator::template_name(listener), "listener_event");

    auto test = spec_of(ComponentKind::Test, "user_flow");
    EXPECT_EQ(Generator::template_name(test), "test_unit");
    test.modifiers.integration = true;
    EXPECT_EQ(Generator::template_name(test), "test_integration");

    auto resource = spec_of(ComponentKind::Resource, "User");
    resource.modifiers.collection = true;
    EXPECT_EQ(Generator::template_name(resource), "resource_collection");
    EXPECT_EQ(Generator::template_name(spec_of(ComponentKind::Policy, "Post")), "policy");
}

TEST(GeneratorRulesTest, MigrationTimestampIsUtc) {
    EXPECT_EQ(migration_timestamp(fixed_time()), "2024_03_05_140709");
}

TEST(GeneratorRulesTest, ModelSecondariesInOrder) {
    auto model = spec_of(ComponentKind::Model, "BlogPost");
    model.modifiers.seeder = true;
    model.modifiers.migration = true;
    model.modifiers.factory = true;
    model.modifiers.force = true;

    auto secondaries = Generator::secondaries(model);
    ASSERT_EQ(secondaries.size(), 3u);
    EXPECT_EQ(secondaries[0].kind, ComponentKind::Migration);
    EXPECT_EQ(secondaries[0].name, "create_blog_posts_table");
    EXPECT_EQ(secondaries[0].modifiers.create_table, "blog_posts");
    EXPECT_EQ(secondaries[1].kind, ComponentKind::Factory);
    EXPECT_EQ(secondaries[1].name, "BlogPostFactory");
    EXPECT_EQ(secondaries[1].modifiers.model, "BlogPost");
    EXPECT_EQ(secondaries[2].kind, ComponentKind::Seeder);
    EXPECT_TRUE(secondaries[2].modifiers.force);

    EXPECT_TRUE(Generator::secondaries(spec_of(ComponentKind::Model, "User")).empty());
}

TEST_F(GeneratorTest, ClassSuffixIsNotDoubled) {
    auto gen = generator();
    EXPECT_EQ(gen.variables(spec_of(ComponentKind::Controller, "User"))["class"],
              "UserController");
    EXPECT_EQ(gen.variables(spec_of(ComponentKind::Controller, "UserController"))["class"],
              "UserController");
    EXPECT_EQ(gen.variables(spec_of(ComponentKind::Model, "User"))["class"], "User");
}

TEST_F(GeneratorTest, ControllerModelIsSingularized) {
    auto gen = generator();
    auto vars = gen.variables(spec_of(ComponentKind::Controller, "PostsController"));
    EXPECT_EQ(vars["model"], "Post");
    EXPECT_EQ(vars["model_plural_snake"], "posts");

    auto explicit_model = spec_of(ComponentKind::Controller, "Admin");
    explicit_model.modifiers.model = "user_account";
    EXPECT_EQ(gen.variables(explicit_model)["model"], "UserAccount");
}

TEST_F(GeneratorTest, MigrationTableVariables) {
    auto gen = generator();
    EXPECT_EQ(gen.variables(spec_of(ComponentKind::Migration, "create_posts_table"))["table"],
              "posts");

    auto modify = spec_of(ComponentKind::Migration, "add_email");
    modify.modifiers.modify_table = "users";
    EXPECT_EQ(gen.variables(modify)["table"], "users");
}

TEST_F(GeneratorTest, TargetPaths) {
    auto gen = generator();
    EXPECT_EQ(gen.target_path(spec_of(ComponentKind::Controller, "UserController")),
              root / "src/controllers/user_controller.rs");
    EXPECT_EQ(gen.target_path(spec_of(ComponentKind::Model, "BlogPost")),
              root / "src/models/blog_post.rs");
    EXPECT_EQ(gen.target_path(spec_of(ComponentKind::Migration, "create_users_table")),
              root / "database/migrations/2024_03_05_140709_create_users_table.rs");

    auto test = spec_of(ComponentKind::Test, "checkout");
    test.modifiers.integration = true;
    EXPECT_EQ(gen.target_path(test), root / "tests/integration/checkout.rs");
}

// ============================================================================
// Generation
// ============================================================================

TEST_F(GeneratorTest, WritesRenderedModel) {
    auto result = generate(spec_of(ComponentKind::Model, "BlogPost"));
    ASSERT_TRUE(is_ok(result));
    ASSERT_EQ(unwrap(result).size(), 1u);

    std::string text = read_text(root / "src/models/blog_post.rs");
    EXPECT_NE(text.find("pub struct BlogPost {"), std::string::npos);
    EXPECT_NE(text.find("\"blog_posts\""), std::string::npos);
    EXPECT_EQ(text.find("{{"), std::string::npos);
    EXPECT_TRUE(logs->contains("Created model: src/models/blog_post.rs"));
}

TEST_F(GeneratorTest, ModelWithMigrationWritesBothInOrder) {
    auto spec = spec_of(ComponentKind::Model, "User");
    spec.modifiers.migration = true;
    auto result = generate(spec);
    ASSERT_TRUE(is_ok(result));

    const auto& files = unwrap(result);
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0], root / "src/models/user.rs");
    EXPECT_EQ(files[1], root / "database/migrations/2024_03_05_140709_create_users_table.rs");

    std::string migration = read_text(files[1]);
    EXPECT_NE(migration.find("schema.create(\"users\""), std::string::npos);
    EXPECT_NE(migration.find("pub struct CreateUsersTable;"), std::string::npos);
}

TEST_F(GeneratorTest, ExistingTargetIsLeftUnchanged) {
    write_text(root / "src/models/user.rs", "// hand written\n");
    auto result = generate(spec_of(ComponentKind::Model, "User"));
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, cli::ErrorKind::TargetExists);
    EXPECT_NE(unwrap_err(result).message.find("--force"), std::string::npos);
    EXPECT_EQ(read_text(root / "src/models/user.rs"), "// hand written\n");
}

TEST_F(GeneratorTest, ForceOverwrites) {
    write_text(root / "src/models/user.rs", "// hand written\n");
    auto spec = spec_of(ComponentKind::Model, "User");
    spec.modifiers.force = true;
    ASSERT_TRUE(is_ok(generate(spec)));
    EXPECT_NE(read_text(root / "src/models/user.rs").find("pub struct User {"),
              std::string::npos);
}

TEST_F(GeneratorTest, SecondariesRunAfterPrimaryConflict) {
    write_text(root / "src/models/user.rs", "// hand written\n");
    auto spec = spec_of(ComponentKind::Model, "User");
    spec.modifiers.factory = true;

    auto result = generate(spec);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, cli::ErrorKind::TargetExists);
    EXPECT_TRUE(fs::exists(root / "database/factories/user_factory.rs"));
}

TEST_F(GeneratorTest, RepeatedMigrationIsNotDuplicated) {
    auto spec = spec_of(ComponentKind::Migration, "create_users_table");
    ASSERT_TRUE(is_ok(generate(spec)));

    auto again = generate(spec);
    ASSERT_TRUE(is_err(again));
    EXPECT_EQ(unwrap_err(again).kind, cli::ErrorKind::TargetExists);

    // A later run with --force rewrites the existing file rather than adding one.
    Generator later(root, [] { return fixed_time() + std::chrono::hours(24); });
    spec.modifiers.force = true;
    auto forced = later.generate(spec);
    ASSERT_TRUE(is_ok(forced));
    EXPECT_EQ(unwrap(forced)[0],
              root / "database/migrations/2024_03_05_140709_create_users_table.rs");
    EXPECT_EQ(count_files(root / "database/migrations"), 1u);
}

TEST_F(GeneratorTest, InvalidNameWritesNothing) {
    auto spec = spec_of(ComponentKind::Model, "../User");
    spec.modifiers.migration = true;
    auto result = generate(spec);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, cli::ErrorKind::InvalidName);
    EXPECT_FALSE(fs::exists(root / "src"));
    EXPECT_FALSE(fs::exists(root / "database"));
}

TEST_F(GeneratorTest, UnderscoreOnlyNameIsRejected) {
    write_text(root / "src/models/mod.rs", "pub mod user;\n");
    for (const char* name : {"__", "___"}) {
        auto result = generate(spec_of(ComponentKind::Model, name));
        ASSERT_TRUE(is_err(result)) << name;
        EXPECT_EQ(unwrap_err(result).kind, cli::ErrorKind::InvalidName);
    }
    EXPECT_FALSE(fs::exists(root / "src/models/.rs"));
    EXPECT_EQ(read_text(root / "src/models/mod.rs"), "pub mod user;\n");

    auto seeder = spec_of(ComponentKind::Seeder, "UserSeeder");
    seeder.modifiers.model = "__";
    auto result = generate(seeder);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, cli::ErrorKind::InvalidName);
}

TEST_F(GeneratorTest, InvalidModifierNameIsRejected) {
    auto spec = spec_of(ComponentKind::Listener, "SendWelcome");
    spec.modifiers.event = "user-registered";
    auto result = generate(spec);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, cli::ErrorKind::InvalidName);
}

TEST_F(GeneratorTest, ConflictingModifiers) {
    auto migration = spec_of(ComponentKind::Migration, "users");
    migration.modifiers.create_table = "users";
    migration.modifiers.modify_table = "users";
    auto result = generate(migration);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, cli::ErrorKind::ParseError);

    auto test = spec_of(ComponentKind::Test, "flow");
    test.modifiers.unit = true;
    test.modifiers.integration = true;
    EXPECT_TRUE(is_err(generate(test)));
}

TEST_F(GeneratorTest, UnknownTemplate) {
    TemplateRegistry empty;
    Generator gen(root, [] { return fixed_time(); }, empty);
    auto result = gen.generate(spec_of(ComponentKind::Model, "User"));
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, cli::ErrorKind::UnknownTemplate);
}

TEST_F(GeneratorTest, RegistersModuleOnce) {
    write_text(root / "src/models/mod.rs", "pub mod post;");
    auto spec = spec_of(ComponentKind::Model, "User");
    ASSERT_TRUE(is_ok(generate(spec)));
    EXPECT_EQ(read_text(root / "src/models/mod.rs"), "pub mod post;\npub mod user;\n");

    spec.modifiers.force = true;
    ASSERT_TRUE(is_ok(generate(spec)));
    EXPECT_EQ(read_text(root / "src/models/mod.rs"), "pub mod post;\npub mod user;\n");
}

TEST_F(GeneratorTest, NoModuleFileNoRegistration) {
    ASSERT_TRUE(is_ok(generate(spec_of(ComponentKind::Job, "SendEmail"))));
    EXPECT_TRUE(fs::exists(root / "src/jobs/send_email.rs"));
    EXPECT_FALSE(fs::exists(root / "src/jobs/mod.rs"));
}

TEST_F(GeneratorTest, WritesTraitAndRegistersIt) {
    write_text(root / "src/traits/mod.rs", "");
    auto result = generate(spec_of(ComponentKind::Trait, "Cacheable"));
    ASSERT_TRUE(is_ok(result));
    ASSERT_EQ(unwrap(result).size(), 1u);
    EXPECT_EQ(unwrap(result)[0], root / "src/traits/cacheable.rs");

    std::string text = read_text(root / "src/traits/cacheable.rs");
    EXPECT_NE(text.find("pub trait Cacheable {"), std::string::npos);
    EXPECT_NE(text.find("async fn handle(&self) -> Result<()>;"), std::string::npos);
    EXPECT_EQ(read_text(root / "src/traits/mod.rs"), "pub mod cacheable;\n");
}

TEST_F(GeneratorTest, MigrationReadsClockOnce) {
    // Each call to the clock is one second later than the last.
    auto calls = std::make_shared<int>(0);
    Generator gen(root, [calls] { return fixed_time() + std::chrono::seconds((*calls)++); });

    auto result = gen.generate(spec_of(ComponentKind::Migration, "create_posts_table"));
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(*calls, 1);
    EXPECT_EQ(unwrap(result)[0],
              root / "database/migrations/2024_03_05_140709_create_posts_table.rs");
    EXPECT_NE(read_text(unwrap(result)[0]).find("at 2024_03_05_140709"), std::string::npos);
}

TEST_F(GeneratorTest, SeedersAreNotRegistered) {
    write_text(root / "database/seeders/mod.rs", "");
    ASSERT_TRUE(is_ok(generate(spec_of(ComponentKind::Seeder, "UserSeeder"))));
    EXPECT_EQ(read_text(root / "database/seeders/mod.rs"), "");
}
