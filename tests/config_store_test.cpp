//! # Config Store Tests
//!
//! Dotted-key reads and writes against `rustisan.toml`, validation rules,
//! sensitive-key masking and application key generation.

#include "config/config_store.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace rustisan;
using namespace rustisan::config;
using rustisan::testing::ProjectTest;
using rustisan::testing::read_text;
using rustisan::testing::write_text;

namespace {

TomlDocument document(const std::string& text) {
    auto doc = TomlDocument::parse(text);
    EXPECT_TRUE(is_ok(doc));
    return std::move(unwrap(doc));
}

} // namespace

class ConfigStoreTest : public ProjectTest {
protected:
    ConfigStore store() {
        return ConfigStore(root / "rustisan.toml");
    }

    TomlValue parsed(const std::string& text) {
        return document(text).root().clone();
    }
};

// ============================================================================
// Get / Set
// ============================================================================

TEST_F(ConfigStoreTest, GetReadsDefaults) {
    auto name = store().get("app.name");
    ASSERT_TRUE(is_ok(name));
    EXPECT_EQ(unwrap(name).to_display(), "Blog");

    auto port = store().get("server.port");
    ASSERT_TRUE(is_ok(port));
    EXPECT_EQ(unwrap(port).as_integer(), 3000);
}

TEST_F(ConfigStoreTest, GetMissingKeyIsKeyNotFound) {
    auto result = store().get("app.missing");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, cli::ErrorKind::KeyNotFound);
}

TEST_F(ConfigStoreTest, GetInvalidKeyIsParseError) {
    auto result = store().get("app..name");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, cli::ErrorKind::ParseError);
}

TEST_F(ConfigStoreTest, SetThenGet) {
    auto s = store();
    ASSERT_TRUE(is_ok(s.set("app.name", parse_cli_value("New App"))));

    auto name = s.get("app.name");
    ASSERT_TRUE(is_ok(name));
    EXPECT_EQ(unwrap(name).to_display(), "New App");

    auto env = s.get("app.env");
    ASSERT_TRUE(is_ok(env));
    EXPECT_EQ(unwrap(env).to_display(), "development");
}

TEST_F(ConfigStoreTest, SetOnlyChangesTargetLine) {
    std::string before = read_text(root / "rustisan.toml");
    ASSERT_TRUE(is_ok(store().set("server.port", parse_cli_value("8080"))));
    std::string after = read_text(root / "rustisan.toml");

    std::string expected = before;
    auto pos = expected.find("port = 3000");
    ASSERT_NE(pos, std::string::npos);
    expected.replace(pos, 11, "port = 8080");
    EXPECT_EQ(after, expected);
}

TEST_F(ConfigStoreTest, SetKeepsComments) {
    write_text(root / "rustisan.toml",
               "# Blog settings\n[app]\nname = \"Blog\" # display name\nenv = \"local\"\n");
    ASSERT_TRUE(is_ok(store().set("app.env", parse_cli_value("production"))));
    EXPECT_EQ(read_text(root / "rustisan.toml"),
              "# Blog settings\n[app]\nname = \"Blog\" # display name\nenv = \"production\"\n");
}

TEST_F(ConfigStoreTest, SetCreatesMissingSection) {
    ASSERT_TRUE(is_ok(store().set("mail.driver", parse_cli_value("smtp"))));
    auto driver = store().get("mail.driver");
    ASSERT_TRUE(is_ok(driver));
    EXPECT_EQ(unwrap(driver).as_string(), "smtp");
    EXPECT_NE(read_text(root / "rustisan.toml").find("[mail]\ndriver = \"smtp\"\n"),
              std::string::npos);
}

TEST_F(ConfigStoreTest, SetThroughScalarIsTypeConflict) {
    std::string before = read_text(root / "rustisan.toml");
    auto result = store().set("app.name.first", parse_cli_value("x"));
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, cli::ErrorKind::TypeConflict);
    EXPECT_EQ(read_text(root / "rustisan.toml"), before);
}

TEST_F(ConfigStoreTest, SetMasksSensitiveValueInLog) {
    ASSERT_TRUE(is_ok(store().set("app.key", parse_cli_value("base64:secretvalue"))));
    EXPECT_TRUE(logs->contains("app.key = ********"));
    EXPECT_FALSE(logs->contains("secretvalue"));
}

TEST_F(ConfigStoreTest, MalformedFileIsConfigSyntax) {
    write_text(root / "rustisan.toml", "[app\nname = 1\n");
    auto result = store().get("app.name");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, cli::ErrorKind::ConfigSyntax);
    EXPECT_NE(unwrap_err(result).message.find("rustisan.toml"), std::string::npos);
}

TEST_F(ConfigStoreTest, MissingFileIsIoError) {
    ConfigStore missing(root / "nope.toml");
    auto result = missing.load();
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, cli::ErrorKind::IoError);
}

TEST_F(ConfigStoreTest, OverwriteRejectsInvalidToml) {
    std::string before = read_text(root / "rustisan.toml");
    auto result = store().overwrite("not toml at all");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(read_text(root / "rustisan.toml"), before);
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(ConfigStoreTest, DefaultConfigValidatesWithEmptyKeyWarning) {
    auto report = validate(parsed(default_config("Blog")));
    EXPECT_TRUE(report.ok());
    ASSERT_EQ(report.warnings.size(), 1u);
    EXPECT_EQ(report.warnings[0], "'app.key' is empty");
}

TEST_F(ConfigStoreTest, MissingRequiredKeysAreErrors) {
    auto report = validate(parsed("[app]\nname = \"x\"\n"));
    EXPECT_FALSE(report.ok());
    EXPECT_EQ(report.errors.size(), 6u);
    EXPECT_EQ(report.errors[0], "Required key 'app.env' is missing");
}

TEST_F(ConfigStoreTest, ProductionWithDebugIsError) {
    auto doc = document(default_config("Blog"));
    ASSERT_TRUE(is_ok(doc.set({"app", "env"}, TomlValue("production"))));
    ASSERT_TRUE(is_ok(doc.set({"logging", "level"}, TomlValue("debug"))));

    auto report = validate(doc.root());
    ASSERT_FALSE(report.ok());
    EXPECT_EQ(report.errors[0], "app.debug should be false in production");
    bool level_warning = false;
    for (const auto& w : report.warnings) {
        level_warning |= w.find("log level in production") != std::string::npos;
    }
    EXPECT_TRUE(level_warning);
}

TEST_F(ConfigStoreTest, ShortOrUnprefixedKeyWarns) {
    auto doc = document(default_config("Blog"));
    ASSERT_TRUE(is_ok(doc.set({"app", "key"}, TomlValue("abc"))));
    auto report = validate(doc.root());
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.warnings.size(), 2u);
}

TEST_F(ConfigStoreTest, BadPortAndDriver) {
    auto doc = document(default_config("Blog"));
    ASSERT_TRUE(is_ok(doc.set({"server", "port"}, TomlValue(70000))));
    ASSERT_TRUE(is_ok(doc.set({"database", "connections", "default", "driver"},
                              TomlValue("oracle"))));
    auto report = validate(doc.root());
    ASSERT_EQ(report.errors.size(), 1u);
    EXPECT_EQ(report.errors[0], "server.port must be between 1 and 65535");
    bool driver_warning = false;
    for (const auto& w : report.warnings) {
        driver_warning |= w == "Unsupported database driver: oracle";
    }
    EXPECT_TRUE(driver_warning);
}

TEST_F(ConfigStoreTest, NonIntegerPortIsError) {
    auto doc = document(default_config("Blog"));
    ASSERT_TRUE(is_ok(doc.set({"server", "port"}, TomlValue("3000"))));
    EXPECT_FALSE(validate(doc.root()).ok());
}

// ============================================================================
// Helpers
// ============================================================================

TEST(ConfigHelpersTest, SensitiveKeys) {
    EXPECT_TRUE(is_sensitive_key("app.key"));
    EXPECT_TRUE(is_sensitive_key("database.connections.default.password"));
    EXPECT_TRUE(is_sensitive_key("services.stripe.api-key"));
    EXPECT_TRUE(is_sensitive_key("sentry.DSN"));
    EXPECT_TRUE(is_sensitive_key("auth.token_ttl"));
    EXPECT_FALSE(is_sensitive_key("app.name"));
    EXPECT_FALSE(is_sensitive_key("cache.keys_prefix"));
}

TEST(ConfigHelpersTest, FlattenSortsAndFlagsSecrets) {
    auto doc = document("[b]\nz = 1\npassword = \"x\"\n[a]\nlist = [1, 2]\n");
    auto entries = flatten(doc.root());
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].key, "a.list");
    EXPECT_EQ(entries[0].value, "[1, 2]");
    EXPECT_EQ(entries[1].key, "b.password");
    EXPECT_TRUE(entries[1].sensitive);
    EXPECT_EQ(entries[2].key, "b.z");
    EXPECT_FALSE(entries[2].sensitive);
}

TEST(ConfigHelpersTest, Base64) {
    EXPECT_EQ(base64_encode({}), "");
    EXPECT_EQ(base64_encode({'f'}), "Zg==");
    EXPECT_EQ(base64_encode({'f', 'o'}), "Zm8=");
    EXPECT_EQ(base64_encode({'f', 'o', 'o'}), "Zm9v");
    EXPECT_EQ(base64_encode({'f', 'o', 'o', 'b', 'a', 'r'}), "Zm9vYmFy");
}

TEST(ConfigHelpersTest, GeneratedKeysAreFreshAndWellFormed) {
    std::string a = generate_app_key();
    std::string b = generate_app_key();
    EXPECT_EQ(a.rfind("base64:", 0), 0u);
    // 32 bytes encode to 44 characters
    EXPECT_EQ(a.size(), 7u + 44u);
    EXPECT_NE(a, b);
}

TEST(ConfigHelpersTest, DefaultConfigQuotesName) {
    auto doc = TomlDocument::parse(default_config("My \"Blog\""));
    ASSERT_TRUE(is_ok(doc));
    EXPECT_EQ(unwrap(doc).get({"app", "name"})->as_string(), "My \"Blog\"");
}
