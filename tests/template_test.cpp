//! # Template Tests
//!
//! Placeholder substitution, name slots and the built-in template set.

#include "generator/template.hpp"

#include <gtest/gtest.h>

using namespace rustisan::generator;

TEST(TemplateTest, SubstitutesSlots) {
    TemplateVars vars{{"class", "UserController"}, {"title", "User"}};
    EXPECT_EQ(render("pub struct {{class}}; // {{ title }}", vars),
              "pub struct UserController; // User");
}

TEST(TemplateTest, RepeatedSlots) {
    TemplateVars vars{{"name", "x"}};
    EXPECT_EQ(render("{{name}}{{name}}-{{name}}", vars), "xx-x");
}

TEST(TemplateTest, UnknownSlotIsLeftAsWritten) {
    TemplateVars vars{{"name", "x"}};
    EXPECT_EQ(render("{{ other }} {{name}}", vars), "{{ other }} x");
}

TEST(TemplateTest, UnterminatedSlotIsLeftAsWritten) {
    TemplateVars vars{{"name", "x"}};
    EXPECT_EQ(render("a {{name", vars), "a {{name");
    EXPECT_EQ(render("", vars), "");
}

TEST(TemplateTest, ReplacementIsNotRescanned) {
    TemplateVars vars{{"a", "{{b}}"}, {"b", "nope"}};
    EXPECT_EQ(render("{{a}}", vars), "{{b}}");
}

TEST(TemplateTest, NameVariables) {
    auto vars = name_variables("BlogPost");
    EXPECT_EQ(vars["name"], "BlogPost");
    EXPECT_EQ(vars["pascal"], "BlogPost");
    EXPECT_EQ(vars["snake"], "blog_post");
    EXPECT_EQ(vars["camel"], "blogPost");
    EXPECT_EQ(vars["kebab"], "blog-post");
    EXPECT_EQ(vars["title"], "Blog Post");
    EXPECT_EQ(vars["plural_snake"], "blog_posts");
    EXPECT_EQ(vars["plural_pascal"], "BlogPosts");
}

TEST(TemplateTest, RegistryReplacesByName) {
    TemplateRegistry registry;
    registry.add({"model", 1, "old"});
    registry.add({"model", 2, "new"});
    ASSERT_NE(registry.find("model"), nullptr);
    EXPECT_EQ(registry.find("model")->version, 2);
    EXPECT_EQ(registry.find("model")->text, "new");
    EXPECT_EQ(registry.find("missing"), nullptr);
    EXPECT_EQ(registry.names().size(), 1u);
}

TEST(TemplateTest, BuiltinTemplates) {
    const auto& builtin = TemplateRegistry::builtin();
    for (const char* name :
         {"controller", "controller_resource", "controller_api", "model", "middleware", "request",
          "resource", "resource_collection", "seeder", "factory", "job", "job_sync", "event",
          "listener", "listener_event", "migration", "migration_create", "migration_update",
          "policy", "command", "trait", "test_unit", "test_integration"}) {
        const Template* tmpl = builtin.find(name);
        ASSERT_NE(tmpl, nullptr) << name;
        EXPECT_FALSE(tmpl->text.empty()) << name;
        EXPECT_GE(tmpl->version, 1) << name;
    }
    EXPECT_EQ(builtin.names().size(), 23u);
}

TEST(TemplateTest, BuiltinControllerRenders) {
    TemplateVars vars = name_variables("User");
    vars["class"] = "UserController";
    std::string text = render(TemplateRegistry::builtin().find("controller")->text, vars);
    EXPECT_NE(text.find("pub struct UserController;"), std::string::npos);
    EXPECT_EQ(text.find("{{"), std::string::npos);
}
