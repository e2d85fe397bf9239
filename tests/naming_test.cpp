//! # Naming Tests
//!
//! Case conversion, pluralization and name validation.

#include "generator/naming.hpp"

#include <gtest/gtest.h>

using namespace rustisan::generator;

TEST(NamingTest, SplitWords) {
    EXPECT_EQ(split_words("userName"), (std::vector<std::string>{"user", "name"}));
    EXPECT_EQ(split_words("UserProfile"), (std::vector<std::string>{"user", "profile"}));
    EXPECT_EQ(split_words("user_profile"), (std::vector<std::string>{"user", "profile"}));
    EXPECT_EQ(split_words("user-profile page"),
              (std::vector<std::string>{"user", "profile", "page"}));
    EXPECT_EQ(split_words("HTTPServer"), (std::vector<std::string>{"http", "server"}));
    EXPECT_EQ(split_words("Version2Upgrade"), (std::vector<std::string>{"version2", "upgrade"}));
    EXPECT_TRUE(split_words("__").empty());
}

TEST(NamingTest, CaseConversions) {
    EXPECT_EQ(to_snake("BlogPost"), "blog_post");
    EXPECT_EQ(to_snake("blog_post"), "blog_post");
    EXPECT_EQ(to_pascal("blog_post"), "BlogPost");
    EXPECT_EQ(to_pascal("BlogPost"), "BlogPost");
    EXPECT_EQ(to_camel("user_profile"), "userProfile");
    EXPECT_EQ(to_kebab("UserProfile"), "user-profile");
    EXPECT_EQ(to_title("user_profile"), "User Profile");
    EXPECT_EQ(to_snake(""), "");
}

TEST(NamingTest, Pluralize) {
    EXPECT_EQ(pluralize("user"), "users");
    EXPECT_EQ(pluralize("city"), "cities");
    EXPECT_EQ(pluralize("category"), "categories");
    EXPECT_EQ(pluralize("day"), "days");
    EXPECT_EQ(pluralize("box"), "boxes");
    EXPECT_EQ(pluralize("status"), "statuses");
    EXPECT_EQ(pluralize("match"), "matches");
    EXPECT_EQ(pluralize("knife"), "knives");
    EXPECT_EQ(pluralize("leaf"), "leaves");
    EXPECT_EQ(pluralize(""), "");
}

TEST(NamingTest, Singularize) {
    EXPECT_EQ(singularize("users"), "user");
    EXPECT_EQ(singularize("cities"), "city");
    EXPECT_EQ(singularize("boxes"), "box");
    EXPECT_EQ(singularize("statuses"), "status");
    EXPECT_EQ(singularize("addresses"), "address");
    EXPECT_EQ(singularize("knives"), "knife");
    EXPECT_EQ(singularize("leaves"), "leaf");
    EXPECT_EQ(singularize("status"), "status");
    EXPECT_EQ(singularize("analysis"), "analysis");
    EXPECT_EQ(singularize("Posts"), "Post");
}

TEST(NamingTest, PluralizeSnakeOnlyTouchesLastWord) {
    EXPECT_EQ(pluralize_snake("blog_post"), "blog_posts");
    EXPECT_EQ(pluralize_snake("user_category"), "user_categories");
    EXPECT_EQ(pluralize_snake("user"), "users");
}

TEST(NamingTest, ValidIdentifiers) {
    EXPECT_TRUE(is_valid_identifier("User"));
    EXPECT_TRUE(is_valid_identifier("_user"));
    EXPECT_TRUE(is_valid_identifier("user_2"));
    EXPECT_FALSE(is_valid_identifier(""));
    EXPECT_FALSE(is_valid_identifier("_"));
    EXPECT_FALSE(is_valid_identifier("1user"));
    EXPECT_FALSE(is_valid_identifier("user-name"));
    EXPECT_FALSE(is_valid_identifier("../User"));
}

TEST(NamingTest, ValidPackageNames) {
    EXPECT_TRUE(is_valid_package_name("blog"));
    EXPECT_TRUE(is_valid_package_name("my-blog_2"));
    EXPECT_FALSE(is_valid_package_name(""));
    EXPECT_FALSE(is_valid_package_name("1blog"));
    EXPECT_FALSE(is_valid_package_name("-blog"));
    EXPECT_FALSE(is_valid_package_name("my blog"));
    EXPECT_FALSE(is_valid_package_name("my/blog"));
}

TEST(NamingTest, StripSuffix) {
    EXPECT_EQ(strip_suffix("UserController", "Controller"), "User");
    EXPECT_EQ(strip_suffix("Controller", "Controller"), "Controller");
    EXPECT_EQ(strip_suffix("User", "Controller"), "User");
}
