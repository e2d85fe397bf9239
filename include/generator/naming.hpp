//! # Name Casing
//!
//! Converts component names between the casings templates need.
//! Words are split on `_`, `-`, spaces and case changes, so `UserProfile`,
//! `user_profile` and `user-profile` all produce the same words.
//!
//! | Function        | `UserProfile` | `HTTPServer`  |
//! |-----------------|---------------|---------------|
//! | `to_snake()`    | user_profile  | http_server   |
//! | `to_pascal()`   | UserProfile   | HttpServer    |
//! | `to_camel()`    | userProfile   | httpServer    |
//! | `to_kebab()`    | user-profile  | http-server   |
//! | `to_title()`    | User Profile  | Http Server   |

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace rustisan::generator {

/// Splits a name into lowercase words.
std::vector<std::string> split_words(std::string_view name);

std::string to_snake(std::string_view name);
std::string to_pascal(std::string_view name);
std::string to_camel(std::string_view name);
std::string to_kebab(std::string_view name);
std::string to_title(std::string_view name);

/// English plural of a single word (`city` -> `cities`, `box` -> `boxes`).
std::string pluralize(std::string_view word);

/// Inverse of `pluralize()` for the same rule set.
std::string singularize(std::string_view word);

/// Pluralizes only the last word of a snake_case name (`blog_post` -> `blog_posts`).
std::string pluralize_snake(std::string_view snake);

/// A letter or `_` followed by letters, digits or `_`.
bool is_valid_identifier(std::string_view name);

/// A Cargo package name: a letter followed by letters, digits, `_` or `-`.
bool is_valid_package_name(std::string_view name);

/// Removes `suffix` from the end of `name` when something remains before it.
std::string strip_suffix(std::string_view name, std::string_view suffix);

} // namespace rustisan::generator
