//! # Templates
//!
//! A template is named, versioned text with `{{slot}}` placeholders.
//! Rendering replaces each known slot with its value; unknown slots are
//! copied through unchanged so a template can carry literal braces.
//!
//! ## Example
//!
//! ```cpp
//! TemplateVars vars = name_variables("BlogPost");
//! render("pub struct {{pascal}};", vars);  // pub struct BlogPost;
//! ```
//!
//! ## Name Slots
//!
//! | Slot            | `BlogPost`   |
//! |-----------------|--------------|
//! | `name`          | BlogPost     |
//! | `pascal`        | BlogPost     |
//! | `snake`         | blog_post    |
//! | `camel`         | blogPost     |
//! | `kebab`         | blog-post    |
//! | `title`         | Blog Post    |
//! | `plural_snake`  | blog_posts   |
//! | `plural_pascal` | BlogPosts    |

#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace rustisan::generator {

/// Slot name to replacement text.
using TemplateVars = std::map<std::string, std::string>;

/// A named text pattern.
struct Template {
    std::string name;
    int version = 1;
    std::string text;
};

/// Substitutes `{{slot}}` placeholders. Whitespace inside the braces is ignored.
std::string render(std::string_view text, const TemplateVars& vars);

/// The name slots for a component name.
TemplateVars name_variables(std::string_view name);

/// Read-only set of templates keyed by name.
class TemplateRegistry {
public:
    /// Adds a template, replacing one with the same name.
    void add(Template tmpl);

    /// Looks up a template by name.
    const Template* find(std::string_view name) const;

    std::vector<std::string> names() const;

    /// The component templates shipped with the CLI.
    static const TemplateRegistry& builtin();

private:
    std::map<std::string, Template, std::less<>> templates_;
};

} // namespace rustisan::generator
