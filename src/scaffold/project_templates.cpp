//! # Built-in Project Templates
//!
//! File contents for `rustisan new --template web|api|minimal`. Every
//! file is rendered with the slots from `project_variables()`.

#include "config/config_store.hpp"
#include "generator/layout.hpp"
#include "generator/naming.hpp"
#include "scaffold/scaffolder.hpp"

#include "common.hpp"

#include <map>

namespace rustisan::scaffold {

namespace {

const char* const CARGO_TOML = R"tpl([package]
name = "{{package}}"
version = "0.1.0"
edition = "2024"
description = "A Rustisan web application"

[dependencies]
rustisan-core = "0.0.1"
tokio = { version = "1.0", features = ["full"] }
serde = { version = "1.0", features = ["derive"] }
serde_json = "1.0"
anyhow = "1.0"
tracing = "0.1"

[dev-dependencies]
tokio-test = "0.4"

[[bin]]
name = "{{package}}"
path = "src/main.rs"
)tpl";

const char* const GITIGNORE = R"tpl(# Rust
/target/
Cargo.lock

# IDE
.vscode/
.idea/
*.swp
*~

# OS
.DS_Store
Thumbs.db

# Logs
*.log

# Database
*.db
*.sqlite
*.sqlite3

# Storage
storage/cache/
storage/sessions/
storage/logs/
bootstrap/cache/

# Build artifacts
dist/
)tpl";

const char* const README = R"tpl(# {{title}}

A web application built with Rustisan.

## Getting Started

```bash
rustisan config:generate-key   # generate the application key
rustisan migrate               # run database migrations
rustisan serve                 # start the development server
```

The application listens on `http://localhost:3000` by default. Settings
live in `rustisan.toml`.

## Generators

```bash
rustisan make:controller UserController --resource
rustisan make:model User --migration --factory --seeder
rustisan make:migration create_posts_table
```

Generated with rustisan {{cli_version}}.
)tpl";

const char* const MAIN_WEB = R"tpl(//! {{title}}

mod controllers;
mod events;
mod jobs;
mod listeners;
mod middleware;
mod models;
mod requests;
mod resources;
mod services;

#[path = "../routes/web.rs"]
mod routes;

use rustisan_core::{app::Application, Result};

#[tokio::main]
async fn main() -> Result<()> {
    let mut app = Application::from_config("rustisan.toml").await?;
    routes::register(app.router()).await?;
    app.serve().await
}
)tpl";

const char* const MAIN_API = R"tpl(//! {{title}} API

mod controllers;
mod events;
mod jobs;
mod listeners;
mod middleware;
mod models;
mod requests;
mod resources;
mod services;

#[path = "../routes/api.rs"]
mod routes;

use rustisan_core::{app::Application, Result};

#[tokio::main]
async fn main() -> Result<()> {
    let mut app = Application::from_config("rustisan.toml").await?;
    app.router().group("/api/v1", routes::register);
    app.serve().await
}
)tpl";

const char* const MAIN_MINIMAL = R"tpl(//! {{title}}

use rustisan_core::{app::Application, routing::Router, Response, Result};

#[tokio::main]
async fn main() -> Result<()> {
    let mut app = Application::from_config("rustisan.toml").await?;
    let router: &mut Router = app.router();
    router.get("/", || async { Response::ok("Hello from {{title}}") });
    app.serve().await
}
)tpl";

const char* const ROUTES_WEB = R"tpl(//! Web routes

use rustisan_core::{routing::Router, Response, Result};

pub async fn register(router: &mut Router) -> Result<()> {
    router.get("/", || async { Response::view("welcome") });
    router.get("/health", || async { Response::ok("ok") });
    Ok(())
}
)tpl";

const char* const ROUTES_API = R"tpl(//! API routes, mounted under /api/v1

use rustisan_core::{routing::RouteGroup, Response};
use serde_json::json;

pub fn register(group: &mut RouteGroup) {
    group.get("/status", || async {
        Response::json(json!({ "name": "{{title}}", "status": "active" }))
    });
}
)tpl";

const char* const WELCOME_VIEW = R"tpl(<!DOCTYPE html>
<html lang="en">
<head>
    <meta charset="utf-8">
    <title>{{title}}</title>
</head>
<body>
    <h1>{{title}}</h1>
    <p>Your Rustisan application is running.</p>
</body>
</html>
)tpl";

const char* const TEST_MINIMAL = R"tpl(//! Smoke test for {{title}}

#[test]
fn it_builds() {
    assert!(true);
}
)tpl";

const std::map<std::string, std::string>& module_docs() {
    static const std::map<std::string, std::string> docs = {
        {"controllers", "//! Application controllers\n"},
        {"models", "//! Application models\n"},
        {"middleware", "//! Application middleware\n"},
        {"requests", "//! Form request validators\n"},
        {"resources", "//! API resources\n"},
        {"services", "//! Application services\n"},
        {"jobs", "//! Background jobs\n"},
        {"events", "//! Application events\n"},
        {"listeners", "//! Event listeners\n"},
    };
    return docs;
}

void add_common_files(ProjectTemplate& tmpl, const generator::TemplateVars& vars) {
    tmpl.files.push_back({"Cargo.toml", generator::render(CARGO_TOML, vars)});
    tmpl.files.push_back({CONFIG_FILE_NAME, config::default_config(vars.at("title"))});
    tmpl.files.push_back({".gitignore", GITIGNORE});
    tmpl.files.push_back({"README.md", generator::render(README, vars)});
}

void add_full_layout(ProjectTemplate& tmpl, bool with_views) {
    for (const auto& dir : generator::ProjectLayout::project_directories()) {
        if (!with_views && dir.rfind("resources/", 0) == 0) {
            continue;
        }
        tmpl.directories.push_back(dir);
    }
    for (const auto& module : generator::ProjectLayout::module_directories()) {
        tmpl.files.push_back({"src/" + module + "/mod.rs", module_docs().at(module)});
    }
}

} // namespace

const std::vector<std::string>& builtin_template_names() {
    static const std::vector<std::string> names = {"web", "api", "minimal"};
    return names;
}

generator::TemplateVars project_variables(const std::string& name) {
    generator::TemplateVars vars = generator::name_variables(name);
    vars["package"] = name;
    vars["cli_version"] = VERSION;
    return vars;
}

std::optional<ProjectTemplate> builtin_template(std::string_view name,
                                                const generator::TemplateVars& vars) {
    ProjectTemplate tmpl;
    tmpl.name = std::string(name);

    if (name == "web") {
        add_common_files(tmpl, vars);
        add_full_layout(tmpl, true);
        tmpl.files.push_back({"src/main.rs", generator::render(MAIN_WEB, vars)});
        tmpl.files.push_back({"routes/web.rs", generator::render(ROUTES_WEB, vars)});
        tmpl.files.push_back(
            {"resources/views/welcome.html", generator::render(WELCOME_VIEW, vars)});
        return tmpl;
    }
    if (name == "api") {
        add_common_files(tmpl, vars);
        add_full_layout(tmpl, false);
        tmpl.files.push_back({"src/main.rs", generator::render(MAIN_API, vars)});
        tmpl.files.push_back({"routes/api.rs", generator::render(ROUTES_API, vars)});
        return tmpl;
    }
    if (name == "minimal") {
        add_common_files(tmpl, vars);
        tmpl.directories = {"src", "tests"};
        tmpl.files.push_back({"src/main.rs", generator::render(MAIN_MINIMAL, vars)});
        tmpl.files.push_back({"tests/smoke.rs", generator::render(TEST_MINIMAL, vars)});
        return tmpl;
    }
    return std::nullopt;
}

} // namespace rustisan::scaffold
