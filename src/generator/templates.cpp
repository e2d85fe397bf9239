//! # Built-in Component Templates
//!
//! Rust source patterns for every `make:<kind>` template. Bump a
//! template's version when its text changes.

#include "generator/template.hpp"

namespace rustisan::generator {

namespace {

const char* const CONTROLLER = R"tpl(//! {{class}}

use rustisan_core::{Request, Response, Result};

pub struct {{class}};

impl {{class}} {
    pub fn new() -> Self {
        Self
    }

    pub async fn handle(&self, _request: Request) -> Result<Response> {
        Response::ok("{{title}}")
    }
}
)tpl";

const char* const CONTROLLER_RESOURCE = R"tpl(//! {{class}}
//!
//! Resource controller for {{model}}.

use rustisan_core::{Request, Response, Result};

use crate::models::{{model_snake}}::{{model}};

pub struct {{class}};

impl {{class}} {
    pub fn new() -> Self {
        Self
    }

    /// GET /{{model_plural_snake}}
    pub async fn index(&self) -> Result<Response> {
        let items: Vec<{{model}}> = Vec::new();
        Response::json(items)
    }

    /// GET /{{model_plural_snake}}/:id
    pub async fn show(&self, id: u64) -> Result<Response> {
        Response::json(id)
    }

    /// POST /{{model_plural_snake}}
    pub async fn store(&self, _request: Request) -> Result<Response> {
        Response::created("{{model}} created")
    }

    /// PUT /{{model_plural_snake}}/:id
    pub async fn update(&self, id: u64, _request: Request) -> Result<Response> {
        Response::json(id)
    }

    /// DELETE /{{model_plural_snake}}/:id
    pub async fn destroy(&self, _id: u64) -> Result<Response> {
        Response::no_content()
    }
}
)tpl";

const char* const CONTROLLER_API = R"tpl(//! {{class}}
//!
//! JSON API controller for {{model}}.

use rustisan_core::{Request, Response, Result};
use serde_json::json;

use crate::models::{{model_snake}}::{{model}};

pub struct {{class}};

impl {{class}} {
    pub fn new() -> Self {
        Self
    }

    pub async fn index(&self) -> Result<Response> {
        let items: Vec<{{model}}> = Vec::new();
        Response::json(json!({ "data": items }))
    }

    pub async fn show(&self, id: u64) -> Result<Response> {
        Response::json(json!({ "data": { "id": id } }))
    }

    pub async fn store(&self, _request: Request) -> Result<Response> {
        Response::created(json!({ "message": "{{model}} created" }))
    }

    pub async fn update(&self, id: u64, _request: Request) -> Result<Response> {
        Response::json(json!({ "data": { "id": id }, "message": "{{model}} updated" }))
    }

    pub async fn destroy(&self, _id: u64) -> Result<Response> {
        Response::no_content()
    }
}
)tpl";

const char* const MODEL = R"tpl(//! {{class}} model

use rustisan_core::Model;
use serde::{Deserialize, Serialize};

#[derive(Debug, Clone, Serialize, Deserialize)]
pub struct {{class}} {
    pub id: Option<u64>,
    pub created_at: Option<String>,
    pub updated_at: Option<String>,
}

impl Model for {{class}} {
    fn table_name() -> &'static str {
        "{{plural_snake}}"
    }
}
)tpl";

const char* const MIDDLEWARE = R"tpl(//! {{class}} middleware

use rustisan_core::{Middleware, Next, Request, Response, Result};

pub struct {{class}};

#[async_trait::async_trait]
impl Middleware for {{class}} {
    async fn handle(&self, request: Request, next: Next) -> Result<Response> {
        next.run(request).await
    }
}
)tpl";

const char* const REQUEST = R"tpl(//! {{class}} form request

use rustisan_core::validation::{Rules, Validate};
use serde::Deserialize;

#[derive(Debug, Deserialize)]
pub struct {{class}} {
    // Add request fields here
}

impl Validate for {{class}} {
    fn rules() -> Rules {
        Rules::new()
    }
}
)tpl";

const char* const RESOURCE = R"tpl(//! {{name}} Resource

use serde::{Deserialize, Serialize};

#[derive(Debug, Serialize, Deserialize)]
pub struct {{class}} {
    // Add your resource fields here
}

impl {{class}} {
    pub fn new() -> Self {
        Self {}
    }
}
)tpl";

const char* const RESOURCE_COLLECTION = R"tpl(//! {{name}} Resource Collection

use serde::{Deserialize, Serialize};

#[derive(Debug, Serialize, Deserialize)]
pub struct {{model}}Collection {
    pub data: Vec<{{class}}>,
}

impl {{model}}Collection {
    pub fn new(data: Vec<{{class}}>) -> Self {
        Self { data }
    }
}

#[derive(Debug, Serialize, Deserialize)]
pub struct {{class}} {
    // Add your resource fields here
}
)tpl";

const char* const SEEDER = R"tpl(//! {{class}}

use anyhow::Result;

pub struct {{class}};

impl {{class}} {
    pub async fn run() -> Result<()> {
        // Create {{model}} records here
        println!("Seeding {{model}} data...");

        Ok(())
    }
}
)tpl";

const char* const FACTORY = R"tpl(//! {{class}}

use crate::models::{{model_snake}}::{{model}};

pub struct {{class}};

impl {{class}} {
    pub fn create() -> {{model}} {
        {{model}} {
            id: None,
            created_at: None,
            updated_at: None,
        }
    }

    pub fn create_many(count: usize) -> Vec<{{model}}> {
        (0..count).map(|_| Self::create()).collect()
    }
}
)tpl";

const char* const JOB = R"tpl(//! {{class}} (queued)

use anyhow::Result;
use serde::{Deserialize, Serialize};

#[derive(Debug, Serialize, Deserialize)]
pub struct {{class}} {
    // Add job data fields here
}

impl {{class}} {
    pub fn new() -> Self {
        Self {}
    }

    pub async fn handle(&self) -> Result<()> {
        println!("Processing {{name}} job asynchronously...");

        Ok(())
    }
}
)tpl";

const char* const JOB_SYNC = R"tpl(//! {{class}} (synchronous)

use anyhow::Result;
use serde::{Deserialize, Serialize};

#[derive(Debug, Serialize, Deserialize)]
pub struct {{class}} {
    // Add job data fields here
}

impl {{class}} {
    pub fn new() -> Self {
        Self {}
    }

    pub fn handle(&self) -> Result<()> {
        println!("Processing {{name}} job synchronously...");

        Ok(())
    }
}
)tpl";

const char* const EVENT = R"tpl(//! {{class}} event

use serde::{Deserialize, Serialize};

#[derive(Debug, Clone, Serialize, Deserialize)]
pub struct {{class}} {
    // Add event payload fields here
}

impl {{class}} {
    pub fn new() -> Self {
        Self {}
    }
}
)tpl";

const char* const LISTENER = R"tpl(//! {{class}}

use anyhow::Result;

pub struct {{class}};

impl {{class}} {
    pub async fn handle(&self) -> Result<()> {
        Ok(())
    }
}
)tpl";

const char* const LISTENER_EVENT = R"tpl(//! {{class}}
//!
//! Handles {{event}}.

use anyhow::Result;

use crate::events::{{event_snake}}::{{event}};

pub struct {{class}};

impl {{class}} {
    pub async fn handle(&self, event: &{{event}}) -> Result<()> {
        let _ = event;
        Ok(())
    }
}
)tpl";

const char* const MIGRATION = R"tpl(//! Migration: {{name}}
//! Generated by rustisan at {{timestamp}}

use anyhow::Result;
use rustisan_core::database::Schema;
use rustisan_core::Migration;

pub struct {{pascal}};

impl Migration for {{pascal}} {
    fn up(&self, schema: &mut Schema) -> Result<()> {
        let _ = schema;
        Ok(())
    }

    fn down(&self, schema: &mut Schema) -> Result<()> {
        let _ = schema;
        Ok(())
    }
}
)tpl";

const char* const MIGRATION_CREATE = R"tpl(//! Migration: {{name}}
//! Generated by rustisan at {{timestamp}}

use anyhow::Result;
use rustisan_core::database::{Blueprint, Schema};
use rustisan_core::Migration;

pub struct {{pascal}};

impl Migration for {{pascal}} {
    fn up(&self, schema: &mut Schema) -> Result<()> {
        schema.create("{{table}}", |table: &mut Blueprint| {
            table.id();
            table.timestamps();
        })
    }

    fn down(&self, schema: &mut Schema) -> Result<()> {
        schema.drop_if_exists("{{table}}")
    }
}
)tpl";

const char* const MIGRATION_UPDATE = R"tpl(//! Migration: {{name}}
//! Generated by rustisan at {{timestamp}}

use anyhow::Result;
use rustisan_core::database::{Blueprint, Schema};
use rustisan_core::Migration;

pub struct {{pascal}};

impl Migration for {{pascal}} {
    fn up(&self, schema: &mut Schema) -> Result<()> {
        schema.table("{{table}}", |table: &mut Blueprint| {
            let _ = table;
        })
    }

    fn down(&self, schema: &mut Schema) -> Result<()> {
        schema.table("{{table}}", |table: &mut Blueprint| {
            let _ = table;
        })
    }
}
)tpl";

const char* const POLICY = R"tpl(//! {{class}}

use crate::models::{{model_snake}}::{{model}};

pub struct {{class}};

impl {{class}} {
    pub fn view(&self, _item: &{{model}}) -> bool {
        true
    }

    pub fn create(&self) -> bool {
        true
    }

    pub fn update(&self, _item: &{{model}}) -> bool {
        true
    }

    pub fn delete(&self, _item: &{{model}}) -> bool {
        true
    }
}
)tpl";

const char* const COMMAND = R"tpl(//! {{class}}

use anyhow::Result;
use clap::Parser;

#[derive(Parser)]
#[command(name = "{{kebab}}")]
pub struct {{class}} {
    // Add command arguments here
}

impl {{class}} {
    pub async fn execute(self) -> Result<()> {
        println!("Executing {{name}} command...");

        Ok(())
    }
}
)tpl";

const char* const TRAIT = R"tpl(//! {{class}} trait
//!
//! This trait defines the interface for {{snake}}.

use async_trait::async_trait;
use rustisan_core::Result;

#[async_trait]
pub trait {{class}} {
    async fn handle(&self) -> Result<()>;
}
)tpl";

const char* const TEST_UNIT = R"tpl(//! Unit tests: {{title}}

#[cfg(test)]
mod {{snake}} {
    #[test]
    fn it_works() {
        assert_eq!(2 + 2, 4);
    }
}
)tpl";

const char* const TEST_INTEGRATION = R"tpl(//! Integration tests: {{title}}

#[tokio::test]
async fn {{snake}}_works() {
    assert!(true);
}
)tpl";

TemplateRegistry make_builtin() {
    TemplateRegistry registry;
    registry.add({"controller", 1, CONTROLLER});
    registry.add({"controller_resource", 1, CONTROLLER_RESOURCE});
    registry.add({"controller_api", 1, CONTROLLER_API});
    registry.add({"model", 1, MODEL});
    registry.add({"middleware", 1, MIDDLEWARE});
    registry.add({"request", 1, REQUEST});
    registry.add({"resource", 1, RESOURCE});
    registry.add({"resource_collection", 1, RESOURCE_COLLECTION});
    registry.add({"seeder", 1, SEEDER});
    registry.add({"factory", 1, FACTORY});
    registry.add({"job", 1, JOB});
    registry.add({"job_sync", 1, JOB_SYNC});
    registry.add({"event", 1, EVENT});
    registry.add({"listener", 1, LISTENER});
    registry.add({"listener_event", 1, LISTENER_EVENT});
    registry.add({"migration", 1, MIGRATION});
    registry.add({"migration_create", 1, MIGRATION_CREATE});
    registry.add({"migration_update", 1, MIGRATION_UPDATE});
    registry.add({"policy", 1, POLICY});
    registry.add({"command", 1, COMMAND});
    registry.add({"trait", 1, TRAIT});
    registry.add({"test_unit", 1, TEST_UNIT});
    registry.add({"test_integration", 1, TEST_INTEGRATION});
    return registry;
}

} // namespace

const TemplateRegistry& TemplateRegistry::builtin() {
    static const TemplateRegistry registry = make_builtin();
    return registry;
}

} // namespace rustisan::generator
