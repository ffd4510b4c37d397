#pragma once

#include "config/config.pb.h"
#include "internal/core/database.hpp"
#include "internal/model/schema.hpp"

namespace schemadb::config {

// Validated Schema from the `schema` section; util::ConfigurationError on
// unknown column types, bad identifiers or non-scalar defaults.
model::Schema BuildSchema(const schemadb::runtime::config::SchemaConfig& config);

// DatabaseOptions for core::Database. The error callback is left unset.
core::DatabaseOptions BuildDatabaseOptions(const schemadb::runtime::config::RuntimeConfig& config);

} // namespace schemadb::config
