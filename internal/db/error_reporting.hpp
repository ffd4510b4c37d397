#pragma once

#include <functional>
#include <string>
#include <string_view>

#include "internal/db/api/result.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"

namespace schemadb::db {

// Receives a location tag (e.g. "updateColumn") and the engine error.
using ErrorCallback = std::function<void(const std::string& location, const sqlite::EngineError& error)>;

/*
  Logs the failure, forwards it to the callback (if any) and returns the
  500 envelope callers hand back.
*/
Result ReportEngineError(const ErrorCallback& callback, std::string_view location, const sqlite::EngineError& error);

} // namespace schemadb::db
