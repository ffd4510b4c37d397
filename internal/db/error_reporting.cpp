#include "internal/db/error_reporting.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace schemadb::db {

Result ReportEngineError(const ErrorCallback& callback, std::string_view location, const sqlite::EngineError& error) {
  SCHEMADB_LOG_ERROR("engine error",
                     {observability::StringField("location", location),
                      observability::IntField("sqlite_code", error.Code()),
                      observability::StringField("error", error.what())});

  if (callback) {
    try {
      callback(std::string(location), error);
    } catch (const std::exception& e) {
      SCHEMADB_LOG_WARN("error callback threw", {observability::StringField("error", e.what())});
    }
  }

  return Result::Err(StatusCode::InternalError, error.what());
}

} // namespace schemadb::db
