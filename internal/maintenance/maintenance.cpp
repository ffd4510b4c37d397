#include "internal/maintenance/maintenance.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/observability/logging.hpp"

namespace schemadb::maintenance {

using db::Result;
using db::StatusCode;
using observability::StringField;

Maintenance::Maintenance(std::shared_ptr<db::sqlite::SqliteDB> db, std::string backup_path, db::ErrorCallback on_error)
    : db_(std::move(db)), backup_path_(std::move(backup_path)), on_error_(std::move(on_error)) {
}

Result Maintenance::Backup(const std::optional<std::string>& destination) {
  auto token = guard_.TryAcquire();
  if (!token) {
    return Result::Err(StatusCode::Busy, "maintenance already running");
  }

  const std::filesystem::path target = destination.value_or(backup_path_);

  std::error_code ec;
  if (target.has_parent_path()) {
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
      SCHEMADB_LOG_ERROR("backup directory unavailable", {StringField("path", target.string()), StringField("error", ec.message())});
      return Result::Err(StatusCode::InternalError, "create backup directory: " + ec.message());
    }
  }

  const bool replaced = std::filesystem::remove(target, ec);
  if (ec) {
    SCHEMADB_LOG_ERROR("stale backup could not be removed", {StringField("path", target.string()), StringField("error", ec.message())});
    return Result::Err(StatusCode::InternalError, "remove stale backup: " + ec.message());
  }

  try {
    db_->BackupTo(target.string());
  } catch (const db::sqlite::EngineError& e) {
    return db::ReportEngineError(on_error_, "backup", e);
  }

  SCHEMADB_LOG_INFO("backup written", {StringField("path", target.string()), observability::BoolField("replaced", replaced)});

  Result r = Result::Ok();
  if (!replaced) {
    r.code    = StatusCode::NoExistingBackup;
    r.message = "no previous backup at " + target.string();
  }
  return r;
}

Result Maintenance::Vacuum() {
  auto token = guard_.TryAcquire();
  if (!token) {
    return Result::Err(StatusCode::Busy, "maintenance already running");
  }

  try {
    db_->Exec(db::sql::VACUUM);
  } catch (const db::sqlite::EngineError& e) {
    return db::ReportEngineError(on_error_, "vacuum", e);
  }

  SCHEMADB_LOG_INFO("vacuum complete", {StringField("path", db_->Path())});
  return Result::Ok();
}

} // namespace schemadb::maintenance
