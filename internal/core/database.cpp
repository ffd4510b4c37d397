#include "internal/core/database.hpp"

#include <exception>
#include <filesystem>
#include <system_error>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace schemadb::core {

using db::Result;
using db::StatusCode;
using observability::IntField;
using observability::StringField;

const char* ToString(DatabaseState state) {
  switch (state) {
    case DatabaseState::Constructed:
      return "constructed";
    case DatabaseState::Opening:
      return "opening";
    case DatabaseState::Ready:
      return "ready";
    case DatabaseState::Closing:
      return "closing";
    case DatabaseState::Closed:
      return "closed";
    case DatabaseState::Failed:
      return "failed";
  }
  return "unknown";
}

std::string DefaultBackupPath(const std::string& path) {
  const std::filesystem::path p(path);
  return (p.parent_path() / (p.stem().string() + ".db.bak")).string();
}

Database::Database(DatabaseOptions options) : options_(std::move(options)) {
  if (options_.path.empty()) {
    throw util::ConfigurationError("database path is required");
  }
  if (options_.backup_path.empty()) {
    options_.backup_path = DefaultBackupPath(options_.path);
  }
  if (options_.backup_enabled && options_.backup_interval.count() <= 0) {
    throw util::ConfigurationError("backup interval must be positive");
  }
  if (options_.vacuum_enabled && options_.vacuum_interval.count() <= 0) {
    throw util::ConfigurationError("vacuum interval must be positive");
  }
}

Database::~Database() {
  if (State() == DatabaseState::Ready) {
    Result r = Close();
    if (!r.Succeeded()) {
      SCHEMADB_LOG_WARN("close on destruction failed", {StringField("error", r.message)});
    }
  } else {
    ReleaseHandle();
  }
}

DatabaseState Database::State() const {
  std::lock_guard lock(mutex_);
  return state_;
}

void Database::SetState(DatabaseState state) {
  {
    std::lock_guard lock(mutex_);
    state_ = state;
  }
  SCHEMADB_LOG_DEBUG("database state", {StringField("path", options_.path), StringField("state", ToString(state))});
}

Result Database::Fail(Result result) {
  scheduler_.reset();
  models_.clear();
  ReleaseHandle();
  SetState(DatabaseState::Failed);
  SCHEMADB_LOG_ERROR("database open failed", {StringField("path", options_.path), StringField("error", result.message)});
  return result;
}

Result Database::Open() {
  {
    std::lock_guard lock(mutex_);
    if (state_ != DatabaseState::Constructed) {
      return Result::Err(StatusCode::Conflict, std::string("open: database is ") + ToString(state_));
    }
    state_ = DatabaseState::Opening;
  }

  const std::filesystem::path file(options_.path);
  if (file.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(file.parent_path(), ec);
    if (ec) {
      return Fail(Result::Err(StatusCode::InternalError, "create database directory: " + ec.message()));
    }
  }

  try {
    handle_ = std::make_shared<db::sqlite::SqliteDB>(options_.path);
  } catch (const db::sqlite::EngineError& e) {
    return Fail(db::ReportEngineError(options_.on_error, "open", e));
  }

  rows_        = std::make_shared<db::RowStore>(handle_, options_.on_error);
  catalog_     = std::make_unique<db::TableCatalog>(handle_, options_.on_error);
  maintenance_ = std::make_unique<maintenance::Maintenance>(handle_, options_.backup_path, options_.on_error);

  try {
    migration::Migrator migrator(*catalog_, {options_.delete_unused, options_.reorder});
    Result migrated = migrator.Run(options_.schema);
    last_migration_ = migrator.Report();
    if (!migrated.Succeeded()) {
      return Fail(std::move(migrated));
    }

    for (const auto& table : options_.schema.Tables()) {
      models_.emplace(table.Name(), std::make_unique<orm::Model>(table, rows_));
    }

    maintenance::ScheduleOptions schedule;
    schedule.backup_enabled  = options_.backup_enabled;
    schedule.backup_interval = options_.backup_interval;
    schedule.vacuum_enabled  = options_.vacuum_enabled;
    schedule.vacuum_interval = options_.vacuum_interval;
    scheduler_               = std::make_unique<maintenance::MaintenanceScheduler>(*maintenance_, schedule);
    scheduler_->Start();
  } catch (const std::exception& e) {
    // never left in Opening
    return Fail(Result::Err(StatusCode::InternalError, e.what()));
  }

  SetState(DatabaseState::Ready);
  SCHEMADB_LOG_INFO("database ready", {StringField("path", options_.path),
                                       IntField("tables", static_cast<std::int64_t>(models_.size())),
                                       IntField("migration_changes", last_migration_.TotalChanges())});

  Result r = Result::Ok();
  r.changes = last_migration_.TotalChanges();
  return r;
}

Result Database::Close() {
  {
    std::lock_guard lock(mutex_);
    if (state_ != DatabaseState::Ready) {
      return Result::Err(StatusCode::Conflict, std::string("close: database is ") + ToString(state_));
    }
    state_ = DatabaseState::Closing;
  }

  if (scheduler_) scheduler_->Stop();

  Result backup = maintenance_->Backup();
  if (!backup.status) {
    SCHEMADB_LOG_WARN("final backup failed", {IntField("code", db::ToInt(backup.code)), StringField("error", backup.message)});
  }

  scheduler_.reset();
  models_.clear();

  Result r = Result::Ok();
  try {
    handle_->Close();
  } catch (const db::sqlite::EngineError& e) {
    r = db::ReportEngineError(options_.on_error, "close", e);
  }
  ReleaseHandle();

  SetState(DatabaseState::Closed);
  SCHEMADB_LOG_INFO("database closed", {StringField("path", options_.path)});
  return r;
}

void Database::ReleaseHandle() {
  maintenance_.reset();
  catalog_.reset();
  rows_.reset();
  handle_.reset();
}

void Database::RequireReady(std::string_view operation) const {
  DatabaseState state = State();
  if (state != DatabaseState::Ready) {
    throw util::InvalidState(std::string(operation) + ": database is " + ToString(state));
  }
}

orm::Model& Database::Table(std::string_view name) {
  RequireReady("table");
  auto it = models_.find(name);
  if (it == models_.end()) {
    throw util::ConfigurationError("table '" + std::string(name) + "' is not declared");
  }
  return *it->second;
}

Result Database::Backup(const std::optional<std::string>& destination) {
  RequireReady("backup");
  return maintenance_->Backup(destination);
}

Result Database::Vacuum() {
  RequireReady("vacuum");
  return maintenance_->Vacuum();
}

db::RowStore& Database::Rows() {
  RequireReady("rows");
  return *rows_;
}

db::TableCatalog& Database::Catalog() {
  RequireReady("catalog");
  return *catalog_;
}

} // namespace schemadb::core
