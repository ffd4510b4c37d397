#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "internal/db/api/result.hpp"
#include "internal/db/error_reporting.hpp"
#include "internal/db/row_store.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/table_catalog.hpp"
#include "internal/maintenance/maintenance.hpp"
#include "internal/maintenance/maintenance_scheduler.hpp"
#include "internal/migration/migrator.hpp"
#include "internal/model/schema.hpp"
#include "internal/orm/model.hpp"

namespace schemadb::core {

struct DatabaseOptions {
  std::string       path;
  db::ErrorCallback on_error;

  bool delete_unused = false;
  bool reorder       = false;

  model::Schema schema;

  // empty: <dir>/<stem>.db.bak next to `path`
  std::string               backup_path;
  bool                      backup_enabled = false;
  std::chrono::milliseconds backup_interval{std::chrono::hours(1)};
  bool                      vacuum_enabled = false;
  std::chrono::milliseconds vacuum_interval{std::chrono::hours(24 * 7)};
};

enum class DatabaseState {
  Constructed,
  Opening,
  Ready,
  Closing,
  Closed,
  Failed,
};

const char* ToString(DatabaseState state);

std::string DefaultBackupPath(const std::string& path);

/*
  Open/close lifecycle around one SQLite file.

    Constructed -> Opening -> Ready -> Closing -> Closed
                      |
                      +-> Failed

  Open() runs the migration and starts the maintenance timers; models are
  usable only while Ready. Close() stops the timers, writes one final
  backup and releases the handle. Both states Closed and Failed are
  terminal.
*/
class Database {
 public:
  explicit Database(DatabaseOptions options);
  ~Database();

  Database(const Database&)            = delete;
  Database& operator=(const Database&) = delete;

  db::Result Open();
  db::Result Close();

  DatabaseState State() const;

  // Throws util::InvalidState unless Ready, util::ConfigurationError for an
  // undeclared table.
  orm::Model& Table(std::string_view name);

  db::Result Backup(const std::optional<std::string>& destination = std::nullopt);
  db::Result Vacuum();

  db::RowStore&                     Rows();
  db::TableCatalog&                 Catalog();
  const migration::MigrationReport& LastMigration() const {
    return last_migration_;
  }

  const DatabaseOptions& Options() const {
    return options_;
  }

 private:
  void       SetState(DatabaseState state);
  db::Result Fail(db::Result result);
  void       RequireReady(std::string_view operation) const;
  void       ReleaseHandle();

  DatabaseOptions options_;

  mutable std::mutex mutex_;
  DatabaseState      state_ = DatabaseState::Constructed;

  std::shared_ptr<db::sqlite::SqliteDB>              handle_;
  std::shared_ptr<db::RowStore>                      rows_;
  std::unique_ptr<db::TableCatalog>                  catalog_;
  std::unique_ptr<maintenance::Maintenance>          maintenance_;
  std::unique_ptr<maintenance::MaintenanceScheduler> scheduler_;
  std::map<std::string, std::unique_ptr<orm::Model>, std::less<>> models_;

  migration::MigrationReport last_migration_;
};

} // namespace schemadb::core
