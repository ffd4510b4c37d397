#pragma once

#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/db/error_reporting.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/maintenance/maintenance_guard.hpp"

namespace schemadb::maintenance {

/*
  Backup and vacuum on the shared handle, serialized by MaintenanceGuard.
*/
class Maintenance {
 public:
  Maintenance(std::shared_ptr<db::sqlite::SqliteDB> db, std::string backup_path, db::ErrorCallback on_error);

  /*
    Point-in-time snapshot of the live database at `destination` (default:
    the configured backup path).

      429              another backup/vacuum is running; nothing touched
      NoExistingBackup snapshot written, there was no previous file to replace
      200              snapshot written over the previous one
      500              filesystem or engine failure
  */
  db::Result Backup(const std::optional<std::string>& destination = std::nullopt);

  // VACUUM; 429 while a backup is running.
  db::Result Vacuum();

  MaintenanceGuard& Guard() {
    return guard_;
  }

  const std::string& BackupPath() const {
    return backup_path_;
  }

 private:
  std::shared_ptr<db::sqlite::SqliteDB> db_;
  std::string                           backup_path_;
  db::ErrorCallback                     on_error_;
  MaintenanceGuard                      guard_;
};

} // namespace schemadb::maintenance
