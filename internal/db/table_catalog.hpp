#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/error_reporting.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/model/schema.hpp"
#include "internal/model/value.hpp"

namespace schemadb::db {

// PRAGMA table_info for `table`; empty when the table does not exist. Throws sqlite::EngineError.
std::vector<model::ColumnInfo> ReadColumnInfo(sqlite::SqliteDB& db, const std::string& table);

// Physical column layout for a declared column.
model::ColumnInfo ToColumnInfo(const model::ColumnDefinition& column);

/*
  Physical schema introspection and DDL primitives.

  Result codes follow the row store: 404 when the object to act on is
  missing, 409 when a rename target already exists, 500 on engine errors.
*/
class TableCatalog {
 public:
  TableCatalog(std::shared_ptr<sqlite::SqliteDB> db, ErrorCallback on_error);

  Result TableExists(const std::string& table);

  // rows: one {name} row per user table (sqlite_* internals excluded)
  Result ListTables();

  // info: PRAGMA table_info
  Result TableInfo(const std::string& table);

  Result ColumnExists(const std::string& table, const std::string& column);

  Result CreateTable(const std::string& table, const std::vector<model::ColumnInfo>& columns);
  Result DropTable(const std::string& table);
  Result RenameTable(const std::string& from, const std::string& to);

  // Adds the column and back-fills `default_value` into existing rows.
  Result AddColumn(const std::string& table, const std::string& column, model::ColumnType type,
                   const std::optional<model::Value>& default_value);

  Result RenameColumn(const std::string& table, const std::string& from, const std::string& to);

  // Native DROP COLUMN where the engine supports it, table rebuild otherwise.
  Result DropColumn(const std::string& table, const std::string& column);

  /*
    Recreates `table` with exactly `columns`, in that order, copying every
    row through a column-projected INSERT ... SELECT. Create, copy, drop and
    rename run in one savepoint, so a failure or crash leaves the original.
  */
  Result RebuildTable(const std::string& table, const std::vector<model::ColumnInfo>& columns);

  static bool SupportsNativeDropColumn();

 private:
  void RebuildInSavepoint(const std::string& table, const std::vector<model::ColumnInfo>& columns);

  std::shared_ptr<sqlite::SqliteDB> db_;
  ErrorCallback                     on_error_;
};

} // namespace schemadb::db
