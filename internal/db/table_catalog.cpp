#include "internal/db/table_catalog.hpp"

#include <algorithm>
#include <utility>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/observability/logging.hpp"

namespace schemadb::db {

using model::QuoteIdentifier;
using model::RequireIdentifier;
using sqlite::EngineError;

namespace {

// ALTER TABLE ... DROP COLUMN landed in SQLite 3.35.0
constexpr int kNativeDropColumnVersion = 3035000;

std::string Quoted(const char* what, const std::string& name) {
  RequireIdentifier(what, name);
  return QuoteIdentifier(name);
}

std::string ColumnDdl(const model::ColumnInfo& column) {
  std::string ddl = Quoted("column", column.name);
  if (!column.type.empty()) ddl += " " + column.type;
  if (column.primary_key) ddl += " PRIMARY KEY";
  if (column.not_null) ddl += " NOT NULL";
  // dflt_value is already an SQL literal produced by the engine
  if (column.default_literal) ddl += " DEFAULT " + *column.default_literal;
  return ddl;
}

bool HasColumn(const std::vector<model::ColumnInfo>& info, const std::string& column) {
  return std::any_of(info.begin(), info.end(), [&](const model::ColumnInfo& c) { return c.name == column; });
}

std::string TempName(const std::string& table) {
  return "schemadb_rebuild_" + table;
}

} // namespace

std::vector<model::ColumnInfo> ReadColumnInfo(sqlite::SqliteDB& db, const std::string& table) {
  std::vector<model::ColumnInfo> out;
  for (const auto& row : db.All(sql::SELECT_TABLE_INFO, {table})) {
    model::ColumnInfo info;
    info.cid  = static_cast<int>(std::get<std::int64_t>(row[0].value));
    info.name = std::get<std::string>(row[1].value);
    if (const auto* type = std::get_if<std::string>(&row[2].value)) info.type = *type;
    info.not_null = std::get<std::int64_t>(row[3].value) != 0;
    if (const auto* dflt = std::get_if<std::string>(&row[4].value)) info.default_literal = *dflt;
    info.primary_key = std::get<std::int64_t>(row[5].value) != 0;
    out.push_back(std::move(info));
  }
  return out;
}

model::ColumnInfo ToColumnInfo(const model::ColumnDefinition& column) {
  model::ColumnInfo info;
  info.name        = column.name;
  info.type        = std::string(model::ToString(column.type));
  info.primary_key = column.primary_key;
  return info;
}

TableCatalog::TableCatalog(std::shared_ptr<sqlite::SqliteDB> db, ErrorCallback on_error)
    : db_(std::move(db)), on_error_(std::move(on_error)) {
}

bool TableCatalog::SupportsNativeDropColumn() {
  return sqlite3_libversion_number() >= kNativeDropColumnVersion;
}

// ------------------------------------------------------------------
// Introspection
// ------------------------------------------------------------------

Result TableCatalog::TableExists(const std::string& table) {
  try {
    Result r = Result::Ok();
    r.status = !db_->All(sql::SELECT_TABLE_EXISTS, {table}).empty();
    return r;
  } catch (const EngineError& e) {
    return ReportEngineError(on_error_, "tableExists", e);
  }
}

Result TableCatalog::ListTables() {
  try {
    Result r = Result::Ok();
    r.rows   = db_->All(sql::SELECT_USER_TABLES);
    return r;
  } catch (const EngineError& e) {
    return ReportEngineError(on_error_, "getTables", e);
  }
}

Result TableCatalog::TableInfo(const std::string& table) {
  try {
    Result r = Result::Ok();
    r.info   = ReadColumnInfo(*db_, table);
    r.status = !r.info.empty();
    return r;
  } catch (const EngineError& e) {
    return ReportEngineError(on_error_, "getTableInfo", e);
  }
}

Result TableCatalog::ColumnExists(const std::string& table, const std::string& column) {
  try {
    Result r = Result::Ok();
    r.status = HasColumn(ReadColumnInfo(*db_, table), column);
    return r;
  } catch (const EngineError& e) {
    return ReportEngineError(on_error_, "fieldExists", e);
  }
}

// ------------------------------------------------------------------
// Tables
// ------------------------------------------------------------------

Result TableCatalog::CreateTable(const std::string& table, const std::vector<model::ColumnInfo>& columns) {
  std::string defs;
  for (const auto& column : columns) {
    if (!defs.empty()) defs += ", ";
    defs += ColumnDdl(column);
  }
  const std::string sql = "CREATE TABLE " + Quoted("table", table) + " (" + defs + ");";

  try {
    db_->Exec(sql);
    SCHEMADB_LOG_INFO("created table", {observability::StringField("table", table), observability::IntField("columns", static_cast<std::int64_t>(columns.size()))});
    return Result::Ok();
  } catch (const EngineError& e) {
    return ReportEngineError(on_error_, "createTable", e);
  }
}

Result TableCatalog::DropTable(const std::string& table) {
  const auto quoted = Quoted("table", table);

  Result exists = TableExists(table);
  if (!exists.Succeeded()) return exists;
  if (!exists.status) return Result::Err(StatusCode::NotFound, "table '" + table + "' does not exist");

  try {
    db_->Exec("DROP TABLE " + quoted + ";");
    SCHEMADB_LOG_INFO("dropped table", {observability::StringField("table", table)});
    return Result::Ok();
  } catch (const EngineError& e) {
    return ReportEngineError(on_error_, "deleteTable", e);
  }
}

Result TableCatalog::RenameTable(const std::string& from, const std::string& to) {
  const auto quoted_from = Quoted("table", from);
  const auto quoted_to   = Quoted("table", to);

  Result source = TableExists(from);
  if (!source.Succeeded()) return source;
  if (!source.status) return Result::Err(StatusCode::NotFound, "table '" + from + "' does not exist");

  Result target = TableExists(to);
  if (!target.Succeeded()) return target;
  if (target.status) return Result::Err(StatusCode::Conflict, "table '" + to + "' already exists");

  try {
    db_->Exec("ALTER TABLE " + quoted_from + " RENAME TO " + quoted_to + ";");
    return Result::Ok();
  } catch (const EngineError& e) {
    return ReportEngineError(on_error_, "renameTable", e);
  }
}

// ------------------------------------------------------------------
// Columns
// ------------------------------------------------------------------

Result TableCatalog::AddColumn(const std::string& table, const std::string& column, model::ColumnType type,
                               const std::optional<model::Value>& default_value) {
  const auto quoted_table  = Quoted("table", table);
  const auto quoted_column = Quoted("column", column);

  try {
    sqlite::SqliteTransaction tx(db_);

    db_->Exec("ALTER TABLE " + quoted_table + " ADD COLUMN " + quoted_column + " " + std::string(model::ToString(type)) + ";");
    if (default_value && !model::IsNull(*default_value)) {
      db_->Run("UPDATE " + quoted_table + " SET " + quoted_column + "=?;", {*default_value});
    }

    tx.Commit();
    SCHEMADB_LOG_INFO("added column", {observability::StringField("table", table), observability::StringField("column", column)});
    return Result::Ok();
  } catch (const EngineError& e) {
    return ReportEngineError(on_error_, "addField", e);
  }
}

Result TableCatalog::RenameColumn(const std::string& table, const std::string& from, const std::string& to) {
  const auto quoted_table = Quoted("table", table);
  const auto quoted_from  = Quoted("column", from);
  const auto quoted_to    = Quoted("column", to);

  try {
    const auto info = ReadColumnInfo(*db_, table);
    if (!HasColumn(info, from)) return Result::Err(StatusCode::NotFound, "column '" + table + "." + from + "' does not exist");
    if (HasColumn(info, to)) return Result::Err(StatusCode::Conflict, "column '" + table + "." + to + "' already exists");

    db_->Exec("ALTER TABLE " + quoted_table + " RENAME COLUMN " + quoted_from + " TO " + quoted_to + ";");
    SCHEMADB_LOG_INFO("renamed column",
                      {observability::StringField("table", table), observability::StringField("from", from), observability::StringField("to", to)});
    return Result::Ok();
  } catch (const EngineError& e) {
    return ReportEngineError(on_error_, "renameField", e);
  }
}

Result TableCatalog::DropColumn(const std::string& table, const std::string& column) {
  const auto quoted_table  = Quoted("table", table);
  const auto quoted_column = Quoted("column", column);

  std::vector<model::ColumnInfo> info;
  try {
    info = ReadColumnInfo(*db_, table);
  } catch (const EngineError& e) {
    return ReportEngineError(on_error_, "deleteField", e);
  }
  if (!HasColumn(info, column)) return Result::Err(StatusCode::NotFound, "column '" + table + "." + column + "' does not exist");

  if (SupportsNativeDropColumn()) {
    try {
      db_->Exec("ALTER TABLE " + quoted_table + " DROP COLUMN " + quoted_column + ";");
      SCHEMADB_LOG_INFO("dropped column", {observability::StringField("table", table), observability::StringField("column", column)});
      return Result::Ok();
    } catch (const EngineError& e) {
      // primary key / unique / indexed columns can't be dropped in place
      SCHEMADB_LOG_DEBUG("native drop column rejected, rebuilding",
                         {observability::StringField("table", table), observability::StringField("column", column),
                          observability::StringField("error", e.what())});
    }
  }

  info.erase(std::remove_if(info.begin(), info.end(), [&](const model::ColumnInfo& c) { return c.name == column; }), info.end());
  if (info.empty()) {
    return Result::Err(StatusCode::Conflict, "cannot drop the last column of '" + table + "'");
  }

  Result r = RebuildTable(table, info);
  if (r) {
    SCHEMADB_LOG_INFO("dropped column", {observability::StringField("table", table), observability::StringField("column", column)});
  }
  return r;
}

// ------------------------------------------------------------------
// Rebuild
// ------------------------------------------------------------------

void TableCatalog::RebuildInSavepoint(const std::string& table, const std::vector<model::ColumnInfo>& columns) {
  const auto quoted = QuoteIdentifier(table);
  const auto temp   = QuoteIdentifier(TempName(table));

  std::string defs;
  std::string names;
  for (const auto& column : columns) {
    if (!defs.empty()) {
      defs += ", ";
      names += ',';
    }
    defs += ColumnDdl(column);
    names += QuoteIdentifier(column.name);
  }

  db_->Exec("DROP TABLE IF EXISTS " + temp + ";");
  db_->Exec("CREATE TABLE " + temp + " (" + defs + ");");
  db_->Exec("INSERT INTO " + temp + " (" + names + ") SELECT " + names + " FROM " + quoted + " ORDER BY rowid;");
  db_->Exec("DROP TABLE " + quoted + ";");
  db_->Exec("ALTER TABLE " + temp + " RENAME TO " + quoted + ";");
}

Result TableCatalog::RebuildTable(const std::string& table, const std::vector<model::ColumnInfo>& columns) {
  RequireIdentifier("table", table);
  RequireIdentifier("table", TempName(table));
  for (const auto& column : columns) RequireIdentifier("column", column.name);

  try {
    sqlite::SqliteTransaction tx(db_);
    RebuildInSavepoint(table, columns);
    tx.Commit();
    SCHEMADB_LOG_INFO("rebuilt table", {observability::StringField("table", table)});
    return Result::Ok();
  } catch (const EngineError& e) {
    return ReportEngineError(on_error_, "reorderFields", e);
  }
}

} // namespace schemadb::db
