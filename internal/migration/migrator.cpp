#include "internal/migration/migrator.hpp"

#include <algorithm>
#include <unordered_set>

#include "internal/observability/logging.hpp"

namespace schemadb::migration {

using db::Result;
using db::StatusCode;
using observability::IntField;
using observability::StringField;

namespace {

bool Declares(const model::TableDefinition& table, const std::string& column) {
  return table.Find(column) != nullptr;
}

} // namespace

Migrator::Migrator(db::TableCatalog& catalog, MigrationOptions options) : catalog_(catalog), options_(options) {
}

Result Migrator::Run(const model::Schema& schema) {
  report_ = MigrationReport{};

  for (const auto& table : schema.Tables()) {
    Result r = EnsureTable(table);
    if (r.Succeeded() && options_.reorder) {
      r = ReorderColumns(table);
    }

    if (!r.Succeeded()) {
      SCHEMADB_LOG_ERROR("migration failed",
                         {StringField("table", table.Name()), IntField("code", db::ToInt(r.code)), StringField("error", r.message)});
      report_.failed_tables.push_back(table.Name());
    }
  }

  if (!report_.failed_tables.empty()) {
    return Result::Err(StatusCode::InternalError, "migration failed for table '" + report_.failed_tables.front() + "'");
  }

  if (options_.delete_unused) {
    Result r = PruneTables(schema);
    if (!r.Succeeded()) return r;
  }

  SCHEMADB_LOG_INFO("migration complete", {IntField("tables", static_cast<std::int64_t>(schema.Tables().size())),
                                           IntField("changes", report_.TotalChanges())});
  Result done = Result::Ok();
  done.changes = report_.TotalChanges();
  return done;
}

Result Migrator::EnsureTable(const model::TableDefinition& table) {
  Result exists = catalog_.TableExists(table.Name());
  if (!exists.Succeeded()) return exists;
  if (exists.status) return ReconcileColumns(table);

  std::vector<model::ColumnInfo> columns;
  columns.reserve(table.Columns().size());
  for (const auto& column : table.Columns()) {
    columns.push_back(db::ToColumnInfo(column));
  }

  Result r = catalog_.CreateTable(table.Name(), columns);
  if (r.Succeeded()) ++report_.tables_created;
  return r;
}

Result Migrator::ReconcileColumns(const model::TableDefinition& table) {
  // (a) renames
  for (const auto& column : table.Columns()) {
    if (!column.previous_name) continue;

    Result r = catalog_.RenameColumn(table.Name(), *column.previous_name, column.name);
    switch (r.code) {
      case StatusCode::OK:
        ++report_.columns_renamed;
        break;
      case StatusCode::NotFound:
        // already renamed on an earlier run
        break;
      case StatusCode::Conflict:
        SCHEMADB_LOG_WARN("rename skipped, target exists",
                          {StringField("table", table.Name()), StringField("from", *column.previous_name), StringField("to", column.name)});
        break;
      default:
        return r;
    }
  }

  Result info = catalog_.TableInfo(table.Name());
  if (!info.Succeeded()) return info;

  std::unordered_set<std::string> physical;
  for (const auto& c : info.info) physical.insert(c.name);

  // (b) missing declared columns
  for (const auto& column : table.Columns()) {
    if (physical.count(column.name)) continue;

    Result r = catalog_.AddColumn(table.Name(), column.name, column.type, column.default_value);
    if (!r.Succeeded()) return r;
    ++report_.columns_added;
  }

  // (c) undeclared physical columns
  if (options_.delete_unused) {
    for (const auto& c : info.info) {
      if (Declares(table, c.name)) continue;

      Result r = catalog_.DropColumn(table.Name(), c.name);
      if (r.code == StatusCode::NotFound) continue;
      if (!r.Succeeded()) return r;
      ++report_.columns_dropped;
    }
  }

  return Result::Ok();
}

Result Migrator::ReorderColumns(const model::TableDefinition& table) {
  Result info = catalog_.TableInfo(table.Name());
  if (!info.Succeeded()) return info;

  auto        physical = info.info;
  const auto& declared = table.Columns();

  const bool ordered = physical.size() >= declared.size() &&
                       std::equal(declared.begin(), declared.end(), physical.begin(),
                                  [](const model::ColumnDefinition& d, const model::ColumnInfo& p) { return d.name == p.name; });
  if (ordered) {
    Result r = Result::Ok();
    r.status = false;
    return r;
  }

  // declared columns first, in declared order, then leftovers in physical order
  std::vector<model::ColumnInfo> target;
  target.reserve(physical.size());
  for (const auto& column : declared) {
    auto it = std::find_if(physical.begin(), physical.end(), [&](const model::ColumnInfo& p) { return p.name == column.name; });
    if (it == physical.end()) {
      return Result::Err(StatusCode::NotFound, "column '" + table.Name() + "." + column.name + "' missing before reorder");
    }
    target.push_back(*it);
    physical.erase(it);
  }
  target.insert(target.end(), physical.begin(), physical.end());

  Result r = catalog_.RebuildTable(table.Name(), target);
  if (r.Succeeded()) {
    ++report_.tables_rebuilt;
    SCHEMADB_LOG_INFO("reordered columns", {StringField("table", table.Name())});
  }
  return r;
}

Result Migrator::PruneTables(const model::Schema& schema) {
  Result tables = catalog_.ListTables();
  if (!tables.Succeeded()) return tables;

  for (const auto& row : tables.rows) {
    const auto* name = row.empty() ? nullptr : std::get_if<std::string>(&row.front().value);
    if (!name || schema.Contains(*name)) continue;
    if (!model::IsValidIdentifier(*name)) {
      SCHEMADB_LOG_WARN("not pruning table with unsupported name", {StringField("table", *name)});
      continue;
    }

    Result r = catalog_.DropTable(*name);
    if (r.code == StatusCode::NotFound) continue;
    if (!r.Succeeded()) return r;
    ++report_.tables_dropped;
  }

  return Result::Ok();
}

} // namespace schemadb::migration
