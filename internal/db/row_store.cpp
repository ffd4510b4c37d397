#include "internal/db/row_store.hpp"

#include <algorithm>
#include <utility>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/db/table_catalog.hpp"
#include "internal/model/schema.hpp"
#include "internal/observability/logging.hpp"

namespace schemadb::db {

using model::QuoteIdentifier;
using model::RequireIdentifier;
using sqlite::EngineError;

namespace {

struct Predicate {
  std::string               sql;
  std::vector<model::Value> params;
};

std::string Table(const std::string& table) {
  RequireIdentifier("table", table);
  return QuoteIdentifier(table);
}

std::string Column(const std::string& column) {
  RequireIdentifier("column", column);
  return QuoteIdentifier(column);
}

Predicate Where(const std::string& column, const model::Value& value, Comparison comparison) {
  if (comparison == Comparison::All) return {};
  return {" WHERE " + Column(column) + " " + std::string(ToSql(comparison)) + " ?", {value}};
}

std::string LimitClause(Limit limit) {
  if (limit && *limit >= 0) return " LIMIT " + std::to_string(*limit);
  return {};
}

// rowids of the matching rows, stable between the insert and delete phases of a move
std::string RowidSubselect(const std::string& quoted_table, const Predicate& where, Limit limit) {
  return "SELECT rowid FROM " + quoted_table + where.sql + " ORDER BY rowid" + LimitClause(limit);
}

std::string JoinColumns(const std::vector<std::string>& columns) {
  std::string out;
  for (const auto& column : columns) {
    if (!out.empty()) out += ',';
    out += QuoteIdentifier(column);
  }
  return out;
}

} // namespace

std::string_view ToSql(Comparison comparison) {
  switch (comparison) {
    case Comparison::NotEqual:
      return "<>";
    case Comparison::Less:
      return "<";
    case Comparison::LessEqual:
      return "<=";
    case Comparison::Greater:
      return ">";
    case Comparison::GreaterEqual:
      return ">=";
    case Comparison::Like:
      return "LIKE";
    case Comparison::All:
      return "*";
    case Comparison::Equal:
    default:
      return "=";
  }
}

std::optional<Comparison> ParseComparison(std::string_view text) {
  if (text == "=" || text == "==") return Comparison::Equal;
  if (text == "!=" || text == "<>") return Comparison::NotEqual;
  if (text == "<") return Comparison::Less;
  if (text == "<=") return Comparison::LessEqual;
  if (text == ">") return Comparison::Greater;
  if (text == ">=") return Comparison::GreaterEqual;
  if (text == "LIKE" || text == "like") return Comparison::Like;
  if (text == "*") return Comparison::All;
  return std::nullopt;
}

RowStore::RowStore(std::shared_ptr<sqlite::SqliteDB> db, ErrorCallback on_error)
    : db_(std::move(db)), on_error_(std::move(on_error)) {
}

// ------------------------------------------------------------------
// Insert
// ------------------------------------------------------------------

Result RowStore::Insert(const std::string& table, const std::vector<model::Value>& values) {
  std::string placeholders;
  for (std::size_t i = 0; i < values.size(); ++i) {
    placeholders += (i == 0) ? "?" : ",?";
  }
  const std::string sql = "INSERT INTO " + Table(table) + " VALUES(" + placeholders + ");";

  try {
    return Result::Changed(db_->Run(sql, values));
  } catch (const EngineError& e) {
    return ReportEngineError(on_error_, "insert", e);
  }
}

Result RowStore::InsertRow(const std::string& table, const model::Row& fields) {
  std::vector<std::string>  columns;
  std::vector<model::Value> values;
  std::string               placeholders;
  for (const auto& field : fields) {
    RequireIdentifier("column", field.name);
    columns.push_back(field.name);
    values.push_back(field.value);
    placeholders += placeholders.empty() ? "?" : ",?";
  }

  const std::string sql = "INSERT INTO " + Table(table) + " (" + JoinColumns(columns) + ") VALUES(" + placeholders + ");";

  try {
    return Result::Changed(db_->Run(sql, values));
  } catch (const EngineError& e) {
    return ReportEngineError(on_error_, "insertRow", e);
  }
}

// ------------------------------------------------------------------
// Select
// ------------------------------------------------------------------

Result RowStore::SelectRows(const std::string& table, const std::string& column, const model::Value& value,
                            Comparison comparison, Limit limit) {
  const auto        where = Where(column, value, comparison);
  const std::string sql   = "SELECT * FROM " + Table(table) + where.sql + LimitClause(limit) + ";";

  try {
    Result r = Result::Ok();
    r.rows   = db_->All(sql, where.params);
    return r;
  } catch (const EngineError& e) {
    return ReportEngineError(on_error_, "selectRows", e);
  }
}

Result RowStore::SelectOne(const std::string& table, const std::string& column, const model::Value& value,
                           Comparison comparison) {
  Result r = SelectRows(table, column, value, comparison, 1);
  if (!r.Succeeded()) return r;

  if (!r.rows.empty()) {
    r.row = std::move(r.rows.front());
  }
  r.status = r.row.has_value();
  r.rows.clear();
  return r;
}

Result RowStore::SelectValue(const std::string& table, const std::string& column, const model::Value& value,
                             const std::string& result_column, Comparison comparison) {
  const auto        where = Where(column, value, comparison);
  const std::string sql   = "SELECT " + Column(result_column) + " FROM " + Table(table) + where.sql + " LIMIT 1;";

  try {
    auto   rows = db_->All(sql, where.params);
    Result r    = Result::Ok();
    r.status    = !rows.empty();
    r.value     = rows.empty() ? model::Value{nullptr} : rows.front().front().value;
    return r;
  } catch (const EngineError& e) {
    return ReportEngineError(on_error_, "selectValue", e);
  }
}

Result RowStore::ValueExists(const std::string& table, const std::string& column, const model::Value& value,
                             Comparison comparison) {
  const auto        where = Where(column, value, comparison);
  const std::string sql   = "SELECT 1 FROM " + Table(table) + where.sql + " LIMIT 1;";

  try {
    Result r = Result::Ok();
    r.status = !db_->All(sql, where.params).empty();
    return r;
  } catch (const EngineError& e) {
    return ReportEngineError(on_error_, "valueExists", e);
  }
}

// ------------------------------------------------------------------
// Update
// ------------------------------------------------------------------

Result RowStore::UpdateColumn(const std::string& table, const std::string& column, const model::Value& new_value,
                              const std::string& predicate_column, const model::Value& predicate_value) {
  return UpdateColumns(table, {{column, new_value}}, predicate_column, predicate_value);
}

Result RowStore::UpdateColumns(const std::string& table, const model::Row& assignments,
                               const std::string& predicate_column, const model::Value& predicate_value) {
  if (assignments.empty()) {
    return Result::Changed(0);
  }

  std::string               set_clause;
  std::vector<model::Value> params;
  for (const auto& field : assignments) {
    if (!set_clause.empty()) set_clause += ',';
    set_clause += Column(field.name) + "=?";
    params.push_back(field.value);
  }
  params.push_back(predicate_value);

  const std::string sql = "UPDATE " + Table(table) + " SET " + set_clause + " WHERE " + Column(predicate_column) + "=?;";

  try {
    return Result::Changed(db_->Run(sql, params));
  } catch (const EngineError& e) {
    return ReportEngineError(on_error_, "updateColumn", e);
  }
}

// ------------------------------------------------------------------
// Delete / move
// ------------------------------------------------------------------

Result RowStore::DeleteRows(const std::string& table, const std::string& column, const model::Value& value,
                            Comparison comparison, Limit limit) {
  const auto        quoted = Table(table);
  const auto        where  = Where(column, value, comparison);
  const std::string sql    = "DELETE FROM " + quoted + " WHERE rowid IN (" + RowidSubselect(quoted, where, limit) + ");";

  try {
    return Result::Changed(db_->Run(sql, where.params));
  } catch (const EngineError& e) {
    return ReportEngineError(on_error_, "deleteRows", e);
  }
}

Result RowStore::DeleteOne(const std::string& table, const std::string& column, const model::Value& value,
                           Comparison comparison) {
  return DeleteRows(table, column, value, comparison, 1);
}

Result RowStore::MoveRows(const std::string& from_table, const std::string& to_table, const std::string& column,
                          const model::Value& value, Comparison comparison, Limit limit) {
  const auto from  = Table(from_table);
  const auto to    = Table(to_table);
  const auto where = Where(column, value, comparison);

  try {
    const auto source      = ReadColumnInfo(*db_, from_table);
    const auto destination = ReadColumnInfo(*db_, to_table);
    if (source.empty() || destination.empty()) {
      return Result::Err(StatusCode::NotFound, "moveRows: table '" + (source.empty() ? from_table : to_table) + "' does not exist");
    }

    std::vector<std::string> shared;
    for (const auto& info : source) {
      const bool present = std::any_of(destination.begin(), destination.end(), [&](const model::ColumnInfo& d) { return d.name == info.name; });
      if (present) shared.push_back(info.name);
    }
    if (shared.empty()) {
      return Result::Err(StatusCode::Conflict, "moveRows: '" + from_table + "' and '" + to_table + "' share no columns");
    }

    const auto        columns = JoinColumns(shared);
    const auto        rowids  = RowidSubselect(from, where, limit);
    const std::string insert  = "INSERT INTO " + to + " (" + columns + ") SELECT " + columns + " FROM " + from +
                               " WHERE rowid IN (" + rowids + ") ORDER BY rowid;";
    const std::string remove  = "DELETE FROM " + from + " WHERE rowid IN (" + rowids + ");";

    sqlite::SqliteTransaction tx(db_);

    const int inserted = db_->Run(insert, where.params);
    if (inserted == 0) {
      tx.Commit();
      return Result::Changed(0);
    }

    const int deleted = db_->Run(remove, where.params);
    if (deleted != inserted) {
      // rolled back by the savepoint destructor
      SCHEMADB_LOG_WARN("moveRows row count mismatch",
                        {observability::StringField("from", from_table), observability::StringField("to", to_table),
                         observability::IntField("inserted", inserted), observability::IntField("deleted", deleted)});
      return Result::Err(StatusCode::Conflict, "moveRows: inserted " + std::to_string(inserted) + " rows but deleted " +
                                                   std::to_string(deleted));
    }

    tx.Commit();
    return Result::Changed(deleted);
  } catch (const EngineError& e) {
    return ReportEngineError(on_error_, "moveRows", e);
  }
}

// ------------------------------------------------------------------
// Transactions / raw SQL
// ------------------------------------------------------------------

Result RowStore::Control(const char* location, const char* sql) {
  try {
    db_->Exec(sql);
    return Result::Ok();
  } catch (const EngineError& e) {
    return ReportEngineError(on_error_, location, e);
  }
}

Result RowStore::Begin() {
  return Control("begin", sql::BEGIN);
}

Result RowStore::Commit() {
  return Control("commit", sql::COMMIT);
}

Result RowStore::Rollback() {
  return Control("rollback", sql::ROLLBACK);
}

Result RowStore::Execute(const std::string& sql, const std::vector<model::Value>& params) {
  try {
    Result r  = Result::Ok();
    r.changes = db_->Run(sql, params);
    return r;
  } catch (const EngineError& e) {
    return ReportEngineError(on_error_, "execute", e);
  }
}

Result RowStore::Query(const std::string& sql, const std::vector<model::Value>& params) {
  try {
    Result r = Result::Ok();
    r.rows   = db_->All(sql, params);
    return r;
  } catch (const EngineError& e) {
    return ReportEngineError(on_error_, "query", e);
  }
}

} // namespace schemadb::db
