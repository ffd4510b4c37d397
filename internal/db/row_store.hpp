#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/error_reporting.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/model/value.hpp"

namespace schemadb::db {

enum class Comparison {
  Equal,
  NotEqual,
  Less,
  LessEqual,
  Greater,
  GreaterEqual,
  Like,
  // no predicate: whole table
  All,
};

std::string_view ToSql(Comparison comparison);

// "=", "!=", "<>", "<", "<=", ">", ">=", "LIKE", "*"
std::optional<Comparison> ParseComparison(std::string_view text);

using Limit = std::optional<std::int64_t>;

/*
  Row Access Layer.

  Table/predicate scoped CRUD primitives, independent of any declared
  schema. Values are always bound as parameters; table and column names
  must be plain identifiers (util::ConfigurationError otherwise) and are
  the only text interpolated into SQL.

  Engine failures are reported through the error callback with the
  operation name as location and come back as 500 results.
*/
class RowStore {
 public:
  RowStore(std::shared_ptr<sqlite::SqliteDB> db, ErrorCallback on_error);

  // Positional insert, values in physical column order.
  Result Insert(const std::string& table, const std::vector<model::Value>& values);

  // Named insert; columns not listed take the engine default.
  Result InsertRow(const std::string& table, const model::Row& fields);

  Result SelectRows(const std::string& table, const std::string& column, const model::Value& value,
                    Comparison comparison = Comparison::Equal, Limit limit = std::nullopt);

  // row = first match, or unset when nothing matched
  Result SelectOne(const std::string& table, const std::string& column, const model::Value& value,
                   Comparison comparison = Comparison::Equal);

  // value = `result_column` of the first match, NULL when nothing matched
  Result SelectValue(const std::string& table, const std::string& column, const model::Value& value,
                     const std::string& result_column, Comparison comparison = Comparison::Equal);

  Result UpdateColumn(const std::string& table, const std::string& column, const model::Value& new_value,
                      const std::string& predicate_column, const model::Value& predicate_value);

  Result UpdateColumns(const std::string& table, const model::Row& assignments,
                       const std::string& predicate_column, const model::Value& predicate_value);

  Result DeleteRows(const std::string& table, const std::string& column, const model::Value& value,
                    Comparison comparison = Comparison::Equal, Limit limit = std::nullopt);

  Result DeleteOne(const std::string& table, const std::string& column, const model::Value& value,
                   Comparison comparison = Comparison::Equal);

  /*
    Copies matching rows into `to_table` (columns both tables share) and
    deletes them from `from_table`. Both phases run in one savepoint: a
    failure in either leaves both tables untouched.
  */
  Result MoveRows(const std::string& from_table, const std::string& to_table, const std::string& column,
                  const model::Value& value, Comparison comparison = Comparison::Equal, Limit limit = std::nullopt);

  // status = at least one match
  Result ValueExists(const std::string& table, const std::string& column, const model::Value& value,
                     Comparison comparison = Comparison::Equal);

  // Passthrough transaction control on the shared handle.
  Result Begin();
  Result Commit();
  Result Rollback();

  // Raw parameterized statements for queries the primitives don't cover.
  Result Execute(const std::string& sql, const std::vector<model::Value>& params = {});
  Result Query(const std::string& sql, const std::vector<model::Value>& params = {});

  const std::shared_ptr<sqlite::SqliteDB>& Database() const {
    return db_;
  }

  const ErrorCallback& OnError() const {
    return on_error_;
  }

 private:
  Result Control(const char* location, const char* sql);

  std::shared_ptr<sqlite::SqliteDB> db_;
  ErrorCallback                     on_error_;
};

} // namespace schemadb::db
