#pragma once

#include <sqlite3.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "internal/model/value.hpp"

namespace schemadb::db::sqlite {

/*
  Raised by the wrapper when SQLite rejects a call.

  Only lives inside the storage layer: public entry points catch it,
  report it through the error callback and return a failure Result.
*/
class EngineError : public std::runtime_error {
 public:
  EngineError(int code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  int Code() const {
    return code_;
  }

 private:
  int code_;
};

/*
  Prepared statement, finalized on destruction.
*/
class Statement {
 public:
  Statement(sqlite3* db, const std::string& sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  void Bind(int index, const model::Value& value);
  void BindAll(const std::vector<model::Value>& values);

  // true while a row is available, false once the statement is done
  bool Step();

  int ColumnCount() const;
  std::string ColumnName(int col) const;
  model::Value Column(int col) const;

  // current row with physical column names
  model::Row ReadRow() const;

 private:
  sqlite3*      db_   = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

/*
  Thin RAII wrapper around sqlite3*.

  Opened in serialized mode, so one handle may be shared between the
  caller's threads and the maintenance workers.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  bool IsOpen() const {
    return db_ != nullptr;
  }

  // Execute a SQL string without parameters (pragmas, DDL, transaction control)
  void Exec(const std::string& sql);

  // Execute a parameterized statement to completion, returns sqlite3_changes()
  int Run(const std::string& sql, const std::vector<model::Value>& params = {});

  // Execute a parameterized query and collect every row
  std::vector<model::Row> All(const std::string& sql, const std::vector<model::Value>& params = {});

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure();

  // Copy the live database into `destination` with the online backup API
  void BackupTo(const std::string& destination);

  void Close();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace schemadb::db::sqlite
