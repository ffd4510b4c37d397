#pragma once

#include <memory>
#include <string>

#include "sqlite_db.hpp"

namespace schemadb::db::sqlite {

/*
  SQLite savepoint wrapper.

  Uses SAVEPOINT instead of BEGIN so it nests inside a transaction the
  caller opened through Begin(); outside one it behaves like BEGIN.

  - Changes are invisible to other connections until the outermost release
  - Rollback() discards every write made since construction
  - Destructor rolls back if neither Commit() nor Rollback() ran
*/
class SqliteTransaction final {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction&)            = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit();
  void Rollback();
  bool IsFinished() const { return finished_; }

private:
  std::shared_ptr<SqliteDB> db_;
  std::string name_;
  bool finished_ = false;
};

}
