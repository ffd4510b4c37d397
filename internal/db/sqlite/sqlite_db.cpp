#include "sqlite_db.hpp"

#include <string>
#include <utility>

namespace schemadb::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw EngineError(rc, std::string(what) + ": " + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc)));
  }
}

// ------------------------------------------------------------------
// Statement
// ------------------------------------------------------------------

Statement::Statement(sqlite3* db, const std::string& sql) : db_(db) {
  int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = sqlite3_errmsg(db_);
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
    throw EngineError(rc, "sqlite prepare: " + msg);
  }
}

Statement::~Statement() {
  if (stmt_) sqlite3_finalize(stmt_);
}

void Statement::Bind(int index, const model::Value& value) {
  int rc = SQLITE_OK;
  if (std::holds_alternative<std::nullptr_t>(value)) {
    rc = sqlite3_bind_null(stmt_, index);
  } else if (const auto* i = std::get_if<std::int64_t>(&value)) {
    rc = sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(*i));
  } else if (const auto* d = std::get_if<double>(&value)) {
    rc = sqlite3_bind_double(stmt_, index, *d);
  } else {
    const auto& s = std::get<std::string>(value);
    rc = sqlite3_bind_text(stmt_, index, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
  }
  ThrowIf(rc, db_, "sqlite bind");
}

void Statement::BindAll(const std::vector<model::Value>& values) {
  for (std::size_t i = 0; i < values.size(); ++i) {
    Bind(static_cast<int>(i + 1), values[i]);
  }
}

bool Statement::Step() {
  int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  throw EngineError(rc, std::string("sqlite step: ") + sqlite3_errmsg(db_));
}

int Statement::ColumnCount() const {
  return sqlite3_column_count(stmt_);
}

std::string Statement::ColumnName(int col) const {
  const char* name = sqlite3_column_name(stmt_, col);
  return name ? name : "";
}

model::Value Statement::Column(int col) const {
  switch (sqlite3_column_type(stmt_, col)) {
    case SQLITE_INTEGER:
      return static_cast<std::int64_t>(sqlite3_column_int64(stmt_, col));
    case SQLITE_FLOAT:
      return sqlite3_column_double(stmt_, col);
    case SQLITE_NULL:
      return nullptr;
    case SQLITE_TEXT:
    case SQLITE_BLOB:
    default: {
      const auto* data = static_cast<const char*>(sqlite3_column_blob(stmt_, col));
      const int   size = sqlite3_column_bytes(stmt_, col);
      return data ? std::string(data, static_cast<std::size_t>(size)) : std::string();
    }
  }
}

model::Row Statement::ReadRow() const {
  model::Row row;
  const int  count = ColumnCount();
  row.reserve(static_cast<std::size_t>(count));
  for (int i = 0; i < count; ++i) {
    row.push_back({ColumnName(i), Column(i)});
  }
  return row;
}

// ------------------------------------------------------------------
// SqliteDB
// ------------------------------------------------------------------

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw EngineError(rc, msg);
  }

  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close_v2(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw EngineError(rc, msg);
  }
}

int SqliteDB::Run(const std::string& sql, const std::vector<model::Value>& params) {
  Statement stmt(db_, sql);
  stmt.BindAll(params);
  while (stmt.Step()) {
  }
  return sqlite3_changes(db_);
}

std::vector<model::Row> SqliteDB::All(const std::string& sql, const std::vector<model::Value>& params) {
  Statement stmt(db_, sql);
  stmt.BindAll(params);

  std::vector<model::Row> rows;
  while (stmt.Step()) {
    rows.push_back(stmt.ReadRow());
  }
  return rows;
}

void SqliteDB::Configure() {
  // IMPORTANT: WAL enables concurrent readers while writer holds lock
  Exec("PRAGMA journal_mode=WAL;");

  // NORMAL is a good tradeoff; use FULL if you want stronger durability
  Exec("PRAGMA synchronous=NORMAL;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");

  // unknown double-quoted identifiers must fail instead of becoming string literals
  ThrowIf(sqlite3_db_config(db_, SQLITE_DBCONFIG_DQS_DML, 0, nullptr), db_, "dqs_dml");
  ThrowIf(sqlite3_db_config(db_, SQLITE_DBCONFIG_DQS_DDL, 0, nullptr), db_, "dqs_ddl");
}

void SqliteDB::BackupTo(const std::string& destination) {
  sqlite3* dest = nullptr;
  int      rc   = sqlite3_open_v2(destination.c_str(), &dest, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = dest ? sqlite3_errmsg(dest) : "sqlite open failed";
    if (dest) sqlite3_close(dest);
    throw EngineError(rc, "backup open: " + msg);
  }

  sqlite3_backup* backup = sqlite3_backup_init(dest, "main", db_, "main");
  if (!backup) {
    rc              = sqlite3_errcode(dest);
    std::string msg = sqlite3_errmsg(dest);
    sqlite3_close(dest);
    throw EngineError(rc, "backup init: " + msg);
  }

  // -1: copy every page in one pass, i.e. a single point-in-time snapshot
  rc = sqlite3_backup_step(backup, -1);
  sqlite3_backup_finish(backup);

  if (rc != SQLITE_DONE) {
    std::string msg = sqlite3_errstr(rc);
    sqlite3_close(dest);
    throw EngineError(rc, "backup step: " + msg);
  }

  rc = sqlite3_close(dest);
  ThrowIf(rc, nullptr, "backup close");
}

void SqliteDB::Close() {
  if (!db_) return;
  int rc = sqlite3_close(db_);
  ThrowIf(rc, db_, "sqlite close");
  db_ = nullptr;
}

} // namespace schemadb::db::sqlite
