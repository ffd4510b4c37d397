#include "sqlite_tx.hpp"

#include <atomic>
#include <cstdint>

#include "internal/observability/logging.hpp"

namespace schemadb::db::sqlite {

namespace {
std::atomic<std::uint64_t> g_savepoint_seq{0};
}

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)), name_("schemadb_sp_" + std::to_string(++g_savepoint_seq)) {
  db_->Exec("SAVEPOINT " + name_ + ";");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) return;
  try {
    Rollback();
  } catch (const EngineError& e) {
    SCHEMADB_LOG_ERROR("savepoint rollback failed",
                       {observability::StringField("savepoint", name_), observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("RELEASE SAVEPOINT " + name_ + ";");
  finished_ = true;
}

void SqliteTransaction::Rollback() {
  finished_ = true;
  db_->Exec("ROLLBACK TO SAVEPOINT " + name_ + ";");
  db_->Exec("RELEASE SAVEPOINT " + name_ + ";");
}

} // namespace schemadb::db::sqlite
