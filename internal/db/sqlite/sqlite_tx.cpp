#include "sqlite_tx.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace jwlmerge::db::sqlite {

SqliteTransaction::SqliteTransaction(SqliteDB& db) : db_(db) {
  db_.Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_ && sqlite3_get_autocommit(db_.Handle()) == 0) {
    try {
      db_.Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      JWLMERGE_LOG_ERROR("Rollback failed", {observability::StringField("db", db_.Path()), observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  db_.Exec("COMMIT;");
  finished_ = true;
}

void SqliteTransaction::Rollback() {
  finished_ = true;
  // sqlite may already have rolled back on its own (e.g. after SQLITE_FULL)
  if (sqlite3_get_autocommit(db_.Handle()) == 0) {
    db_.Exec("ROLLBACK;");
  }
}

} // namespace jwlmerge::db::sqlite
