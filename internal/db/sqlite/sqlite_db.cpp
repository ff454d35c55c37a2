#include "sqlite_db.hpp"

#include <stdexcept>

namespace jwlmerge::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path, OpenMode mode, std::uint32_t busy_timeout_ms) : path_(std::move(path)), mode_(mode) {
  const int flags = mode_ == OpenMode::ReadOnly ? SQLITE_OPEN_READONLY : SQLITE_OPEN_READWRITE;
  int       rc    = sqlite3_open_v2(path_.c_str(), &db_, flags | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("open " + path_ + ": " + msg);
  }

  try {
    Configure(busy_timeout_ms);
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
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
    throw std::runtime_error(msg);
  }
}

SqliteStatement SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  ThrowIf(rc, db_, "sqlite prepare");
  return SqliteStatement(stmt);
}

Result SqliteDB::TryPrepare(const std::string& sql, SqliteStatement* out) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  if (rc != SQLITE_OK) {
    return Translate(rc);
  }
  *out = SqliteStatement(stmt);
  return Result::Ok();
}

std::vector<std::string> SqliteDB::TableColumns(const std::string& table) {
  auto st = Prepare("SELECT name FROM pragma_table_info(?);");
  st.Bind(1, sql::Value{table});

  std::vector<std::string> columns;
  int                      rc;
  while ((rc = st.Step()) == SQLITE_ROW) {
    columns.push_back(st.ColumnText(0));
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error("table_info(" + table + "): " + sqlite3_errmsg(db_));
  }
  return columns;
}

std::int64_t SqliteDB::LastInsertRowId() const {
  return static_cast<std::int64_t>(sqlite3_last_insert_rowid(db_));
}

Result SqliteDB::Translate(int rc) const {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  const int ext = sqlite3_extended_errcode(db_);
  switch (ext) {
    case SQLITE_CONSTRAINT_UNIQUE:
    case SQLITE_CONSTRAINT_PRIMARYKEY:
      return Result::Err(ErrorCode::Duplicate, sqlite3_errmsg(db_));
    default:
      break;
  }

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db_));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db_));
    case SQLITE_READONLY:
      return Result::Err(ErrorCode::ReadOnly, sqlite3_errmsg(db_));
    case SQLITE_IOERR:
    case SQLITE_CANTOPEN:
    case SQLITE_FULL:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db_));
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db_));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db_));
  }
}

void SqliteDB::Configure(std::uint32_t busy_timeout_ms) {
  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, static_cast<int>(busy_timeout_ms)), db_, "busy_timeout");

  // references are remapped by the merge itself and may stay unresolved
  Exec("PRAGMA foreign_keys=OFF;");

  if (mode_ == OpenMode::ReadWrite) {
    // the archive carries the .db file alone; no -wal/-shm side files
    Exec("PRAGMA journal_mode=DELETE;");
    Exec("PRAGMA synchronous=FULL;");
    Exec("PRAGMA temp_store=MEMORY;");
  }
}

} // namespace jwlmerge::db::sqlite
