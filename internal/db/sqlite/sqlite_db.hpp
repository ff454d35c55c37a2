#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/sqlite/sqlite_stmt.hpp"

namespace jwlmerge::db::sqlite {

enum class OpenMode {
  ReadOnly,
  ReadWrite
};

/*
  Thin RAII wrapper around sqlite3*.

  Backup stores are plain files inside a workspace; they are never created
  here and are always left in rollback-journal mode so the single .db file
  is complete once the handle is closed.
*/
class SqliteDB {
 public:
  SqliteDB(std::string path, OpenMode mode, std::uint32_t busy_timeout_ms = 5000);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas and transaction control)
  void Exec(const std::string& sql);

  // Prepare a statement; throws on syntax errors or unknown tables/columns
  SqliteStatement Prepare(const std::string& sql);

  // Same as Prepare but reports failure as a Result
  Result TryPrepare(const std::string& sql, SqliteStatement* out);

  // Column names of a table in declaration order; empty if the table does not exist
  std::vector<std::string> TableColumns(const std::string& table);

  std::int64_t LastInsertRowId() const;

  // Translate a sqlite return code (using the extended code of the last error)
  Result Translate(int rc) const;

 private:
  void Configure(std::uint32_t busy_timeout_ms);

  sqlite3*    db_ = nullptr;
  std::string path_;
  OpenMode    mode_;
};

} // namespace jwlmerge::db::sqlite
