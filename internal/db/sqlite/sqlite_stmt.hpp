#pragma once

#include <sqlite3.h>

#include <string>

#include "internal/db/sql/sql_value.hpp"

namespace jwlmerge::db::sqlite {

/*
  Owning handle for a prepared statement (finalized on destruction).

  Bind indexes are 1-based, column indexes 0-based, as in the C API.
*/
class SqliteStatement {
 public:
  SqliteStatement() = default;
  explicit SqliteStatement(sqlite3_stmt* stmt) : stmt_(stmt) {
  }
  ~SqliteStatement();

  SqliteStatement(const SqliteStatement&)            = delete;
  SqliteStatement& operator=(const SqliteStatement&) = delete;

  SqliteStatement(SqliteStatement&& other) noexcept;
  SqliteStatement& operator=(SqliteStatement&& other) noexcept;

  sqlite3_stmt* Handle() const {
    return stmt_;
  }

  int Bind(int idx, const sql::Value& value);

  // Binds values to ?1..?N; returns the first non-OK rc
  int BindAll(const sql::Values& values);

  int  Step();
  void Reset();

  sql::Value  Column(int col) const;
  std::string ColumnText(int col) const;
  std::int64_t ColumnInt64(int col) const;

 private:
  sqlite3_stmt* stmt_ = nullptr;
};

} // namespace jwlmerge::db::sqlite
