#include "sqlite_stmt.hpp"

#include <utility>

namespace jwlmerge::db::sqlite {

SqliteStatement::~SqliteStatement() {
  if (stmt_) sqlite3_finalize(stmt_);
}

SqliteStatement::SqliteStatement(SqliteStatement&& other) noexcept : stmt_(std::exchange(other.stmt_, nullptr)) {
}

SqliteStatement& SqliteStatement::operator=(SqliteStatement&& other) noexcept {
  if (this != &other) {
    if (stmt_) sqlite3_finalize(stmt_);
    stmt_ = std::exchange(other.stmt_, nullptr);
  }
  return *this;
}

int SqliteStatement::Bind(int idx, const sql::Value& value) {
  switch (value.index()) {
    case 0:
      return sqlite3_bind_null(stmt_, idx);
    case 1:
      return sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(std::get<std::int64_t>(value)));
    case 2:
      return sqlite3_bind_double(stmt_, idx, std::get<double>(value));
    case 3: {
      const auto& s = std::get<std::string>(value);
      return sqlite3_bind_text(stmt_, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
    }
    default: {
      const auto& b = std::get<sql::Blob>(value);
      return sqlite3_bind_blob(stmt_, idx, b.data(), static_cast<int>(b.size()), SQLITE_TRANSIENT);
    }
  }
}

int SqliteStatement::BindAll(const sql::Values& values) {
  for (std::size_t i = 0; i < values.size(); ++i) {
    int rc = Bind(static_cast<int>(i + 1), values[i]);
    if (rc != SQLITE_OK) return rc;
  }
  return SQLITE_OK;
}

int SqliteStatement::Step() {
  return sqlite3_step(stmt_);
}

void SqliteStatement::Reset() {
  sqlite3_reset(stmt_);
  sqlite3_clear_bindings(stmt_);
}

sql::Value SqliteStatement::Column(int col) const {
  switch (sqlite3_column_type(stmt_, col)) {
    case SQLITE_NULL:
      return nullptr;
    case SQLITE_INTEGER:
      return static_cast<std::int64_t>(sqlite3_column_int64(stmt_, col));
    case SQLITE_FLOAT:
      return sqlite3_column_double(stmt_, col);
    case SQLITE_TEXT:
      return ColumnText(col);
    default: {
      const auto* data = static_cast<const std::uint8_t*>(sqlite3_column_blob(stmt_, col));
      const int   size = sqlite3_column_bytes(stmt_, col);
      return data ? sql::Blob(data, data + size) : sql::Blob{};
    }
  }
}

std::string SqliteStatement::ColumnText(int col) const {
  const unsigned char* t = sqlite3_column_text(stmt_, col);
  if (!t) return "";
  return std::string(reinterpret_cast<const char*>(t), static_cast<std::size_t>(sqlite3_column_bytes(stmt_, col)));
}

std::int64_t SqliteStatement::ColumnInt64(int col) const {
  return static_cast<std::int64_t>(sqlite3_column_int64(stmt_, col));
}

} // namespace jwlmerge::db::sqlite
