#pragma once

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace jwlmerge::db::sqlite {

/*
  SQLite transaction wrapper.

  Uses BEGIN IMMEDIATE:
    - grabs the write lock before the first record is merged
    - a destination that cannot be written fails up front, not mid-merge

  The database must outlive the transaction.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(SqliteDB& db);
  ~SqliteTransaction() override;

  SqliteTransaction(const SqliteTransaction&)            = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  SqliteDB& DB() const { return db_; }

  void Commit() override;
  void Rollback() override;
  bool IsFinished() const override { return finished_; }

private:
  SqliteDB& db_;
  bool finished_ = false;
};

}
