#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace loyalty::db::sqlite {

/*
  SQLite transaction on the shared connection.

  Holds the connection's transaction mutex for its whole lifetime and opens
  with BEGIN IMMEDIATE, so the write lock is taken before the first read.
  A thread must not open a second transaction while it holds one.

  SQLITE_BUSY on BEGIN or COMMIT is reported as util::VersionConflict so the
  engine retries the whole unit.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const {
    return db_->Handle();
  }

  StatementPtr Prepare(const std::string& sql) const {
    return db_->Prepare(sql);
  }

  // Rows touched by the last INSERT/UPDATE/DELETE.
  int Changes() const {
    return sqlite3_changes(db_->Handle());
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

 private:
  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> lock_;

  bool committed_ = false;
  bool finished_  = false;
};

} // namespace loyalty::db::sqlite
