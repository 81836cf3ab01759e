#pragma once

namespace loyalty::db {

/*
  Abstract transaction: the all-or-nothing write unit of the ledger.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Commit() throws util::VersionConflict if a row written by this
    transaction was changed by another transaction after it was read;
    nothing is applied in that case

  SQLite: BEGIN IMMEDIATE
  Postgres: pqxx::work
  Memory: snapshot + write set, row versions validated at commit
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;
};

} // namespace loyalty::db
