#pragma once

#include <memory>
#include <pqxx/pqxx>
#include <utility>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace loyalty::db::postgres {

/*
  One pqxx::work on a pooled connection.

  Runs at READ COMMITTED; row versions are checked by the conditional
  UPDATEs. A serialization failure or deadlock on commit is reported as
  util::VersionConflict.
*/
class PgTransaction final : public db::Transaction {
 public:
  explicit PgTransaction(std::shared_ptr<PgPool> pool);
  ~PgTransaction() override;

  // Runs a statement prepared by PgPool on this connection.
  template <typename... Args>
  pqxx::result Prepared(const char* statement, Args&&... args) {
    return work_->exec_prepared(statement, std::forward<Args>(args)...);
  }

  pqxx::work& Work() {
    return *work_;
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

 private:
  // work_ is declared after conn_ so it is destroyed first
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work>       work_;

  bool committed_ = false;
  bool finished_  = false;
};

} // namespace loyalty::db::postgres
