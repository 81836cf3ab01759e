#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace loyalty::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) : conn_(pool->Acquire()), work_(std::make_unique<pqxx::work>(*conn_)) {
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try {
      work_->abort();
    } catch (const std::exception& e) {
      LOYALTY_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
    }
  }
  // the work must end before its connection goes back to the pool
  work_.reset();
}

void PgTransaction::Commit() {
  finished_ = true;
  try {
    work_->commit();
  } catch (const pqxx::serialization_failure& e) {
    throw util::VersionConflict(std::string("postgres commit: ") + e.what());
  } catch (const pqxx::deadlock_detected& e) {
    throw util::VersionConflict(std::string("postgres commit: ") + e.what());
  }
  committed_ = true;
}

void PgTransaction::Rollback() {
  finished_ = true;
  work_->abort();
}

} // namespace loyalty::db::postgres
