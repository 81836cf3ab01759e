#include "factory.hpp"

#include <google/protobuf/util/time_util.h>

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#if LOYALTY_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if LOYALTY_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace loyalty::factory {

namespace {

std::chrono::milliseconds ToMillis(const google::protobuf::Duration& duration) {
  return std::chrono::milliseconds(google::protobuf::util::TimeUtil::DurationToMilliseconds(duration));
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const loyalty::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if LOYALTY_DB_SQLITE
    if (database.sqlite().path().empty()) {
      throw std::runtime_error("database.sqlite.path must be set");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    sqlite_db->ApplySchema();
    LOYALTY_LOG_INFO("ledger store opened", {observability::StringField("backend", "sqlite"), observability::StringField("path", sqlite_db->Path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if LOYALTY_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() == 0 ? 16u : database.postgres().max_connections();
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    pool->ApplySchema();
    LOYALTY_LOG_INFO("ledger store opened", {observability::StringField("backend", "postgres")});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  LOYALTY_LOG_INFO("ledger store opened", {observability::StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryRepository>();
}

core::LedgerOptions BuildLedgerOptions(const loyalty::runtime::config::RuntimeConfig& config) {
  core::LedgerOptions options;

  const auto& accrual = config.accrual();
  if (accrual.has_holding_period()) {
    options.accrual.holding_period = ToMillis(accrual.holding_period());
  }
  if (accrual.has_validity_period()) {
    options.accrual.validity_period = ToMillis(accrual.validity_period());
  }
  if (accrual.earning_rate() != 0) {
    options.accrual.earning_rate = accrual.earning_rate();
  }
  if (accrual.max_eligible_amount() != 0) {
    options.accrual.max_eligible_amount = accrual.max_eligible_amount();
  }
  if (accrual.referral_bonus() != 0) {
    options.accrual.referral_bonus = accrual.referral_bonus();
  }
  if (accrual.influencer_multiplier() != 0) {
    options.accrual.influencer_multiplier = accrual.influencer_multiplier();
  }

  const auto& engine = config.engine();
  if (engine.max_attempts() != 0) {
    options.retry.max_attempts = engine.max_attempts();
  }
  if (engine.has_retry_backoff()) {
    options.retry.backoff = ToMillis(engine.retry_backoff());
  }

  options.sweep_batch_limit = config.sweeper().batch_limit();
  return options;
}

/*
    Build full application dependency graph
*/
Application Build(const loyalty::runtime::config::RuntimeConfig& config, util::ClockFn clock) {
  Application app;
  app.repository = BuildRepository(config);
  app.ledger     = std::make_shared<core::LedgerManager>(app.repository, BuildLedgerOptions(config), std::move(clock));
  return app;
}

} // namespace loyalty::factory
