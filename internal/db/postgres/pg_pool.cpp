#include "pg_pool.hpp"

#include "internal/db/sql/sql_queries.hpp"

namespace loyalty::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] {
    return !idle_.empty() || live_connections_ < max_connections_;
  });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  std::unique_ptr<pqxx::connection> conn;
  try {
    conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
  } catch (const std::exception&) {
    std::lock_guard relock(mutex_);
    --live_connections_;
    cv_.notify_one();
    throw;
  }
  return Wrap(conn.release());
}

void PgPool::ApplySchema() {
  pqxx::connection conn(conninfo_);
  pqxx::work       tx(conn);
  for (const char* stmt : sql::kSchema) {
    tx.exec(stmt);
  }
  tx.commit();
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("insert_entry", sql::NumberPlaceholders(sql::INSERT_ENTRY));
  conn.prepare("get_entry", sql::NumberPlaceholders(sql::SELECT_ENTRY));
  conn.prepare("update_entry", sql::NumberPlaceholders(sql::UPDATE_ENTRY));
  conn.prepare("get_entry_version", sql::NumberPlaceholders(sql::SELECT_ENTRY_VERSION));

  conn.prepare("insert_usage", sql::NumberPlaceholders(sql::INSERT_USAGE));
  conn.prepare("insert_draw", sql::NumberPlaceholders(sql::INSERT_DRAW));
  conn.prepare("get_usage", sql::NumberPlaceholders(sql::SELECT_USAGE));
  conn.prepare("get_draws", sql::NumberPlaceholders(sql::SELECT_DRAWS));
  conn.prepare("update_usage", sql::NumberPlaceholders(sql::UPDATE_USAGE));
  conn.prepare("get_usage_version", sql::NumberPlaceholders(sql::SELECT_USAGE_VERSION));
  conn.prepare("list_usages", sql::NumberPlaceholders(sql::LIST_USAGES));
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace loyalty::db::postgres
