#include "pg_repository.hpp"

#include <type_traits>

#include "internal/db/sql/sql_queries.hpp"

namespace loyalty::db::postgres {

using loyalty::model::EntryKind;
using loyalty::model::EntryStatus;
using loyalty::model::UsageStatus;

namespace {

pqxx::params ToPqxx(const sql::Params& in) {
  pqxx::params out;
  for (const auto& param : in) {
    std::visit(
        [&](const auto& value) {
          using T = std::decay_t<decltype(value)>;
          if constexpr (std::is_same_v<T, std::nullptr_t>) {
            out.append(std::optional<std::string>{});
          } else {
            out.append(value);
          }
        },
        param);
  }
  return out;
}

std::string TextOrEmpty(const pqxx::field& f) {
  return f.is_null() ? "" : f.c_str();
}

model::LedgerEntryRecord ReadEntry(const pqxx::row& row) {
  model::LedgerEntryRecord r;
  r.id                = row[0].c_str();
  r.user_id           = row[1].c_str();
  r.kind              = static_cast<EntryKind>(row[2].as<int>());
  r.status            = static_cast<EntryStatus>(row[3].as<int>());
  r.amount            = row[4].as<int64_t>();
  r.remaining_amount  = row[5].as<int64_t>();
  r.available_from_ms = row[6].as<int64_t>();
  if (!row[7].is_null()) r.expires_at_ms = row[7].as<int64_t>();
  r.linked_usage_id = TextOrEmpty(row[8]);
  r.source_entry_id = TextOrEmpty(row[9]);
  r.reservation_id  = TextOrEmpty(row[10]);
  r.description     = TextOrEmpty(row[11]);
  r.created_at_ms   = row[12].as<int64_t>();
  r.updated_at_ms   = row[13].as<int64_t>();
  r.version         = row[14].as<uint64_t>();
  return r;
}

model::UsageRecord ReadUsage(const pqxx::row& row) {
  model::UsageRecord r;
  r.id                = row[0].c_str();
  r.user_id           = row[1].c_str();
  r.reservation_id    = row[2].c_str();
  r.total_amount      = row[3].as<int64_t>();
  r.status            = static_cast<UsageStatus>(row[4].as<int>());
  r.spend_entry_id    = TextOrEmpty(row[5]);
  r.rollback_reason   = TextOrEmpty(row[6]);
  r.rolled_back_at_ms = row[7].as<int64_t>();
  r.created_at_ms     = row[8].as<int64_t>();
  r.version           = row[9].as<uint64_t>();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Ledger entries
// ------------------------------------------------------------------

Result PgRepository::InsertEntry(Transaction& t, const model::LedgerEntryRecord& r) {
  try {
    TX(t).Prepared("insert_entry", r.id, r.user_id, static_cast<int>(r.kind), static_cast<int>(r.status), r.amount,
                               r.remaining_amount, r.available_from_ms, r.expires_at_ms, r.linked_usage_id, r.source_entry_id,
                               r.reservation_id, r.description, r.created_at_ms, r.updated_at_ms, static_cast<int64_t>(r.version));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::LedgerEntryRecord> PgRepository::GetEntry(Transaction& t, const std::string& id) {
  auto res = TX(t).Prepared("get_entry", id);
  if (res.empty()) return std::nullopt;
  return ReadEntry(res[0]);
}

Result PgRepository::UpdateEntry(Transaction& t, const model::LedgerEntryRecord& r, uint64_t expected_version) {
  try {
    auto& tx = TX(t);
    auto  res = tx.Prepared("update_entry", static_cast<int>(r.status), r.amount, r.remaining_amount, r.available_from_ms,
                                    r.expires_at_ms, r.linked_usage_id, r.source_entry_id, r.reservation_id, r.description,
                                    r.updated_at_ms, static_cast<int64_t>(expected_version + 1), r.id,
                                    static_cast<int64_t>(expected_version));
    if (res.affected_rows() == 0) {
      if (tx.Prepared("get_entry_version", r.id).empty()) {
        return Result::Err(ErrorCode::NotFound, r.id);
      }
      return Result::Err(ErrorCode::Conflict, r.id);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::LedgerEntryRecord> PgRepository::ListEntries(Transaction& t, const EntryQuery& query) {
  const auto statement = sql::BuildEntryQuery(query, false);
  auto       res       = TX(t).Work().exec_params(sql::NumberPlaceholders(statement.sql), ToPqxx(statement.params));

  std::vector<model::LedgerEntryRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadEntry(row));
  }
  return out;
}

uint64_t PgRepository::CountEntries(Transaction& t, const EntryQuery& query) {
  const auto statement = sql::BuildEntryQuery(query, true);
  auto       res       = TX(t).Work().exec_params(sql::NumberPlaceholders(statement.sql), ToPqxx(statement.params));
  if (res.empty()) return 0;
  return res[0][0].as<uint64_t>();
}

// ------------------------------------------------------------------
// Usage records
// ------------------------------------------------------------------

Result PgRepository::InsertUsage(Transaction& t, const model::UsageRecord& r) {
  try {
    auto& tx = TX(t);
    tx.Prepared("insert_usage", r.id, r.user_id, r.reservation_id, r.total_amount, static_cast<int>(r.status), r.spend_entry_id,
                       r.rollback_reason, r.rolled_back_at_ms, r.created_at_ms, static_cast<int64_t>(r.version));
    int64_t seq = 0;
    for (const auto& draw : r.consumed_from) {
      tx.Prepared("insert_draw", r.id, seq++, draw.grant_entry_id, draw.amount_drawn);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::ConsumedDraw> PgRepository::LoadDraws(PgTransaction& tx, const std::string& usage_id) {
  auto res = tx.Prepared("get_draws", usage_id);

  std::vector<model::ConsumedDraw> draws;
  draws.reserve(res.size());
  for (const auto& row : res) {
    draws.push_back({row[0].c_str(), row[1].as<int64_t>()});
  }
  return draws;
}

std::optional<model::UsageRecord> PgRepository::GetUsage(Transaction& t, const std::string& id) {
  auto res = TX(t).Prepared("get_usage", id);
  if (res.empty()) return std::nullopt;

  auto usage          = ReadUsage(res[0]);
  usage.consumed_from = LoadDraws(TX(t), usage.id);
  return usage;
}

Result PgRepository::UpdateUsage(Transaction& t, const model::UsageRecord& r, uint64_t expected_version) {
  try {
    auto& tx = TX(t);
    auto  res = tx.Prepared("update_usage", static_cast<int>(r.status), r.rollback_reason, r.rolled_back_at_ms,
                                    static_cast<int64_t>(expected_version + 1), r.id, static_cast<int64_t>(expected_version));
    if (res.affected_rows() == 0) {
      if (tx.Prepared("get_usage_version", r.id).empty()) {
        return Result::Err(ErrorCode::NotFound, r.id);
      }
      return Result::Err(ErrorCode::Conflict, r.id);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::UsageRecord> PgRepository::ListUsages(Transaction& t, const std::string& user_id, const Pagination& pagination) {
  auto res = TX(t).Prepared("list_usages", user_id, static_cast<int64_t>(pagination.limit),
                                        static_cast<int64_t>(pagination.offset));

  std::vector<model::UsageRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    auto usage          = ReadUsage(row);
    usage.consumed_from = LoadDraws(TX(t), usage.id);
    out.push_back(std::move(usage));
  }
  return out;
}

} // namespace loyalty::db::postgres
