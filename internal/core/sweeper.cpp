#include "internal/core/sweeper.hpp"

#include <unordered_set>

#include "internal/core/db_errors.hpp"
#include "internal/ledger/balance_aggregator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace loyalty::core {

using db::model::LedgerEntryRecord;
using loyalty::model::EntryKind;
using loyalty::model::EntryStatus;

Sweeper::Sweeper(std::shared_ptr<db::Repository> repository, RetryPolicy retry, std::uint32_t batch_limit)
    : repository_(std::move(repository)), retry_(retry), batch_limit_(batch_limit) {
  if (!repository_) {
    throw std::invalid_argument("Sweeper: repository must not be null");
  }
}

std::vector<LedgerEntryRecord> Sweeper::ScanPage(db::EntryQuery query, std::uint32_t offset) {
  query.order = db::EntryOrder::kFifo;
  if (batch_limit_ > 0) {
    query.pagination = db::Pagination{.limit = batch_limit_, .offset = offset};
  }

  return RunWithRetry(retry_, "sweep scan", [&] {
    auto tx = repository_->Begin();
    return repository_->ListEntries(*tx, query);
  });
}

template <typename Fn>
SweepReport Sweeper::Run(std::string_view sweep, const db::EntryQuery& query, Fn&& per_entry) {
  SweepReport report;

  // Transitioned rows leave the candidate set and failed rows stay, so the
  // next page starts after the rows left behind.
  std::unordered_set<std::string> seen;
  std::uint32_t                   offset = 0;
  bool                            done   = false;
  while (!done) {
    const auto rows = ScanPage(query, offset);

    std::uint32_t remaining_in_page = 0;
    for (const auto& row : rows) {
      if (!seen.insert(row.id).second || !row.IsGrant()) {
        ++remaining_in_page;
        continue;
      }

      ++report.examined;
      auto outcome = Outcome::kSkipped;
      try {
        outcome = RunWithRetry(retry_, sweep, [&] { return per_entry(row.id); });
      } catch (const std::exception& e) {
        ++report.failed;
        report.failures.push_back({row.id, e.what()});
        LOYALTY_LOG_WARN("sweep entry failed",
                         {observability::StringField("sweep", sweep), observability::StringField("entry_id", row.id),
                          observability::StringField("error", e.what())});
      }

      if (outcome == Outcome::kTransitioned) {
        ++report.transitioned;
        if (batch_limit_ > 0 && report.transitioned >= batch_limit_) {
          done = true;
          break;
        }
      } else {
        ++remaining_in_page;
      }
    }

    if (batch_limit_ == 0 || rows.size() < batch_limit_) {
      done = true;
    }
    offset += remaining_in_page;
  }

  LOYALTY_LOG_INFO("sweep finished",
                   {observability::StringField("sweep", sweep), observability::IntField("examined", static_cast<std::int64_t>(report.examined)),
                    observability::IntField("transitioned", static_cast<std::int64_t>(report.transitioned)),
                    observability::IntField("failed", static_cast<std::int64_t>(report.failed))});
  return report;
}

SweepReport Sweeper::MaturePending(util::TimePoint now) {
  const auto now_ms = util::ToUnixMillis(now);

  db::EntryQuery query;
  query.statuses              = {EntryStatus::kPending};
  query.available_from_lte_ms = now_ms;

  return Run("mature", query, [&](const std::string& id) { return Mature(id, now_ms); });
}

SweepReport Sweeper::ExpireAvailable(util::TimePoint now) {
  const auto now_ms = util::ToUnixMillis(now);

  db::EntryQuery query;
  query.statuses          = {EntryStatus::kAvailable};
  query.expires_at_lte_ms = now_ms;

  return Run("expire", query, [&](const std::string& id) { return Expire(id, now_ms); });
}

Sweeper::Outcome Sweeper::Mature(const std::string& entry_id, std::int64_t now_ms) {
  auto tx    = repository_->Begin();
  auto entry = repository_->GetEntry(*tx, entry_id);
  if (!entry) {
    throw util::NotFound("mature: entry " + entry_id + " vanished");
  }
  // re-checked inside the transaction: a concurrent spend may have matured it
  if (entry->status != EntryStatus::kPending || entry->available_from_ms > now_ms) {
    return Outcome::kSkipped;
  }

  const auto read_version = entry->version;
  entry->status           = EntryStatus::kAvailable;
  entry->updated_at_ms    = now_ms;
  ThrowIfDbError(repository_->UpdateEntry(*tx, *entry, read_version), "mature " + entry_id);
  tx->Commit();
  return Outcome::kTransitioned;
}

Sweeper::Outcome Sweeper::Expire(const std::string& entry_id, std::int64_t now_ms) {
  auto tx    = repository_->Begin();
  auto entry = repository_->GetEntry(*tx, entry_id);
  if (!entry) {
    throw util::NotFound("expire: entry " + entry_id + " vanished");
  }
  if (entry->status != EntryStatus::kAvailable || !ledger::IsPastExpiry(*entry, now_ms)) {
    return Outcome::kSkipped;
  }

  const auto forfeited = entry->remaining_amount;
  if (forfeited > 0) {
    LedgerEntryRecord companion;
    companion.id                = util::NewId();
    companion.user_id           = entry->user_id;
    companion.kind              = EntryKind::kExpired;
    companion.status            = EntryStatus::kExpired;
    companion.amount            = -forfeited;
    companion.available_from_ms = now_ms;
    companion.source_entry_id   = entry->id;
    companion.description       = "expired remainder of " + entry->id;
    companion.created_at_ms     = now_ms;
    companion.updated_at_ms     = now_ms;
    ThrowIfDbError(repository_->InsertEntry(*tx, companion), "expire: insert companion for " + entry_id);
  }

  const auto read_version = entry->version;
  entry->remaining_amount = 0;
  entry->status           = EntryStatus::kExpired;
  entry->updated_at_ms    = now_ms;
  ThrowIfDbError(repository_->UpdateEntry(*tx, *entry, read_version), "expire " + entry_id);
  tx->Commit();

  LOYALTY_LOG_DEBUG("grant expired", {observability::StringField("entry_id", entry_id), observability::IntField("forfeited", forfeited)});
  return Outcome::kTransitioned;
}

} // namespace loyalty::core
