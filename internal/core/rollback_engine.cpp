#include "internal/core/rollback_engine.hpp"

#include <algorithm>

#include "internal/core/db_errors.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace loyalty::core {

using db::model::LedgerEntryRecord;
using db::model::UsageRecord;
using loyalty::model::EntryKind;
using loyalty::model::EntryStatus;
using loyalty::model::UsageStatus;

namespace {

struct Restoration {
  LedgerEntryRecord grant;
  std::int64_t      amount = 0;
};

LedgerEntryRecord LoadReferenced(db::Repository& repository, db::Transaction& tx, const UsageRecord& usage, const std::string& entry_id) {
  auto entry = repository.GetEntry(tx, entry_id);
  if (!entry) {
    LOYALTY_LOG_ERROR("rollback integrity failure: referenced entry missing, manual audit required",
                      {observability::StringField("usage_id", usage.id), observability::StringField("entry_id", entry_id),
                       observability::StringField("user_id", usage.user_id)});
    throw util::PartialStateCorruption(usage.id, entry_id);
  }
  return *entry;
}

} // namespace

RollbackEngine::RollbackEngine(std::shared_ptr<db::Repository> repository, RetryPolicy retry)
    : repository_(std::move(repository)), retry_(retry) {
  if (!repository_) {
    throw std::invalid_argument("RollbackEngine: repository must not be null");
  }
}

RollbackOutcome RollbackEngine::Rollback(const std::string& usage_id, const std::string& reason, util::TimePoint now) {
  const auto now_ms = util::ToUnixMillis(now);

  auto outcome = RunWithRetry(retry_, "rollback", [&] {
    auto tx    = repository_->Begin();
    auto usage = repository_->GetUsage(*tx, usage_id);
    if (!usage || usage->status != UsageStatus::kCommitted) {
      throw util::AlreadyRolledBackOrMissing("usage " + usage_id + " is unknown or already rolled back");
    }

    // read everything before the first write
    std::vector<Restoration> restorations;
    for (const auto& draw : usage->consumed_from) {
      auto it = std::find_if(restorations.begin(), restorations.end(), [&](const auto& r) { return r.grant.id == draw.grant_entry_id; });
      if (it != restorations.end()) {
        it->amount += draw.amount_drawn;
        continue;
      }
      restorations.push_back({LoadReferenced(*repository_, *tx, *usage, draw.grant_entry_id), draw.amount_drawn});
    }
    auto spend_entry = LoadReferenced(*repository_, *tx, *usage, usage->spend_entry_id);

    RollbackOutcome result;
    for (auto& [grant, amount] : restorations) {
      if (grant.status == EntryStatus::kExpired) {
        LedgerEntryRecord companion;
        companion.id                = util::NewId();
        companion.user_id           = grant.user_id;
        companion.kind              = EntryKind::kExpired;
        companion.status            = EntryStatus::kExpired;
        companion.amount            = -amount;
        companion.available_from_ms = now_ms;
        companion.linked_usage_id   = usage->id;
        companion.source_entry_id   = grant.id;
        companion.description       = "forfeited on rollback of usage " + usage->id;
        companion.created_at_ms     = now_ms;
        companion.updated_at_ms     = now_ms;
        ThrowIfDbError(repository_->InsertEntry(*tx, companion), "rollback: insert forfeiture for " + grant.id);

        result.forfeited_amount += amount;
        result.forfeited_entry_ids.push_back(grant.id);
        continue;
      }
      if (grant.status == EntryStatus::kCancelled) {
        throw util::InvalidState("rollback: grant " + grant.id + " was cancelled while drawn by usage " + usage->id);
      }

      const auto read_version = grant.version;
      grant.remaining_amount += amount;
      if (grant.status == EntryStatus::kUsed && grant.remaining_amount > 0) {
        grant.status = EntryStatus::kAvailable;
      }
      grant.updated_at_ms = now_ms;
      ThrowIfDbError(repository_->UpdateEntry(*tx, grant, read_version), "rollback: restore grant " + grant.id);
      result.restored_amount += amount;
    }

    if (!loyalty::model::CanTransition(spend_entry.status, EntryStatus::kCancelled)) {
      throw util::InvalidState("rollback: spend entry " + spend_entry.id + " is " + std::string(loyalty::model::ToString(spend_entry.status)));
    }
    const auto spend_version  = spend_entry.version;
    spend_entry.status        = EntryStatus::kCancelled;
    spend_entry.updated_at_ms = now_ms;
    ThrowIfDbError(repository_->UpdateEntry(*tx, spend_entry, spend_version), "rollback: cancel spend entry");

    const auto usage_version   = usage->version;
    usage->status              = UsageStatus::kRolledBack;
    usage->rollback_reason     = reason;
    usage->rolled_back_at_ms   = now_ms;
    usage->version             = usage_version + 1;
    ThrowIfDbError(repository_->UpdateUsage(*tx, *usage, usage_version), "rollback: mark usage");

    tx->Commit();
    result.usage = std::move(*usage);
    return result;
  });

  LOYALTY_LOG_INFO("usage rolled back",
                   {observability::StringField("usage_id", usage_id), observability::StringField("user_id", outcome.usage.user_id),
                    observability::IntField("restored", outcome.restored_amount), observability::IntField("forfeited", outcome.forfeited_amount),
                    observability::StringField("reason", reason)});
  return outcome;
}

} // namespace loyalty::core
