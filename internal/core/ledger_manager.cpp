#include "internal/core/ledger_manager.hpp"

#include <stdexcept>

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

namespace {

void RequireUser(const std::string& user_id, const char* operation) {
  if (user_id.empty()) {
    throw util::InvalidArgument(std::string(operation) + ": user id is required");
  }
}

} // namespace

LedgerManager::LedgerManager(std::shared_ptr<db::Repository> repository, LedgerOptions options, util::ClockFn clock)
    : repository_(std::move(repository)),
      options_(options),
      clock_(clock ? std::move(clock) : util::ClockFn(util::Now)),
      accrual_(options_.accrual),
      consumption_(repository_, options_.retry),
      rollback_(repository_, options_.retry),
      sweeper_(repository_, options_.retry, options_.sweep_batch_limit) {
}

LedgerEntryRecord LedgerManager::CreateGrant(const std::string& user_id, EntryKind kind, std::int64_t base_amount, const GrantContext& context) {
  RequireUser(user_id, "create grant");

  const auto now     = clock_();
  const auto now_ms  = util::ToUnixMillis(now);
  const auto accrual = accrual_.Calculate({.kind            = kind,
                                           .base_amount     = base_amount,
                                           .is_influencer   = context.is_influencer,
                                           .tier_multiplier = context.tier_multiplier,
                                           .reason          = context.description},
                                          now);

  LedgerEntryRecord entry;
  entry.id                = util::NewId();
  entry.user_id           = user_id;
  entry.kind              = kind;
  entry.status            = accrual.status;
  entry.amount            = accrual.amount;
  entry.remaining_amount  = accrual.amount;
  entry.available_from_ms = accrual.available_from_ms;
  entry.expires_at_ms     = accrual.expires_at_ms;
  entry.reservation_id    = context.reservation_id;
  entry.description       = context.description;
  entry.created_at_ms     = now_ms;
  entry.updated_at_ms     = now_ms;

  RunWithRetry(options_.retry, "create grant", [&] {
    auto tx = repository_->Begin();
    ThrowIfDbError(repository_->InsertEntry(*tx, entry), "create grant");
    tx->Commit();
  });

  LOYALTY_LOG_INFO("grant created",
                   {observability::StringField("user_id", user_id), observability::StringField("entry_id", entry.id),
                    observability::StringField("kind", loyalty::model::ToString(kind)), observability::IntField("amount", entry.amount),
                    observability::StringField("status", loyalty::model::ToString(entry.status))});
  return entry;
}

std::vector<LedgerEntryRecord> LedgerManager::LoadUserEntries(const std::string& user_id) {
  db::EntryQuery query;
  query.user_id = user_id;

  return RunWithRetry(options_.retry, "load entries", [&] {
    auto tx = repository_->Begin();
    return repository_->ListEntries(*tx, query);
  });
}

ledger::BalanceSnapshot LedgerManager::GetBalance(const std::string& user_id, std::optional<util::TimePoint> as_of) {
  RequireUser(user_id, "balance");
  const auto now_ms = util::ToUnixMillis(as_of.value_or(clock_()));
  return ledger::Aggregate(user_id, LoadUserEntries(user_id), now_ms);
}

UsageRecord LedgerManager::Spend(const std::string& user_id, std::int64_t amount, const std::string& reservation_id) {
  try {
    return consumption_.Spend(user_id, amount, reservation_id, clock_());
  } catch (const util::InsufficientFunds& e) {
    LOYALTY_LOG_INFO("spend rejected",
                     {observability::StringField("user_id", user_id), observability::StringField("reservation_id", reservation_id),
                      observability::IntField("requested", e.requested()), observability::IntField("available", e.available())});
    throw;
  }
}

UsageRecord LedgerManager::AdjustDown(const std::string& user_id, std::int64_t amount, const std::string& reason) {
  return consumption_.AdjustDown(user_id, amount, reason, clock_());
}

RollbackOutcome LedgerManager::Rollback(const std::string& usage_id, const std::string& reason) {
  return rollback_.Rollback(usage_id, reason, clock_());
}

LedgerEntryRecord LedgerManager::CancelGrant(const std::string& entry_id, const std::string& reason) {
  if (reason.empty()) {
    throw util::InvalidArgument("cancel grant: reason is required");
  }
  const auto now_ms = util::ToUnixMillis(clock_());

  auto cancelled = RunWithRetry(options_.retry, "cancel grant", [&] {
    auto tx    = repository_->Begin();
    auto entry = repository_->GetEntry(*tx, entry_id);
    if (!entry) {
      throw util::NotFound("cancel grant: entry " + entry_id + " not found");
    }
    if (!entry->IsGrant()) {
      throw util::InvalidState("cancel grant: entry " + entry_id + " is not a grant");
    }
    const bool untouched = entry->status == EntryStatus::kPending ||
                           (entry->status == EntryStatus::kAvailable && entry->remaining_amount == entry->amount);
    if (!untouched || !loyalty::model::CanTransition(entry->status, EntryStatus::kCancelled)) {
      throw util::InvalidState("cancel grant: entry " + entry_id + " is " + std::string(loyalty::model::ToString(entry->status)) +
                               (entry->remaining_amount != entry->amount ? " and partially drawn" : ""));
    }

    const auto read_version = entry->version;
    entry->status           = EntryStatus::kCancelled;
    entry->remaining_amount = 0;
    entry->description      = entry->description.empty() ? "cancelled: " + reason : entry->description + "; cancelled: " + reason;
    entry->updated_at_ms    = now_ms;
    entry->version          = read_version + 1;
    ThrowIfDbError(repository_->UpdateEntry(*tx, *entry, read_version), "cancel grant");
    tx->Commit();
    return *entry;
  });

  LOYALTY_LOG_INFO("grant cancelled",
                   {observability::StringField("entry_id", entry_id), observability::StringField("user_id", cancelled.user_id),
                    observability::IntField("amount", cancelled.amount), observability::StringField("reason", reason)});
  return cancelled;
}

Page<LedgerEntryRecord> LedgerManager::ListHistory(const std::string& user_id, const HistoryFilter& filter, const db::Pagination& pagination) {
  RequireUser(user_id, "history");

  db::EntryQuery query;
  query.user_id         = user_id;
  query.kinds           = filter.kinds;
  query.statuses        = filter.statuses;
  query.created_from_ms = filter.created_from_ms;
  query.created_to_ms   = filter.created_to_ms;
  query.order           = db::EntryOrder::kNewestFirst;
  query.pagination      = pagination;

  return RunWithRetry(options_.retry, "history", [&] {
    auto tx = repository_->Begin();

    Page<LedgerEntryRecord> page;
    page.items  = repository_->ListEntries(*tx, query);
    page.total  = repository_->CountEntries(*tx, query);
    page.limit  = pagination.limit;
    page.offset = pagination.offset;
    return page;
  });
}

std::optional<UsageRecord> LedgerManager::GetUsage(const std::string& usage_id) {
  return RunWithRetry(options_.retry, "get usage", [&] {
    auto tx = repository_->Begin();
    return repository_->GetUsage(*tx, usage_id);
  });
}

std::vector<UsageRecord> LedgerManager::ListUsages(const std::string& user_id, const db::Pagination& pagination) {
  RequireUser(user_id, "list usages");
  return RunWithRetry(options_.retry, "list usages", [&] {
    auto tx = repository_->Begin();
    return repository_->ListUsages(*tx, user_id, pagination);
  });
}

ledger::ExpiringSummary LedgerManager::ExpiringSoon(const std::string& user_id, std::chrono::milliseconds window,
                                                    std::optional<util::TimePoint> as_of) {
  RequireUser(user_id, "expiring");
  if (window.count() <= 0) {
    throw util::InvalidArgument("expiring: window must be positive");
  }
  const auto now_ms = util::ToUnixMillis(as_of.value_or(clock_()));
  return ledger::ExpiringWithin(user_id, LoadUserEntries(user_id), now_ms, window);
}

SweepReport LedgerManager::SweepMaturation(util::TimePoint now) {
  return sweeper_.MaturePending(now);
}

SweepReport LedgerManager::SweepExpiration(util::TimePoint now) {
  return sweeper_.ExpireAvailable(now);
}

} // namespace loyalty::core
