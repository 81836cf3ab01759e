#include "internal/core/consumption_engine.hpp"

#include "internal/core/db_errors.hpp"
#include "internal/ledger/fifo_planner.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace loyalty::core {

using db::model::LedgerEntryRecord;
using db::model::UsageRecord;
using loyalty::model::EntryKind;
using loyalty::model::EntryStatus;

ConsumptionEngine::ConsumptionEngine(std::shared_ptr<db::Repository> repository, RetryPolicy retry)
    : repository_(std::move(repository)), retry_(retry) {
  if (!repository_) {
    throw std::invalid_argument("ConsumptionEngine: repository must not be null");
  }
}

UsageRecord ConsumptionEngine::Spend(const std::string& user_id, std::int64_t amount, const std::string& reservation_id, util::TimePoint now) {
  if (reservation_id.empty()) {
    throw util::InvalidArgument("spend: reservation id is required");
  }
  return Consume(user_id, amount, {EntryKind::kUsedService, reservation_id, "used for reservation " + reservation_id}, now);
}

UsageRecord ConsumptionEngine::AdjustDown(const std::string& user_id, std::int64_t amount, const std::string& reason, util::TimePoint now) {
  if (reason.empty()) {
    throw util::InvalidArgument("adjust down: reason is required");
  }
  return Consume(user_id, amount, {EntryKind::kAdjustedByAdmin, kAdminAdjustmentReservation, reason}, now);
}

UsageRecord ConsumptionEngine::Consume(const std::string& user_id, std::int64_t amount, const Debit& debit, util::TimePoint now) {
  if (user_id.empty()) {
    throw util::InvalidArgument("spend: user id is required");
  }
  if (amount <= 0) {
    throw util::InvalidAmount("spend amount must be positive, got " + std::to_string(amount));
  }

  const auto now_ms = util::ToUnixMillis(now);

  auto usage = RunWithRetry(retry_, "spend", [&] {
    auto tx = repository_->Begin();

    db::EntryQuery query;
    query.user_id  = user_id;
    query.statuses = {EntryStatus::kPending, EntryStatus::kAvailable};
    query.order    = db::EntryOrder::kFifo;

    const auto eligible = ledger::SelectEligible(repository_->ListEntries(*tx, query), now_ms);
    const auto plan     = ledger::PlanDraws(eligible, amount);

    UsageRecord record;
    record.id             = util::NewId();
    record.user_id        = user_id;
    record.reservation_id = debit.reservation_id;
    record.total_amount   = amount;
    record.status         = loyalty::model::UsageStatus::kCommitted;
    record.consumed_from  = plan.draws;
    record.spend_entry_id = util::NewId();
    record.created_at_ms  = now_ms;

    // plan.draws is a prefix of eligible
    for (std::size_t i = 0; i < plan.draws.size(); ++i) {
      const auto& grant   = eligible[i];
      auto        updated = grant;
      ledger::ApplyDraw(updated, plan.draws[i].amount_drawn, now_ms);
      ThrowIfDbError(repository_->UpdateEntry(*tx, updated, grant.version), "spend: update grant " + grant.id);
    }

    LedgerEntryRecord spend_entry;
    spend_entry.id                = record.spend_entry_id;
    spend_entry.user_id           = user_id;
    spend_entry.kind              = debit.kind;
    spend_entry.status            = EntryStatus::kUsed;
    spend_entry.amount            = -amount;
    spend_entry.remaining_amount  = 0;
    spend_entry.available_from_ms = now_ms;
    spend_entry.linked_usage_id   = record.id;
    spend_entry.reservation_id    = debit.reservation_id;
    spend_entry.description       = debit.description;
    spend_entry.created_at_ms     = now_ms;
    spend_entry.updated_at_ms     = now_ms;

    ThrowIfDbError(repository_->InsertEntry(*tx, spend_entry), "spend: insert spend entry");
    ThrowIfDbError(repository_->InsertUsage(*tx, record), "spend: insert usage");
    tx->Commit();
    return record;
  });

  LOYALTY_LOG_INFO("points consumed",
                   {observability::StringField("user_id", user_id), observability::StringField("usage_id", usage.id),
                    observability::StringField("kind", loyalty::model::ToString(debit.kind)),
                    observability::IntField("amount", amount), observability::IntField("grants", static_cast<std::int64_t>(usage.consumed_from.size()))});
  return usage;
}

} // namespace loyalty::core
