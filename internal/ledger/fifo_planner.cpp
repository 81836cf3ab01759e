#include "internal/ledger/fifo_planner.hpp"

#include <algorithm>
#include <tuple>

#include "internal/ledger/balance_aggregator.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/util/errors.hpp"

namespace loyalty::ledger {

using db::model::LedgerEntryRecord;
using model::EntryStatus;

std::vector<LedgerEntryRecord> SelectEligible(const std::vector<LedgerEntryRecord>& entries, std::int64_t now_ms) {
  std::vector<LedgerEntryRecord> eligible;
  for (const auto& e : entries) {
    if (e.remaining_amount > 0 && IsSpendable(e, now_ms)) {
      eligible.push_back(e);
    }
  }
  std::sort(eligible.begin(), eligible.end(), [](const auto& a, const auto& b) {
    return std::tie(a.available_from_ms, a.created_at_ms, a.id) < std::tie(b.available_from_ms, b.created_at_ms, b.id);
  });
  return eligible;
}

DrawPlan PlanDraws(const std::vector<LedgerEntryRecord>& eligible, std::int64_t amount) {
  if (amount <= 0) {
    throw util::InvalidAmount("spend amount must be positive, got " + std::to_string(amount));
  }

  DrawPlan plan;
  for (const auto& e : eligible) {
    plan.eligible_total += e.remaining_amount;
  }
  if (plan.eligible_total < amount) {
    throw util::InsufficientFunds(amount, plan.eligible_total);
  }

  auto still_needed = amount;
  for (const auto& e : eligible) {
    if (still_needed == 0) {
      break;
    }
    const auto drawn = std::min(e.remaining_amount, still_needed);
    plan.draws.push_back({e.id, drawn});
    still_needed -= drawn;
  }
  return plan;
}

void ApplyDraw(LedgerEntryRecord& grant, std::int64_t amount_drawn, std::int64_t now_ms) {
  if (amount_drawn <= 0 || amount_drawn > grant.remaining_amount) {
    throw util::InvalidState("draw of " + std::to_string(amount_drawn) + " exceeds remainder of grant " + grant.id);
  }

  if (grant.status == EntryStatus::kPending) {
    grant.status = EntryStatus::kAvailable;
  }
  grant.remaining_amount -= amount_drawn;
  const auto next = grant.remaining_amount == 0 ? EntryStatus::kUsed : EntryStatus::kAvailable;
  if (!model::CanTransition(grant.status, next)) {
    throw util::InvalidState("grant " + grant.id + " cannot move from " + std::string(model::ToString(grant.status)) + " to " +
                             std::string(model::ToString(next)));
  }
  grant.status        = next;
  grant.updated_at_ms = now_ms;
}

} // namespace loyalty::ledger
