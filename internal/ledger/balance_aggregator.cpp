#include "internal/ledger/balance_aggregator.hpp"

#include <algorithm>
#include <tuple>

namespace loyalty::ledger {

using db::model::LedgerEntryRecord;
using model::EntryKind;
using model::EntryStatus;

namespace {

bool IsLiveGrant(const LedgerEntryRecord& e) {
  return e.IsGrant() && (e.status == EntryStatus::kPending || e.status == EntryStatus::kAvailable || e.status == EntryStatus::kUsed);
}

bool IsHeld(const LedgerEntryRecord& e, std::int64_t now_ms) {
  return e.status == EntryStatus::kPending && e.available_from_ms > now_ms;
}

bool IsDebit(const LedgerEntryRecord& e) {
  return e.kind == EntryKind::kUsedService || (e.kind == EntryKind::kAdjustedByAdmin && e.amount < 0);
}

} // namespace

bool IsPastExpiry(const LedgerEntryRecord& entry, std::int64_t now_ms) {
  return entry.expires_at_ms.has_value() && *entry.expires_at_ms <= now_ms;
}

bool IsSpendable(const LedgerEntryRecord& entry, std::int64_t now_ms) {
  return IsLiveGrant(entry) && !IsHeld(entry, now_ms) && !IsPastExpiry(entry, now_ms);
}

BalanceSnapshot Aggregate(const std::string& user_id, const std::vector<LedgerEntryRecord>& entries, std::int64_t now_ms) {
  BalanceSnapshot snapshot;
  snapshot.user_id               = user_id;
  snapshot.last_calculated_at_ms = now_ms;

  for (const auto& e : entries) {
    if (e.status == EntryStatus::kCancelled) {
      continue;
    }

    if (e.IsGrant()) {
      snapshot.total_earned += e.amount;
      if (!IsLiveGrant(e)) {
        continue;
      }
      if (IsHeld(e, now_ms)) {
        snapshot.pending_balance += e.amount;
      } else if (IsPastExpiry(e, now_ms)) {
        // forfeited, the expiration sweep has not caught up yet
        snapshot.expired_balance += e.remaining_amount;
      } else {
        snapshot.available_balance += e.remaining_amount;
      }
      continue;
    }

    if (e.kind == EntryKind::kExpired) {
      snapshot.expired_balance += -e.amount;
    } else if (IsDebit(e)) {
      snapshot.total_used += -e.amount;
    }
  }
  return snapshot;
}

ExpiringSummary ExpiringWithin(const std::string& user_id, const std::vector<LedgerEntryRecord>& entries, std::int64_t now_ms,
                               std::chrono::milliseconds window) {
  ExpiringSummary summary;
  summary.user_id       = user_id;
  summary.window_end_ms = now_ms + window.count();

  for (const auto& e : entries) {
    if (!IsSpendable(e, now_ms) || e.remaining_amount <= 0 || !e.expires_at_ms) {
      continue;
    }
    if (*e.expires_at_ms <= summary.window_end_ms) {
      summary.total += e.remaining_amount;
      summary.entries.push_back(e);
    }
  }

  std::sort(summary.entries.begin(), summary.entries.end(), [](const auto& a, const auto& b) {
    return std::tie(*a.expires_at_ms, a.id) < std::tie(*b.expires_at_ms, b.id);
  });
  return summary;
}

} // namespace loyalty::ledger
