#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "internal/db/model/ledger_entry_record.hpp"

namespace loyalty::ledger {

struct BalanceSnapshot {
  std::string  user_id;
  std::int64_t total_earned          = 0;
  std::int64_t total_used            = 0;
  std::int64_t available_balance     = 0;
  std::int64_t pending_balance       = 0;
  std::int64_t expired_balance       = 0;
  std::int64_t last_calculated_at_ms = 0;
};

struct ExpiringSummary {
  std::string  user_id;
  std::int64_t total         = 0;
  std::int64_t window_end_ms = 0;
  // ordered by expires_at
  std::vector<db::model::LedgerEntryRecord> entries;
};

// Grant has an expiry at or before now_ms.
bool IsPastExpiry(const db::model::LedgerEntryRecord& entry, std::int64_t now_ms);

// Grant counts towards the available balance: Available (or a Pending
// grant whose holding period is over) and not past expiry.
bool IsSpendable(const db::model::LedgerEntryRecord& entry, std::int64_t now_ms);

/*
  Pure balance computation over one user's entries.

  available = sum of remaining_amount over spendable grants. remaining_amount
  is already net of draws, so used totals are never subtracted again.

  For entries written by the engine:
    total_earned - total_used - expired_balance - pending_balance == available_balance
*/
BalanceSnapshot Aggregate(const std::string& user_id, const std::vector<db::model::LedgerEntryRecord>& entries, std::int64_t now_ms);

// Spendable grants expiring in (now, now + window].
ExpiringSummary ExpiringWithin(const std::string& user_id, const std::vector<db::model::LedgerEntryRecord>& entries, std::int64_t now_ms,
                               std::chrono::milliseconds window);

} // namespace loyalty::ledger
