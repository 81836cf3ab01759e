#include "internal/ledger/balance_aggregator.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <vector>

namespace {

using loyalty::db::model::LedgerEntryRecord;
using loyalty::ledger::Aggregate;
using loyalty::ledger::BalanceSnapshot;
using loyalty::ledger::ExpiringWithin;
using loyalty::model::EntryKind;
using loyalty::model::EntryStatus;

constexpr std::int64_t kNow = 1700000000000;
constexpr std::int64_t kDay = 86400000;

LedgerEntryRecord Grant(const std::string& id, std::int64_t amount, std::int64_t remaining, EntryStatus status, std::int64_t available_from,
                        std::optional<std::int64_t> expires_at) {
  LedgerEntryRecord e;
  e.id                = id;
  e.user_id           = "user-1";
  e.kind              = EntryKind::kEarnedService;
  e.status            = status;
  e.amount            = amount;
  e.remaining_amount  = remaining;
  e.available_from_ms = available_from;
  e.expires_at_ms     = expires_at;
  e.created_at_ms     = available_from - 7 * kDay;
  return e;
}

LedgerEntryRecord Debit(const std::string& id, EntryKind kind, std::int64_t amount, EntryStatus status) {
  LedgerEntryRecord e;
  e.id            = id;
  e.user_id       = "user-1";
  e.kind          = kind;
  e.status        = status;
  e.amount        = -amount;
  e.created_at_ms = kNow - kDay;
  return e;
}

void AssertConserved(const BalanceSnapshot& b) {
  assert(b.total_earned - b.total_used - b.expired_balance - b.pending_balance == b.available_balance);
  assert(b.available_balance >= 0);
}

void TestEmptyLedger() {
  const auto b = Aggregate("user-1", {}, kNow);
  assert(b.user_id == "user-1");
  assert(b.total_earned == 0 && b.available_balance == 0 && b.pending_balance == 0);
  assert(b.last_calculated_at_ms == kNow);
}

void TestRemainingIsAlreadyNet() {
  // 1000 granted, 600 used: available is the remainder, not 1000 - 600 again
  std::vector<LedgerEntryRecord> entries = {
      Grant("g1", 1000, 400, EntryStatus::kAvailable, kNow - 8 * kDay, kNow + 300 * kDay),
      Debit("s1", EntryKind::kUsedService, 600, EntryStatus::kUsed),
  };

  const auto b = Aggregate("user-1", entries, kNow);
  assert(b.total_earned == 1000);
  assert(b.total_used == 600);
  assert(b.available_balance == 400);
  assert(b.pending_balance == 0);
  assert(b.expired_balance == 0);
  AssertConserved(b);
}

void TestPendingAndMaturedUnswept() {
  std::vector<LedgerEntryRecord> entries = {
      // still held
      Grant("held", 500, 500, EntryStatus::kPending, kNow + 2 * kDay, kNow + 367 * kDay),
      // holding period over, sweep has not run: already spendable
      Grant("matured", 300, 300, EntryStatus::kPending, kNow - kDay, kNow + 364 * kDay),
  };

  const auto b = Aggregate("user-1", entries, kNow);
  assert(b.pending_balance == 500);
  assert(b.available_balance == 300);
  AssertConserved(b);

  // the same snapshot seen three days later
  const auto later = Aggregate("user-1", entries, kNow + 3 * kDay);
  assert(later.pending_balance == 0);
  assert(later.available_balance == 800);
  AssertConserved(later);
}

void TestExpiredAndForfeited() {
  std::vector<LedgerEntryRecord> entries = {
      // swept: remainder moved to a companion entry
      Grant("swept", 500, 0, EntryStatus::kExpired, kNow - 400 * kDay, kNow - 35 * kDay),
      Debit("c1", EntryKind::kExpired, 500, EntryStatus::kExpired),
      // past expiry but not swept yet
      Grant("unswept", 200, 150, EntryStatus::kAvailable, kNow - 380 * kDay, kNow - kDay),
      Debit("s1", EntryKind::kUsedService, 50, EntryStatus::kUsed),
  };

  const auto b = Aggregate("user-1", entries, kNow);
  assert(b.total_earned == 700);
  assert(b.total_used == 50);
  assert(b.expired_balance == 650);
  assert(b.available_balance == 0);
  AssertConserved(b);
}

void TestCancelledEntriesAreIgnored() {
  std::vector<LedgerEntryRecord> entries = {
      Grant("g1", 300, 300, EntryStatus::kAvailable, kNow - 8 * kDay, kNow + 300 * kDay),
      Grant("refunded", 999, 0, EntryStatus::kCancelled, kNow + kDay, kNow + 366 * kDay),
      // rolled back spend
      Debit("s1", EntryKind::kUsedService, 100, EntryStatus::kCancelled),
      // admin deduction counts as usage
      Debit("a1", EntryKind::kAdjustedByAdmin, 40, EntryStatus::kUsed),
  };
  entries[0].remaining_amount = 260;

  const auto b = Aggregate("user-1", entries, kNow);
  assert(b.total_earned == 300);
  assert(b.total_used == 40);
  assert(b.available_balance == 260);
  AssertConserved(b);
}

void TestExpiringWithinWindow() {
  std::vector<LedgerEntryRecord> entries = {
      Grant("late", 100, 100, EntryStatus::kAvailable, kNow - 360 * kDay, kNow + 5 * kDay),
      Grant("soon", 100, 70, EntryStatus::kAvailable, kNow - 363 * kDay, kNow + 2 * kDay),
      Grant("far", 100, 100, EntryStatus::kAvailable, kNow - 10 * kDay, kNow + 355 * kDay),
      Grant("empty", 100, 0, EntryStatus::kUsed, kNow - 364 * kDay, kNow + kDay),
      Grant("gone", 100, 100, EntryStatus::kAvailable, kNow - 366 * kDay, kNow - kDay),
  };

  const auto summary = ExpiringWithin("user-1", entries, kNow, std::chrono::hours(24 * 7));
  assert(summary.total == 170);
  assert(summary.entries.size() == 2);
  assert(summary.entries[0].id == "soon");
  assert(summary.entries[1].id == "late");
  assert(summary.window_end_ms == kNow + 7 * kDay);
}

} // namespace

int main() {
  TestEmptyLedger();
  TestRemainingIsAlreadyNet();
  TestPendingAndMaturedUnswept();
  TestExpiredAndForfeited();
  TestCancelledEntriesAreIgnored();
  TestExpiringWithinWindow();

  std::cout << "loyalty_ledger_unit_balance_aggregator: pass\n";
  return 0;
}
