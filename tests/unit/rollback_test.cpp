#include "internal/core/rollback_engine.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/core/ledger_manager.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "tests/unit/hooked_repository.hpp"

namespace {

using loyalty::core::LedgerManager;
using loyalty::core::RetryPolicy;
using loyalty::core::RollbackEngine;
using loyalty::db::memory::MemoryRepository;
using loyalty::model::EntryKind;
using loyalty::model::EntryStatus;
using loyalty::model::UsageStatus;
using loyalty::testing::HookedRepository;
using loyalty::testing::ManualClock;

constexpr auto kDay = std::chrono::hours(24);

struct Fixture {
  ManualClock                       clock;
  std::shared_ptr<HookedRepository> repo = std::make_shared<HookedRepository>(std::make_shared<MemoryRepository>());
  LedgerManager                     ledger{repo, {}, clock.Fn()};

  std::string Grant(const std::string& user, std::int64_t points) {
    const auto id = ledger.CreateGrant(user, EntryKind::kEarnedService, points * 40).id;
    clock.Advance(std::chrono::minutes(1));
    return id;
  }

  void Mature() {
    clock.Advance(8 * kDay);
    ledger.SweepMaturation(clock.Now());
  }

  loyalty::db::model::LedgerEntryRecord Load(const std::string& id) {
    auto tx    = repo->Begin();
    auto entry = repo->GetEntry(*tx, id);
    assert(entry.has_value());
    return *entry;
  }
};

template <typename Fn>
bool ThrowsAlreadyRolledBack(Fn&& fn) {
  try {
    fn();
  } catch (const loyalty::util::AlreadyRolledBackOrMissing&) {
    return true;
  }
  return false;
}

void TestDoubleRollbackIsRejected() {
  Fixture f;
  f.Grant("u1", 500);
  f.Mature();
  const auto usage = f.ledger.Spend("u1", 200, "res");

  f.ledger.Rollback(usage.id, "first");
  assert(ThrowsAlreadyRolledBack([&] { f.ledger.Rollback(usage.id, "second"); }));

  const auto balance = f.ledger.GetBalance("u1");
  assert(balance.available_balance == 500);

  // the first reason sticks
  assert(f.ledger.GetUsage(usage.id)->rollback_reason == "first");
}

void TestUnknownUsage() {
  Fixture f;
  assert(ThrowsAlreadyRolledBack([&] { f.ledger.Rollback("does-not-exist", "reason"); }));
}

void TestMissingEntryAbortsWithoutWrites() {
  Fixture f;
  const auto first = f.Grant("u1", 100);
  f.Grant("u1", 100);
  f.Mature();
  const auto usage = f.ledger.Spend("u1", 150, "res");

  f.repo->hide_entry        = [&](const std::string& id) { return id == first; };
  const auto updates_before = f.repo->update_entry_calls.load();

  bool corrupted = false;
  try {
    f.ledger.Rollback(usage.id, "reason");
  } catch (const loyalty::util::PartialStateCorruption& e) {
    corrupted = e.usage_id() == usage.id && e.entry_id() == first;
  }
  assert(corrupted);
  assert(f.repo->update_entry_calls.load() == updates_before);

  f.repo->hide_entry = nullptr;
  assert(f.ledger.GetUsage(usage.id)->status == UsageStatus::kCommitted);
  assert(f.ledger.GetBalance("u1").available_balance == 50);
}

void TestFailureAfterRestoresRollsBackNothing() {
  Fixture f;
  const auto first  = f.Grant("u1", 100);
  const auto second = f.Grant("u1", 100);
  f.Mature();
  const auto usage = f.ledger.Spend("u1", 150, "res");

  // both grant restores go through, the spend entry update fails
  f.repo->on_update_entry = [&](const loyalty::db::model::LedgerEntryRecord& r, uint64_t) -> std::optional<loyalty::db::Result> {
    if (r.id == usage.spend_entry_id) {
      return loyalty::db::Result::Err(loyalty::db::ErrorCode::IOError, "write failed");
    }
    return std::nullopt;
  };
  const auto updates_before = f.repo->update_entry_calls.load();

  bool failed = false;
  try {
    f.ledger.Rollback(usage.id, "reason");
  } catch (const std::runtime_error&) {
    failed = true;
  }
  assert(failed);
  assert(f.repo->update_entry_calls.load() - updates_before == 3);

  f.repo->on_update_entry = nullptr;
  assert(f.Load(first).remaining_amount == 0);
  assert(f.Load(first).status == EntryStatus::kUsed);
  assert(f.Load(second).remaining_amount == 50);
  assert(f.Load(usage.spend_entry_id).status != EntryStatus::kCancelled);
  assert(f.ledger.GetUsage(usage.id)->status == UsageStatus::kCommitted);
  assert(f.ledger.GetBalance("u1").available_balance == 50);

  // still reversible once the store recovers
  f.ledger.Rollback(usage.id, "reason");
  assert(f.ledger.GetBalance("u1").available_balance == 200);
}

void TestRollbackOntoSweptGrantForfeits() {
  Fixture f;
  const auto old_grant = f.Grant("u1", 100);
  f.clock.Advance(30 * kDay);
  const auto new_grant = f.Grant("u1", 100);
  f.Mature();

  const auto usage = f.ledger.Spend("u1", 60, "res");
  assert(f.Load(old_grant).remaining_amount == 40);
  assert(f.Load(new_grant).remaining_amount == 100);

  // past the old grant's expiry only
  f.clock.Advance(340 * kDay);
  assert(f.ledger.SweepExpiration(f.clock.Now()).transitioned == 1);
  assert(f.Load(old_grant).status == EntryStatus::kExpired);

  const auto outcome = f.ledger.Rollback(usage.id, "late refund");
  assert(outcome.forfeited_amount == 60);
  assert(outcome.restored_amount == 0);
  assert(outcome.forfeited_entry_ids.size() == 1 && outcome.forfeited_entry_ids[0] == old_grant);

  // not resurrected
  const auto expired = f.Load(old_grant);
  assert(expired.status == EntryStatus::kExpired);
  assert(expired.remaining_amount == 0);

  const auto balance = f.ledger.GetBalance("u1");
  assert(balance.total_used == 0);
  assert(balance.expired_balance == 100);
  assert(balance.available_balance == 100);
  assert(balance.total_earned - balance.total_used - balance.expired_balance - balance.pending_balance == balance.available_balance);
}

void TestRollbackOntoUnsweptExpiredGrantRestores() {
  Fixture f;
  const auto grant = f.Grant("u1", 100);
  f.Mature();
  const auto usage = f.ledger.Spend("u1", 100, "res");
  assert(f.Load(grant).status == EntryStatus::kUsed);

  f.clock.Advance(400 * kDay);
  const auto outcome = f.ledger.Rollback(usage.id, "");
  assert(outcome.restored_amount == 100);
  assert(outcome.forfeited_amount == 0);
  assert(f.Load(grant).remaining_amount == 100);
  // back in the expiration sweep's candidate set
  assert(f.Load(grant).status == EntryStatus::kAvailable);

  // past expiry: counted as expired until the sweep catches up
  auto balance = f.ledger.GetBalance("u1");
  assert(balance.available_balance == 0);
  assert(balance.expired_balance == 100);

  assert(f.ledger.SweepExpiration(f.clock.Now()).transitioned == 1);
  balance = f.ledger.GetBalance("u1");
  assert(balance.expired_balance == 100);
  assert(f.Load(grant).status == EntryStatus::kExpired);
}

void TestRollbackRestoresAfterPartialReuse() {
  Fixture f;
  const auto grant = f.Grant("u1", 100);
  f.Mature();

  const auto first  = f.ledger.Spend("u1", 60, "a");
  const auto second = f.ledger.Spend("u1", 30, "b");
  assert(f.Load(grant).remaining_amount == 10);

  f.ledger.Rollback(first.id, "");
  assert(f.Load(grant).remaining_amount == 70);
  f.ledger.Rollback(second.id, "");
  assert(f.Load(grant).remaining_amount == 100);
  assert(f.Load(grant).status == EntryStatus::kAvailable);
}

void TestEngineDirectly() {
  ManualClock clock;
  auto        repo = std::make_shared<MemoryRepository>();
  LedgerManager ledger(repo, {}, clock.Fn());
  ledger.CreateGrant("u1", EntryKind::kAdjustedByAdmin, 80, {.description = "seed"});
  const auto usage = ledger.Spend("u1", 80, "res");

  RollbackEngine engine(repo, RetryPolicy{});
  const auto     outcome = engine.Rollback(usage.id, "direct", clock.Now());
  assert(outcome.usage.rolled_back_at_ms == loyalty::util::ToUnixMillis(clock.Now()));
  assert(ledger.GetBalance("u1").available_balance == 80);
}

} // namespace

int main() {
  TestDoubleRollbackIsRejected();
  TestUnknownUsage();
  TestMissingEntryAbortsWithoutWrites();
  TestFailureAfterRestoresRollsBackNothing();
  TestRollbackOntoSweptGrantForfeits();
  TestRollbackOntoUnsweptExpiredGrantRestores();
  TestRollbackRestoresAfterPartialReuse();
  TestEngineDirectly();

  std::cout << "loyalty_ledger_unit_rollback: pass\n";
  return 0;
}
