#include "internal/core/sweeper.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/core/ledger_manager.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "tests/unit/hooked_repository.hpp"

namespace {

using loyalty::core::LedgerManager;
using loyalty::core::LedgerOptions;
using loyalty::core::RetryPolicy;
using loyalty::core::Sweeper;
using loyalty::db::memory::MemoryRepository;
using loyalty::model::EntryKind;
using loyalty::model::EntryStatus;
using loyalty::testing::HookedRepository;
using loyalty::testing::ManualClock;

constexpr auto kDay = std::chrono::hours(24);

struct Fixture {
  explicit Fixture(LedgerOptions options = {})
      : repo(std::make_shared<HookedRepository>(std::make_shared<MemoryRepository>())), ledger(repo, options, clock.Fn()) {
  }

  ManualClock                       clock;
  std::shared_ptr<HookedRepository> repo;
  LedgerManager                     ledger;

  loyalty::db::model::LedgerEntryRecord Load(const std::string& id) {
    auto tx = repo->Begin();
    return *repo->GetEntry(*tx, id);
  }
};

void TestMaturationIsIdempotent() {
  Fixture f;
  const auto a = f.ledger.CreateGrant("u1", EntryKind::kEarnedService, 4000).id;
  const auto b = f.ledger.CreateGrant("u2", EntryKind::kEarnedReferral, 1).id;
  f.clock.Advance(3 * kDay);
  const auto young = f.ledger.CreateGrant("u1", EntryKind::kEarnedService, 4000).id;

  f.clock.Advance(5 * kDay);
  auto report = f.ledger.SweepMaturation(f.clock.Now());
  assert(report.examined == 2);
  assert(report.transitioned == 2);
  assert(report.failed == 0);
  assert(f.Load(a).status == EntryStatus::kAvailable);
  assert(f.Load(b).status == EntryStatus::kAvailable);
  assert(f.Load(young).status == EntryStatus::kPending);

  report = f.ledger.SweepMaturation(f.clock.Now());
  assert(report.transitioned == 0);
  assert(f.Load(a).version == 2);
}

void TestExpirationIsIdempotent() {
  Fixture f;
  const auto id = f.ledger.CreateGrant("u1", EntryKind::kEarnedService, 4000).id;
  f.clock.Advance(8 * kDay);
  f.ledger.SweepMaturation(f.clock.Now());

  f.clock.Advance(365 * kDay);
  assert(f.ledger.SweepExpiration(f.clock.Now()).transitioned == 1);
  const auto again = f.ledger.SweepExpiration(f.clock.Now());
  assert(again.examined == 0);
  assert(again.transitioned == 0);

  loyalty::core::HistoryFilter filter;
  filter.kinds = {EntryKind::kExpired};
  assert(f.ledger.ListHistory("u1", filter).total == 1);
  assert(f.Load(id).remaining_amount == 0);
}

void TestUsedGrantsAreNotExpired() {
  Fixture f;
  const auto id = f.ledger.CreateGrant("u1", EntryKind::kEarnedService, 4000).id;
  f.clock.Advance(8 * kDay);
  f.ledger.SweepMaturation(f.clock.Now());
  f.ledger.Spend("u1", 100, "all");

  f.clock.Advance(400 * kDay);
  const auto report = f.ledger.SweepExpiration(f.clock.Now());
  assert(report.transitioned == 0);
  assert(f.Load(id).status == EntryStatus::kUsed);
  assert(f.ledger.GetBalance("u1").expired_balance == 0);
}

void TestFailuresAreIsolated() {
  LedgerOptions options;
  options.retry = RetryPolicy{.max_attempts = 2, .backoff = std::chrono::milliseconds(0)};
  Fixture f(options);

  const auto bad  = f.ledger.CreateGrant("u1", EntryKind::kEarnedService, 4000).id;
  const auto good = f.ledger.CreateGrant("u2", EntryKind::kEarnedService, 4000).id;
  f.clock.Advance(8 * kDay);

  f.repo->on_update_entry = [&](const loyalty::db::model::LedgerEntryRecord& r, uint64_t) -> std::optional<loyalty::db::Result> {
    if (r.id == bad) {
      return loyalty::db::Result::Err(loyalty::db::ErrorCode::InternalError, "disk on fire");
    }
    return std::nullopt;
  };

  const auto report = f.ledger.SweepMaturation(f.clock.Now());
  assert(report.examined == 2);
  assert(report.transitioned == 1);
  assert(report.failed == 1);
  assert(report.failures.size() == 1);
  assert(report.failures[0].entry_id == bad);
  assert(f.Load(bad).status == EntryStatus::kPending);
  assert(f.Load(good).status == EntryStatus::kAvailable);

  // a later run picks it up
  f.repo->on_update_entry = nullptr;
  assert(f.ledger.SweepMaturation(f.clock.Now()).transitioned == 1);
}

void TestConflictsAreRetried() {
  Fixture f;
  const auto id = f.ledger.CreateGrant("u1", EntryKind::kEarnedService, 4000).id;
  f.clock.Advance(8 * kDay);

  int injected = 0;
  f.repo->on_update_entry = [&](const loyalty::db::model::LedgerEntryRecord&, uint64_t) -> std::optional<loyalty::db::Result> {
    if (injected++ < 2) {
      return loyalty::db::Result::Err(loyalty::db::ErrorCode::Conflict, "raced");
    }
    return std::nullopt;
  };

  const auto report = f.ledger.SweepMaturation(f.clock.Now());
  assert(report.transitioned == 1);
  assert(report.failed == 0);
  assert(f.Load(id).status == EntryStatus::kAvailable);
}

void TestBatchLimit() {
  LedgerOptions options;
  options.sweep_batch_limit = 2;
  Fixture f(options);

  for (int i = 0; i < 5; ++i) {
    f.ledger.CreateGrant("u" + std::to_string(i), EntryKind::kEarnedService, 4000);
  }
  f.clock.Advance(8 * kDay);

  assert(f.ledger.SweepMaturation(f.clock.Now()).transitioned == 2);
  assert(f.ledger.SweepMaturation(f.clock.Now()).transitioned == 2);
  assert(f.ledger.SweepMaturation(f.clock.Now()).transitioned == 1);
  assert(f.ledger.SweepMaturation(f.clock.Now()).examined == 0);
}

void TestBatchLimitPagesPastFailures() {
  LedgerOptions options;
  options.sweep_batch_limit = 2;
  options.retry             = RetryPolicy{.max_attempts = 1, .backoff = std::chrono::milliseconds(0)};
  Fixture f(options);

  const auto first  = f.ledger.CreateGrant("u1", EntryKind::kEarnedService, 4000).id;
  f.clock.Advance(std::chrono::minutes(1));
  const auto second = f.ledger.CreateGrant("u2", EntryKind::kEarnedService, 4000).id;
  f.clock.Advance(std::chrono::minutes(1));
  const auto third  = f.ledger.CreateGrant("u3", EntryKind::kEarnedService, 4000).id;
  f.clock.Advance(std::chrono::minutes(1));
  const auto fourth = f.ledger.CreateGrant("u4", EntryKind::kEarnedService, 4000).id;
  f.clock.Advance(8 * kDay);

  f.repo->on_update_entry = [&](const loyalty::db::model::LedgerEntryRecord& r, uint64_t) -> std::optional<loyalty::db::Result> {
    if (r.id == first || r.id == second) {
      return loyalty::db::Result::Err(loyalty::db::ErrorCode::InternalError, "stuck row");
    }
    return std::nullopt;
  };

  auto report = f.ledger.SweepMaturation(f.clock.Now());
  assert(report.examined == 4);
  assert(report.failed == 2);
  assert(report.transitioned == 2);
  assert(f.Load(first).status == EntryStatus::kPending);
  assert(f.Load(second).status == EntryStatus::kPending);
  assert(f.Load(third).status == EntryStatus::kAvailable);
  assert(f.Load(fourth).status == EntryStatus::kAvailable);

  // only the failing rows are left
  report = f.ledger.SweepMaturation(f.clock.Now());
  assert(report.examined == 2);
  assert(report.transitioned == 0);

  f.repo->on_update_entry = nullptr;
  assert(f.ledger.SweepMaturation(f.clock.Now()).transitioned == 2);
}

void TestSweeperDirectly() {
  ManualClock clock;
  auto        repo = std::make_shared<MemoryRepository>();
  LedgerManager ledger(repo, {}, clock.Fn());
  ledger.CreateGrant("u1", EntryKind::kEarnedService, 4000);

  Sweeper sweeper(repo, RetryPolicy{});
  assert(sweeper.MaturePending(clock.Now()).examined == 0);
  assert(sweeper.MaturePending(clock.Now() + 7 * kDay).transitioned == 1);
}

} // namespace

int main() {
  TestMaturationIsIdempotent();
  TestExpirationIsIdempotent();
  TestUsedGrantsAreNotExpired();
  TestFailuresAreIsolated();
  TestConflictsAreRetried();
  TestBatchLimit();
  TestBatchLimitPagesPastFailures();
  TestSweeperDirectly();

  std::cout << "loyalty_ledger_unit_sweeper: pass\n";
  return 0;
}
