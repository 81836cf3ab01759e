#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/consumption_engine.hpp"
#include "internal/core/retry.hpp"
#include "internal/core/rollback_engine.hpp"
#include "internal/core/sweeper.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/ledger/accrual_calculator.hpp"
#include "internal/ledger/balance_aggregator.hpp"
#include "internal/util/time.hpp"

namespace loyalty::core {

struct GrantContext {
  bool   is_influencer   = false;
  double tier_multiplier = 1.0;
  // source reservation of an earned_service grant
  std::string reservation_id;
  // free text; the reason of an admin adjustment
  std::string description;
};

struct HistoryFilter {
  std::vector<loyalty::model::EntryKind>   kinds;
  std::vector<loyalty::model::EntryStatus> statuses;
  std::optional<std::int64_t>              created_from_ms;
  std::optional<std::int64_t>              created_to_ms;
};

template <typename T>
struct Page {
  std::vector<T> items;
  std::uint64_t  total  = 0;
  std::size_t    limit  = 0;
  std::size_t    offset = 0;
};

struct LedgerOptions {
  ledger::AccrualPolicy accrual;
  RetryPolicy           retry;
  std::uint32_t         sweep_batch_limit = 0;
};

/*
  LedgerManager

  Entry point for every ledger operation. Owns the engines and the clock;
  all state lives in the repository.
*/
class LedgerManager {
 public:
  LedgerManager(std::shared_ptr<db::Repository> repository, LedgerOptions options = {}, util::ClockFn clock = util::Now);

  db::model::LedgerEntryRecord CreateGrant(const std::string& user_id, loyalty::model::EntryKind kind, std::int64_t base_amount,
                                           const GrantContext& context = {});

  ledger::BalanceSnapshot GetBalance(const std::string& user_id, std::optional<util::TimePoint> as_of = std::nullopt);

  db::model::UsageRecord Spend(const std::string& user_id, std::int64_t amount, const std::string& reservation_id);
  db::model::UsageRecord AdjustDown(const std::string& user_id, std::int64_t amount, const std::string& reason);

  RollbackOutcome Rollback(const std::string& usage_id, const std::string& reason);

  // Pending grant, or Available grant nothing was drawn from.
  db::model::LedgerEntryRecord CancelGrant(const std::string& entry_id, const std::string& reason);

  // Newest first.
  Page<db::model::LedgerEntryRecord> ListHistory(const std::string& user_id, const HistoryFilter& filter = {},
                                                 const db::Pagination& pagination = {});

  std::optional<db::model::UsageRecord> GetUsage(const std::string& usage_id);
  std::vector<db::model::UsageRecord>   ListUsages(const std::string& user_id, const db::Pagination& pagination = {});

  ledger::ExpiringSummary ExpiringSoon(const std::string& user_id, std::chrono::milliseconds window,
                                       std::optional<util::TimePoint> as_of = std::nullopt);

  SweepReport SweepMaturation(util::TimePoint now);
  SweepReport SweepExpiration(util::TimePoint now);

  const LedgerOptions& Options() const {
    return options_;
  }

 private:
  std::vector<db::model::LedgerEntryRecord> LoadUserEntries(const std::string& user_id);

  std::shared_ptr<db::Repository> repository_;
  LedgerOptions                   options_;
  util::ClockFn                   clock_;

  ledger::AccrualCalculator accrual_;
  ConsumptionEngine         consumption_;
  RollbackEngine            rollback_;
  Sweeper                   sweeper_;
};

} // namespace loyalty::core
