#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/core/retry.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace loyalty::core {

// reservation id recorded on usages created by AdjustDown
inline constexpr const char* kAdminAdjustmentReservation = "admin-adjustment";

/*
  FIFO consumption.

  CRITICAL GUARANTEES:
  - The balance check and the draws use the same transaction snapshot
  - Grant decrements, the usage record and its spend entry commit together
    or not at all
  - Every grant write is conditioned on the version that was read, so two
    spends can never draw the same remainder
*/
class ConsumptionEngine {
 public:
  ConsumptionEngine(std::shared_ptr<db::Repository> repository, RetryPolicy retry);

  db::model::UsageRecord Spend(const std::string& user_id, std::int64_t amount, const std::string& reservation_id, util::TimePoint now);

  // Admin deduction: same walk, recorded as a negative adjustment.
  db::model::UsageRecord AdjustDown(const std::string& user_id, std::int64_t amount, const std::string& reason, util::TimePoint now);

 private:
  struct Debit {
    loyalty::model::EntryKind kind;
    std::string               reservation_id;
    std::string               description;
  };

  db::model::UsageRecord Consume(const std::string& user_id, std::int64_t amount, const Debit& debit, util::TimePoint now);

  std::shared_ptr<db::Repository> repository_;
  RetryPolicy                     retry_;
};

} // namespace loyalty::core
