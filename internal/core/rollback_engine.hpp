#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/core/retry.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace loyalty::core {

struct RollbackOutcome {
  db::model::UsageRecord usage;

  // returned to grants that are still live
  std::int64_t restored_amount = 0;

  // drawn from grants that expired since the spend; recorded as expired
  // instead of being restored
  std::int64_t             forfeited_amount = 0;
  std::vector<std::string> forfeited_entry_ids;
};

/*
  Reverses a committed usage.

  Every referenced grant is re-read and restored additively. A grant that was
  swept to Expired in the meantime is not resurrected; its share is written as
  an expired companion entry instead. The spend entry moves to Cancelled and
  the usage to RolledBack. All of it is one transaction.

  Throws:
    util::AlreadyRolledBackOrMissing  unknown or already rolled back usage
    util::PartialStateCorruption      a referenced entry no longer exists
*/
class RollbackEngine {
 public:
  RollbackEngine(std::shared_ptr<db::Repository> repository, RetryPolicy retry);

  RollbackOutcome Rollback(const std::string& usage_id, const std::string& reason, util::TimePoint now);

 private:
  std::shared_ptr<db::Repository> repository_;
  RetryPolicy                     retry_;
};

} // namespace loyalty::core
