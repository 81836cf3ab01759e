#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/core/retry.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace loyalty::core {

struct SweepFailure {
  std::string entry_id;
  std::string reason;
};

struct SweepReport {
  std::uint64_t             examined     = 0;
  std::uint64_t             transitioned = 0;
  std::uint64_t             failed       = 0;
  std::vector<SweepFailure> failures;
};

/*
  Batch lifecycle transitions, driven by an external scheduler.

  Each entry is handled in its own transaction with its own retry budget. A
  failing entry is recorded in the report and the sweep moves on. Both sweeps
  are idempotent: entries already in the target state are skipped.
*/
class Sweeper {
 public:
  // batch_limit bounds the entries transitioned per run, 0 = unlimited.
  // Entries that fail or are skipped do not count against it.
  Sweeper(std::shared_ptr<db::Repository> repository, RetryPolicy retry, std::uint32_t batch_limit = 0);

  // Pending -> Available for grants whose holding period is over.
  SweepReport MaturePending(util::TimePoint now);

  // Available -> Expired for grants past expires_at. A positive remainder is
  // forfeited through a companion Expired entry.
  SweepReport ExpireAvailable(util::TimePoint now);

 private:
  enum class Outcome { kTransitioned, kSkipped };

  std::vector<db::model::LedgerEntryRecord> ScanPage(db::EntryQuery query, std::uint32_t offset);

  template <typename Fn>
  SweepReport Run(std::string_view sweep, const db::EntryQuery& query, Fn&& per_entry);

  Outcome Mature(const std::string& entry_id, std::int64_t now_ms);
  Outcome Expire(const std::string& entry_id, std::int64_t now_ms);

  std::shared_ptr<db::Repository> repository_;
  RetryPolicy                     retry_;
  std::uint32_t                   batch_limit_;
};

} // namespace loyalty::core
