#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/entry_kind.hpp"

namespace loyalty::db::model {

struct ConsumedDraw {
  std::string grant_entry_id;
  int64_t     amount_drawn = 0;
};

/*
  One successful spend. consumed_from is the FIFO breakdown and the single
  source of truth for rollback; it is written in the same transaction as the
  grant decrements.
*/
struct UsageRecord {
  std::string id;
  std::string user_id;
  std::string reservation_id;

  int64_t total_amount = 0;

  loyalty::model::UsageStatus status = loyalty::model::UsageStatus::kCommitted;

  std::vector<ConsumedDraw> consumed_from;

  // ledger row (used_service or negative adjustment) written with this record
  std::string spend_entry_id;

  std::string rollback_reason;
  int64_t     rolled_back_at_ms = 0;

  int64_t  created_at_ms = 0;
  uint64_t version       = 1;
};

} // namespace loyalty::db::model
