#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/entry_kind.hpp"

namespace loyalty::db::model {

/*
  Persistent ledger row. One row per point grant, spend, forfeiture or
  admin adjustment.

  IMPORTANT:
  - version is the optimistic concurrency counter. Every successful update
    increments it; writers must present the version they read.
  - remaining_amount is only meaningful for grants (amount > 0).
*/

struct LedgerEntryRecord {
  std::string id;
  std::string user_id;

  loyalty::model::EntryKind   kind   = loyalty::model::EntryKind::kEarnedService;
  loyalty::model::EntryStatus status = loyalty::model::EntryStatus::kPending;

  int64_t amount           = 0;
  int64_t remaining_amount = 0;

  int64_t                available_from_ms = 0;
  std::optional<int64_t> expires_at_ms;

  std::string linked_usage_id;
  std::string source_entry_id;
  std::string reservation_id;
  std::string description;

  int64_t created_at_ms = 0;
  int64_t updated_at_ms = 0;

  uint64_t version = 1;

  bool IsGrant() const {
    return amount > 0;
  }
};

} // namespace loyalty::db::model
