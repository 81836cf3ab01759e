#pragma once

#include "internal/model/entry_kind.hpp"

namespace loyalty::model {

constexpr bool IsTerminal(EntryStatus status) {
  return status == EntryStatus::kExpired || status == EntryStatus::kCancelled;
}

/*
  Grant lifecycle:

    Pending -> Available -> Used
       |          |  ^------'   (rollback restores a drawn remainder)
       |          +--> Expired
       +--> Cancelled <--+      (Available only while nothing was drawn)

  Spend entries are born Used and may only move to Cancelled on rollback.
*/
constexpr bool CanTransition(EntryStatus from, EntryStatus to) {
  if (from == to) {
    return true;
  }
  if (IsTerminal(from)) {
    return false;
  }

  switch (from) {
    case EntryStatus::kPending:
      return to == EntryStatus::kAvailable || to == EntryStatus::kCancelled;
    case EntryStatus::kAvailable:
      return to == EntryStatus::kUsed || to == EntryStatus::kExpired || to == EntryStatus::kCancelled;
    case EntryStatus::kUsed:
      return to == EntryStatus::kAvailable || to == EntryStatus::kCancelled;
    default:
      return false;
  }
}

} // namespace loyalty::model
