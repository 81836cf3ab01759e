#include "internal/model/entry_kind.hpp"

#include <array>

namespace loyalty::model {

std::optional<EntryKind> ParseEntryKind(std::string_view value) {
  static constexpr std::array kKinds = {EntryKind::kEarnedService, EntryKind::kEarnedReferral, EntryKind::kInfluencerBonus,
                                        EntryKind::kUsedService,   EntryKind::kExpired,        EntryKind::kAdjustedByAdmin};
  for (auto kind : kKinds) {
    if (ToString(kind) == value) {
      return kind;
    }
  }
  return std::nullopt;
}

std::optional<EntryStatus> ParseEntryStatus(std::string_view value) {
  static constexpr std::array kStatuses = {EntryStatus::kPending, EntryStatus::kAvailable, EntryStatus::kUsed, EntryStatus::kExpired,
                                           EntryStatus::kCancelled};
  for (auto status : kStatuses) {
    if (ToString(status) == value) {
      return status;
    }
  }
  return std::nullopt;
}

} // namespace loyalty::model
