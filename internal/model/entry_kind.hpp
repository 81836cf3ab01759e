#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace loyalty::model {

enum class EntryKind : std::uint8_t {
  kEarnedService   = 1,
  kEarnedReferral  = 2,
  kInfluencerBonus = 3,
  kUsedService     = 4,
  kExpired         = 5,
  kAdjustedByAdmin = 6,
};

enum class EntryStatus : std::uint8_t {
  kPending   = 1,
  kAvailable = 2,
  kUsed      = 3,
  kExpired   = 4,
  kCancelled = 5,
};

enum class UsageStatus : std::uint8_t {
  kCommitted  = 1,
  kRolledBack = 2,
};

// Kinds that always carry a strictly positive amount.
constexpr bool IsEarningKind(EntryKind kind) {
  return kind == EntryKind::kEarnedService || kind == EntryKind::kEarnedReferral || kind == EntryKind::kInfluencerBonus;
}

// Kinds that always carry a strictly negative amount.
constexpr bool IsConsumptionKind(EntryKind kind) {
  return kind == EntryKind::kUsedService || kind == EntryKind::kExpired;
}

constexpr std::string_view ToString(EntryKind kind) {
  switch (kind) {
    case EntryKind::kEarnedService:
      return "earned_service";
    case EntryKind::kEarnedReferral:
      return "earned_referral";
    case EntryKind::kInfluencerBonus:
      return "influencer_bonus";
    case EntryKind::kUsedService:
      return "used_service";
    case EntryKind::kExpired:
      return "expired";
    case EntryKind::kAdjustedByAdmin:
      return "adjusted";
  }
  return "unknown";
}

constexpr std::string_view ToString(EntryStatus status) {
  switch (status) {
    case EntryStatus::kPending:
      return "pending";
    case EntryStatus::kAvailable:
      return "available";
    case EntryStatus::kUsed:
      return "used";
    case EntryStatus::kExpired:
      return "expired";
    case EntryStatus::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

constexpr std::string_view ToString(UsageStatus status) {
  return status == UsageStatus::kCommitted ? "committed" : "rolled_back";
}

std::optional<EntryKind>   ParseEntryKind(std::string_view value);
std::optional<EntryStatus> ParseEntryStatus(std::string_view value);

} // namespace loyalty::model
