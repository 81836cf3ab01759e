#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/entry_kind.hpp"
#include "internal/util/time.hpp"

namespace loyalty::ledger {

using Days = std::chrono::duration<std::int64_t, std::ratio<86400>>;

struct AccrualPolicy {
  std::chrono::milliseconds holding_period  = Days{7};
  std::chrono::milliseconds validity_period = Days{365};

  double       earning_rate          = 0.025;
  std::int64_t max_eligible_amount   = 300000;
  std::int64_t referral_bonus        = 2000;
  double       influencer_multiplier = 2.0;
};

struct AccrualRequest {
  model::EntryKind kind            = model::EntryKind::kEarnedService;
  std::int64_t     base_amount     = 0;
  bool             is_influencer   = false;
  double           tier_multiplier = 1.0;
  // required for admin adjustments
  std::string reason;
};

struct Accrual {
  std::int64_t              amount = 0;
  model::EntryStatus        status = model::EntryStatus::kPending;
  std::int64_t              available_from_ms = 0;
  std::optional<std::int64_t> expires_at_ms;
};

/*
  Computes amount and lifecycle dates of a new grant.

  earned_service   floor(floor(min(base, cap) * rate) * tier), times the
                   influencer multiplier for influencers
  earned_referral  fixed bonus
  influencer_bonus base times the influencer multiplier for influencers,
                   base otherwise
  adjusted         base, available immediately

  Everything except admin adjustments starts Pending for the holding period.
  Validity is counted from availability. Throws util::InvalidAmount and
  creates nothing on invalid input.
*/
class AccrualCalculator {
 public:
  explicit AccrualCalculator(AccrualPolicy policy = {});

  Accrual Calculate(const AccrualRequest& request, util::TimePoint now) const;

  const AccrualPolicy& Policy() const {
    return policy_;
  }

 private:
  std::int64_t Amount(const AccrualRequest& request) const;

  AccrualPolicy policy_;
};

} // namespace loyalty::ledger
