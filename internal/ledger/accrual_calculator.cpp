#include "internal/ledger/accrual_calculator.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include "internal/util/errors.hpp"

namespace loyalty::ledger {

namespace {

// Rates such as 0.025 are not exact in binary; without the nudge
// 40000 * 0.025 may floor to 999.
constexpr double kFloorEpsilon = 1e-9;

std::int64_t FloorPoints(double value) {
  if (!std::isfinite(value) || value >= static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
    throw util::InvalidAmount("accrual: computed amount out of range");
  }
  return static_cast<std::int64_t>(std::floor(value + kFloorEpsilon));
}

} // namespace

AccrualCalculator::AccrualCalculator(AccrualPolicy policy) : policy_(policy) {
  if (policy_.earning_rate <= 0 || policy_.max_eligible_amount <= 0 || policy_.referral_bonus <= 0 || policy_.influencer_multiplier < 1.0) {
    throw util::InvalidArgument("accrual policy: rates, caps and bonuses must be positive");
  }
  if (policy_.holding_period.count() < 0 || policy_.validity_period.count() <= 0) {
    throw util::InvalidArgument("accrual policy: invalid holding or validity period");
  }
}

std::int64_t AccrualCalculator::Amount(const AccrualRequest& request) const {
  using model::EntryKind;

  switch (request.kind) {
    case EntryKind::kEarnedService: {
      if (!(request.tier_multiplier >= 1.0)) {
        throw util::InvalidAmount("accrual: tier multiplier must be at least 1");
      }
      const auto eligible = std::min(request.base_amount, policy_.max_eligible_amount);
      auto       amount   = FloorPoints(FloorPoints(static_cast<double>(eligible) * policy_.earning_rate) * request.tier_multiplier);
      if (request.is_influencer) {
        amount = FloorPoints(static_cast<double>(amount) * policy_.influencer_multiplier);
      }
      return amount;
    }
    case EntryKind::kEarnedReferral:
      return policy_.referral_bonus;
    case EntryKind::kInfluencerBonus:
      if (!request.is_influencer) {
        return request.base_amount;
      }
      return FloorPoints(static_cast<double>(request.base_amount) * policy_.influencer_multiplier);
    case EntryKind::kAdjustedByAdmin:
      if (request.reason.empty()) {
        throw util::InvalidAmount("accrual: admin adjustment requires a reason");
      }
      return request.base_amount;
    case EntryKind::kUsedService:
    case EntryKind::kExpired:
      break;
  }
  throw util::InvalidAmount("accrual: " + std::string(model::ToString(request.kind)) + " entries are produced by the engine only");
}

Accrual AccrualCalculator::Calculate(const AccrualRequest& request, util::TimePoint now) const {
  if (model::IsConsumptionKind(request.kind)) {
    throw util::InvalidAmount("accrual: " + std::string(model::ToString(request.kind)) + " entries are produced by the engine only");
  }
  if (request.base_amount <= 0) {
    throw util::InvalidAmount("accrual: base amount must be positive, got " + std::to_string(request.base_amount));
  }

  Accrual out;
  out.amount = Amount(request);
  if (out.amount <= 0) {
    throw util::InvalidAmount("accrual: purchase of " + std::to_string(request.base_amount) + " earns no points");
  }

  const auto now_ms = util::ToUnixMillis(now);
  if (request.kind == model::EntryKind::kAdjustedByAdmin) {
    out.status            = model::EntryStatus::kAvailable;
    out.available_from_ms = now_ms;
  } else {
    out.status            = model::EntryStatus::kPending;
    out.available_from_ms = now_ms + util::DurationMillis(policy_.holding_period);
  }
  out.expires_at_ms = out.available_from_ms + util::DurationMillis(policy_.validity_period);
  return out;
}

} // namespace loyalty::ledger
