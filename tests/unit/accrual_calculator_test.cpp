#include "internal/ledger/accrual_calculator.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

#include "internal/util/errors.hpp"

namespace {

using loyalty::ledger::Accrual;
using loyalty::ledger::AccrualCalculator;
using loyalty::ledger::AccrualPolicy;
using loyalty::ledger::AccrualRequest;
using loyalty::ledger::Days;
using loyalty::model::EntryKind;
using loyalty::model::EntryStatus;

const auto kNow   = loyalty::util::FromUnixMillis(1700000000000);
const auto kNowMs = loyalty::util::ToUnixMillis(kNow);
const auto kDayMs = std::int64_t{86400000};

template <typename Fn>
bool ThrowsInvalidAmount(Fn&& fn) {
  try {
    fn();
  } catch (const loyalty::util::InvalidAmount&) {
    return true;
  }
  return false;
}

void TestEarnedServiceUsesRateAndHoldingPeriod() {
  AccrualCalculator calc;
  const auto accrual = calc.Calculate({.kind = EntryKind::kEarnedService, .base_amount = 40000}, kNow);

  assert(accrual.amount == 1000);
  assert(accrual.status == EntryStatus::kPending);
  assert(accrual.available_from_ms == kNowMs + 7 * kDayMs);
  assert(accrual.expires_at_ms.has_value());
  assert(*accrual.expires_at_ms == accrual.available_from_ms + 365 * kDayMs);
}

void TestEarnedServiceIsCappedAndMultiplied() {
  AccrualCalculator calc;

  // 500000 is capped at 300000 -> 7500, tier 1.5 -> 11250
  auto accrual = calc.Calculate({.kind = EntryKind::kEarnedService, .base_amount = 500000, .tier_multiplier = 1.5}, kNow);
  assert(accrual.amount == 11250);

  // influencers earn double on top of the tier
  accrual = calc.Calculate({.kind = EntryKind::kEarnedService, .base_amount = 500000, .is_influencer = true, .tier_multiplier = 1.5}, kNow);
  assert(accrual.amount == 22500);

  // floor before the tier multiplier: 1234 * 0.025 = 30.85 -> 30 -> 45
  accrual = calc.Calculate({.kind = EntryKind::kEarnedService, .base_amount = 1234, .tier_multiplier = 1.5}, kNow);
  assert(accrual.amount == 45);
}

void TestReferralIsFixedBonus() {
  AccrualCalculator calc;
  const auto accrual = calc.Calculate({.kind = EntryKind::kEarnedReferral, .base_amount = 1, .is_influencer = true}, kNow);
  assert(accrual.amount == 2000);
  assert(accrual.status == EntryStatus::kPending);
}

void TestInfluencerBonusDoublesOnlyForInfluencers() {
  AccrualCalculator calc;
  assert(calc.Calculate({.kind = EntryKind::kInfluencerBonus, .base_amount = 700, .is_influencer = true}, kNow).amount == 1400);
  assert(calc.Calculate({.kind = EntryKind::kInfluencerBonus, .base_amount = 700, .is_influencer = false}, kNow).amount == 700);
}

void TestAdminAdjustmentIsImmediatelyAvailable() {
  AccrualCalculator calc;
  const auto accrual = calc.Calculate({.kind = EntryKind::kAdjustedByAdmin, .base_amount = 350, .reason = "goodwill"}, kNow);

  assert(accrual.amount == 350);
  assert(accrual.status == EntryStatus::kAvailable);
  assert(accrual.available_from_ms == kNowMs);
  assert(*accrual.expires_at_ms == kNowMs + 365 * kDayMs);

  assert(ThrowsInvalidAmount([&] { calc.Calculate({.kind = EntryKind::kAdjustedByAdmin, .base_amount = 350}, kNow); }));
}

void TestInvalidInputIsRejected() {
  AccrualCalculator calc;

  assert(ThrowsInvalidAmount([&] { calc.Calculate({.kind = EntryKind::kEarnedService, .base_amount = 0}, kNow); }));
  assert(ThrowsInvalidAmount([&] { calc.Calculate({.kind = EntryKind::kEarnedReferral, .base_amount = -5}, kNow); }));
  assert(ThrowsInvalidAmount([&] { calc.Calculate({.kind = EntryKind::kUsedService, .base_amount = 100}, kNow); }));
  assert(ThrowsInvalidAmount([&] { calc.Calculate({.kind = EntryKind::kExpired, .base_amount = -100}, kNow); }));
  assert(ThrowsInvalidAmount([&] { calc.Calculate({.kind = EntryKind::kEarnedService, .base_amount = 1000, .tier_multiplier = 0.5}, kNow); }));

  // 39 * 0.025 < 1: nothing to grant
  assert(ThrowsInvalidAmount([&] { calc.Calculate({.kind = EntryKind::kEarnedService, .base_amount = 39}, kNow); }));
}

void TestCustomPolicy() {
  AccrualPolicy policy;
  policy.holding_period  = std::chrono::hours(1);
  policy.validity_period = Days{30};
  policy.earning_rate    = 0.1;
  policy.referral_bonus  = 500;

  AccrualCalculator calc(policy);
  const auto        accrual = calc.Calculate({.kind = EntryKind::kEarnedService, .base_amount = 1000}, kNow);
  assert(accrual.amount == 100);
  assert(accrual.available_from_ms == kNowMs + 3600000);
  assert(*accrual.expires_at_ms == accrual.available_from_ms + 30 * kDayMs);
  assert(calc.Calculate({.kind = EntryKind::kEarnedReferral, .base_amount = 1}, kNow).amount == 500);

  bool threw = false;
  try {
    AccrualPolicy broken;
    broken.earning_rate = 0;
    AccrualCalculator invalid(broken);
  } catch (const loyalty::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestEarnedServiceUsesRateAndHoldingPeriod();
  TestEarnedServiceIsCappedAndMultiplied();
  TestReferralIsFixedBonus();
  TestInfluencerBonusDoublesOnlyForInfluencers();
  TestAdminAdjustmentIsImmediatelyAvailable();
  TestInvalidInputIsRejected();
  TestCustomPolicy();

  std::cout << "loyalty_ledger_unit_accrual_calculator: pass\n";
  return 0;
}
