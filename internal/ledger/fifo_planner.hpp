#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/db/model/ledger_entry_record.hpp"
#include "internal/db/model/usage_record.hpp"

namespace loyalty::ledger {

struct DrawPlan {
  std::vector<db::model::ConsumedDraw> draws;
  std::int64_t                         eligible_total = 0;
};

// Spendable grants with a positive remainder, ordered oldest-available first:
// (available_from, created_at, id) ascending.
std::vector<db::model::LedgerEntryRecord> SelectEligible(const std::vector<db::model::LedgerEntryRecord>& entries, std::int64_t now_ms);

/*
  Walks `eligible` in order, drawing min(remaining, still_needed) from each
  grant until `amount` is covered.

  Throws util::InvalidAmount for amount <= 0 and util::InsufficientFunds when
  the eligible total is short. Nothing is modified.
*/
DrawPlan PlanDraws(const std::vector<db::model::LedgerEntryRecord>& eligible, std::int64_t amount);

// Applies one draw to its grant: lowers the remainder, marks it Used at zero,
// and moves a matured Pending grant to Available first.
void ApplyDraw(db::model::LedgerEntryRecord& grant, std::int64_t amount_drawn, std::int64_t now_ms);

} // namespace loyalty::ledger
