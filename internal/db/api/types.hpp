#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/entry_kind.hpp"

namespace loyalty::db {

struct Pagination {
  std::size_t limit  = 100;
  std::size_t offset = 0;
};

enum class EntryOrder {
  // (available_from, created_at, id) ascending: the FIFO consumption order
  kFifo,
  // created_at descending, id descending: history listings
  kNewestFirst,
  // created_at ascending, id ascending
  kInsertion,
};

/*
  Range query over ledger rows. Unset fields do not filter.
  Timestamp bounds are inclusive.
*/
struct EntryQuery {
  std::optional<std::string>               user_id;
  std::vector<loyalty::model::EntryStatus> statuses;
  std::vector<loyalty::model::EntryKind>   kinds;

  std::optional<int64_t> available_from_lte_ms;
  std::optional<int64_t> expires_at_lte_ms;
  std::optional<int64_t> created_from_ms;
  std::optional<int64_t> created_to_ms;

  EntryOrder                order = EntryOrder::kInsertion;
  std::optional<Pagination> pagination;
};

} // namespace loyalty::db
