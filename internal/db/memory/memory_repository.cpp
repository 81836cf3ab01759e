#include "memory_repository.hpp"

#include <algorithm>
#include <tuple>

#include "memory_tx.hpp"

namespace loyalty::db::memory {

namespace {

template <typename T>
bool ContainsOrEmpty(const std::vector<T>& allowed, T value) {
  return allowed.empty() || std::find(allowed.begin(), allowed.end(), value) != allowed.end();
}

bool Matches(const model::LedgerEntryRecord& e, const EntryQuery& q) {
  if (q.user_id && e.user_id != *q.user_id) return false;
  if (!ContainsOrEmpty(q.statuses, e.status)) return false;
  if (!ContainsOrEmpty(q.kinds, e.kind)) return false;
  if (q.available_from_lte_ms && e.available_from_ms > *q.available_from_lte_ms) return false;
  if (q.expires_at_lte_ms && (!e.expires_at_ms || *e.expires_at_ms > *q.expires_at_lte_ms)) return false;
  if (q.created_from_ms && e.created_at_ms < *q.created_from_ms) return false;
  if (q.created_to_ms && e.created_at_ms > *q.created_to_ms) return false;
  return true;
}

void Sort(std::vector<model::LedgerEntryRecord>& rows, EntryOrder order) {
  switch (order) {
    case EntryOrder::kFifo:
      std::sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) {
        return std::tie(a.available_from_ms, a.created_at_ms, a.id) < std::tie(b.available_from_ms, b.created_at_ms, b.id);
      });
      return;
    case EntryOrder::kNewestFirst:
      std::sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) {
        return std::tie(a.created_at_ms, a.id) > std::tie(b.created_at_ms, b.id);
      });
      return;
    case EntryOrder::kInsertion:
      std::sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) {
        return std::tie(a.created_at_ms, a.id) < std::tie(b.created_at_ms, b.id);
      });
      return;
  }
}

template <typename T>
std::vector<T> Page(std::vector<T> rows, const Pagination& pagination) {
  if (pagination.offset >= rows.size()) return {};
  auto first = rows.begin() + static_cast<std::ptrdiff_t>(pagination.offset);
  auto last  = rows.end();
  if (pagination.limit < static_cast<std::size_t>(last - first)) {
    last = first + static_cast<std::ptrdiff_t>(pagination.limit);
  }
  return std::vector<T>(first, last);
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertEntry(Transaction& t, const model::LedgerEntryRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.entries.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, r.id);
  TX(t).TouchEntry(r.id, 0);
  s.entries[r.id] = r;
  return Result::Ok();
}

std::optional<model::LedgerEntryRecord> MemoryRepository::GetEntry(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.entries.find(id);
  if (it == s.entries.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateEntry(Transaction& t, const model::LedgerEntryRecord& r, uint64_t expected_version) {
  auto& s  = TX(t).Mutable();
  auto  it = s.entries.find(r.id);
  if (it == s.entries.end()) return Result::Err(ErrorCode::NotFound, r.id);
  if (it->second.version != expected_version) return Result::Err(ErrorCode::Conflict, r.id);

  TX(t).TouchEntry(r.id, expected_version);
  it->second         = r;
  it->second.version = expected_version + 1;
  return Result::Ok();
}

std::vector<model::LedgerEntryRecord> MemoryRepository::ListEntries(Transaction& t, const EntryQuery& query) {
  std::vector<model::LedgerEntryRecord> out;
  for (const auto& [_, e] : TX(t).View().entries) {
    if (Matches(e, query)) out.push_back(e);
  }
  Sort(out, query.order);
  if (query.pagination) return Page(std::move(out), *query.pagination);
  return out;
}

uint64_t MemoryRepository::CountEntries(Transaction& t, const EntryQuery& query) {
  const auto& entries = TX(t).View().entries;
  return static_cast<uint64_t>(std::count_if(entries.begin(), entries.end(), [&](const auto& kv) { return Matches(kv.second, query); }));
}

Result MemoryRepository::InsertUsage(Transaction& t, const model::UsageRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.usages.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, r.id);
  TX(t).TouchUsage(r.id, 0);
  s.usages[r.id] = r;
  return Result::Ok();
}

std::optional<model::UsageRecord> MemoryRepository::GetUsage(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.usages.find(id);
  if (it == s.usages.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateUsage(Transaction& t, const model::UsageRecord& r, uint64_t expected_version) {
  auto& s  = TX(t).Mutable();
  auto  it = s.usages.find(r.id);
  if (it == s.usages.end()) return Result::Err(ErrorCode::NotFound, r.id);
  if (it->second.version != expected_version) return Result::Err(ErrorCode::Conflict, r.id);

  TX(t).TouchUsage(r.id, expected_version);
  it->second.status            = r.status;
  it->second.rollback_reason   = r.rollback_reason;
  it->second.rolled_back_at_ms = r.rolled_back_at_ms;
  it->second.version           = expected_version + 1;
  return Result::Ok();
}

std::vector<model::UsageRecord> MemoryRepository::ListUsages(Transaction& t, const std::string& user_id, const Pagination& pagination) {
  std::vector<model::UsageRecord> out;
  for (const auto& [_, u] : TX(t).View().usages) {
    if (u.user_id == user_id) out.push_back(u);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return std::tie(a.created_at_ms, a.id) > std::tie(b.created_at_ms, b.id); });
  return Page(std::move(out), pagination);
}

} // namespace loyalty::db::memory
