#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace loyalty::db::memory {

namespace {

template <typename Map>
uint64_t CommittedVersion(const Map& rows, const std::string& id) {
  const auto it = rows.find(id);
  return it == rows.end() ? 0 : it->second.version;
}

} // namespace

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::TouchEntry(const std::string& id, uint64_t base_version) {
  entry_writes_.try_emplace(id, base_version);
}

void MemoryTransaction::TouchUsage(const std::string& id, uint64_t base_version) {
  usage_writes_.try_emplace(id, base_version);
}

void MemoryTransaction::Commit() {
  if (rolled_back_) {
    throw util::InvalidState("commit after rollback");
  }

  std::scoped_lock lock(repo_.mutex_);
  for (const auto& [id, base] : entry_writes_) {
    if (CommittedVersion(repo_.committed_.entries, id) != base) {
      throw util::VersionConflict("ledger entry " + id + " was modified by a concurrent transaction");
    }
  }
  for (const auto& [id, base] : usage_writes_) {
    if (CommittedVersion(repo_.committed_.usages, id) != base) {
      throw util::VersionConflict("usage record " + id + " was modified by a concurrent transaction");
    }
  }

  for (const auto& [id, _] : entry_writes_) {
    repo_.committed_.entries[id] = working_.entries.at(id);
  }
  for (const auto& [id, _] : usage_writes_) {
    repo_.committed_.usages[id] = working_.usages.at(id);
  }
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  entry_writes_.clear();
  usage_writes_.clear();
  rolled_back_ = true;
}

} // namespace loyalty::db::memory
