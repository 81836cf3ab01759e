#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace loyalty::db::memory {

/*
  Transaction = snapshot + write set

  The write set remembers, per touched row, the version the row had in the
  snapshot (0 for inserts). Commit() re-checks those versions against the
  committed state and merges only the touched rows, so transactions over
  disjoint rows never conflict.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

  void TouchEntry(const std::string& id, uint64_t base_version);
  void TouchUsage(const std::string& id, uint64_t base_version);

 private:
  MemoryRepository&                         repo_;
  MemoryRepository::State                   working_;
  std::unordered_map<std::string, uint64_t> entry_writes_;
  std::unordered_map<std::string, uint64_t> usage_writes_;
  bool                                      committed_   = false;
  bool                                      rolled_back_ = false;
};

} // namespace loyalty::db::memory
