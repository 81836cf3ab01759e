#pragma once

#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace loyalty::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertEntry(Transaction&, const model::LedgerEntryRecord&) override;
  std::optional<model::LedgerEntryRecord> GetEntry(Transaction&, const std::string&) override;
  Result UpdateEntry(Transaction&, const model::LedgerEntryRecord&, uint64_t expected_version) override;
  std::vector<model::LedgerEntryRecord> ListEntries(Transaction&, const EntryQuery& query) override;
  uint64_t CountEntries(Transaction&, const EntryQuery& query) override;

  Result InsertUsage(Transaction&, const model::UsageRecord&) override;
  std::optional<model::UsageRecord> GetUsage(Transaction&, const std::string&) override;
  Result UpdateUsage(Transaction&, const model::UsageRecord&, uint64_t expected_version) override;
  std::vector<model::UsageRecord> ListUsages(Transaction&, const std::string& user_id,
                                             const Pagination& pagination) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::LedgerEntryRecord> entries;
    std::unordered_map<std::string, model::UsageRecord> usages;
  };

  std::mutex mutex_;
  State committed_;
};

}
