#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace loyalty::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
  static std::vector<model::ConsumedDraw> LoadDraws(PgTransaction& tx, const std::string& usage_id);
};

}
