#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/db/sql/sql_params.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace loyalty::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
  static Result VersionMismatch(SqliteTransaction& tx, const char* version_sql, const std::string& id);
  static std::vector<model::ConsumedDraw> LoadDraws(SqliteTransaction& tx, const std::string& usage_id);
};

}
