#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/ledger_entry_record.hpp"
#include "internal/db/model/usage_record.hpp"

namespace loyalty::db {

/*
  Repository abstraction over the point ledger.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - Update* succeeds only if the stored version equals expected_version,
    and then stores expected_version + 1 (ErrorCode::Conflict otherwise)
  - A usage record and the grant rows it draws from are committed together

  The DB is the source of truth for:
    ledger entries
    usage records and their FIFO breakdown
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Ledger entries
  // ---------------------------------------------------------------------

  virtual Result InsertEntry(Transaction&, const model::LedgerEntryRecord&) = 0;

  virtual std::optional<model::LedgerEntryRecord> GetEntry(Transaction&, const std::string& id) = 0;

  virtual Result UpdateEntry(Transaction&, const model::LedgerEntryRecord&, uint64_t expected_version) = 0;

  virtual std::vector<model::LedgerEntryRecord> ListEntries(Transaction&, const EntryQuery& query) = 0;

  // Same filter as ListEntries, pagination ignored.
  virtual uint64_t CountEntries(Transaction&, const EntryQuery& query) = 0;

  // ---------------------------------------------------------------------
  // Usage records
  // ---------------------------------------------------------------------

  virtual Result InsertUsage(Transaction&, const model::UsageRecord&) = 0;

  virtual std::optional<model::UsageRecord> GetUsage(Transaction&, const std::string& id) = 0;

  // Status / rollback fields only; consumed_from is immutable once written.
  virtual Result UpdateUsage(Transaction&, const model::UsageRecord&, uint64_t expected_version) = 0;

  // Newest first.
  virtual std::vector<model::UsageRecord> ListUsages(Transaction&, const std::string& user_id, const Pagination& pagination) = 0;
};

} // namespace loyalty::db
