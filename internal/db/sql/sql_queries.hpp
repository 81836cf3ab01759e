#pragma once

#include <string>

#include "internal/db/api/types.hpp"
#include "internal/db/sql/sql_params.hpp"

namespace loyalty::db::sql {

/*
  Canonical SQL used by all backends.

  IMPORTANT:
  These are written in SQLite-compatible SQL subset
  so they work in both engines.
*/

static constexpr const char* kSchema[] = {
    "CREATE TABLE IF NOT EXISTS ledger_entries ("
    " id TEXT PRIMARY KEY,"
    " user_id TEXT NOT NULL,"
    " kind INTEGER NOT NULL,"
    " status INTEGER NOT NULL,"
    " amount BIGINT NOT NULL,"
    " remaining_amount BIGINT NOT NULL,"
    " available_from_ms BIGINT NOT NULL,"
    " expires_at_ms BIGINT,"
    " linked_usage_id TEXT NOT NULL DEFAULT '',"
    " source_entry_id TEXT NOT NULL DEFAULT '',"
    " reservation_id TEXT NOT NULL DEFAULT '',"
    " description TEXT NOT NULL DEFAULT '',"
    " created_at_ms BIGINT NOT NULL,"
    " updated_at_ms BIGINT NOT NULL,"
    " version BIGINT NOT NULL,"
    " CHECK (remaining_amount >= 0));",
    "CREATE INDEX IF NOT EXISTS ledger_entries_user_fifo"
    " ON ledger_entries(user_id, status, available_from_ms, created_at_ms);",
    "CREATE INDEX IF NOT EXISTS ledger_entries_status_available"
    " ON ledger_entries(status, available_from_ms);",
    "CREATE INDEX IF NOT EXISTS ledger_entries_status_expires"
    " ON ledger_entries(status, expires_at_ms);",
    "CREATE TABLE IF NOT EXISTS usage_records ("
    " id TEXT PRIMARY KEY,"
    " user_id TEXT NOT NULL,"
    " reservation_id TEXT NOT NULL,"
    " total_amount BIGINT NOT NULL,"
    " status INTEGER NOT NULL,"
    " spend_entry_id TEXT NOT NULL DEFAULT '',"
    " rollback_reason TEXT NOT NULL DEFAULT '',"
    " rolled_back_at_ms BIGINT NOT NULL DEFAULT 0,"
    " created_at_ms BIGINT NOT NULL,"
    " version BIGINT NOT NULL,"
    " CHECK (total_amount > 0));",
    "CREATE INDEX IF NOT EXISTS usage_records_user ON usage_records(user_id, created_at_ms);",
    "CREATE TABLE IF NOT EXISTS usage_draws ("
    " usage_id TEXT NOT NULL REFERENCES usage_records(id),"
    " seq INTEGER NOT NULL,"
    " grant_entry_id TEXT NOT NULL,"
    " amount_drawn BIGINT NOT NULL,"
    " PRIMARY KEY (usage_id, seq),"
    " CHECK (amount_drawn > 0));",
};

static constexpr const char* kEntryColumns =
    "id,user_id,kind,status,amount,remaining_amount,available_from_ms,expires_at_ms,"
    "linked_usage_id,source_entry_id,reservation_id,description,created_at_ms,updated_at_ms,version";

static constexpr const char* INSERT_ENTRY =
    "INSERT INTO ledger_entries("
    "id,user_id,kind,status,amount,remaining_amount,available_from_ms,expires_at_ms,"
    "linked_usage_id,source_entry_id,reservation_id,description,created_at_ms,updated_at_ms,version)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_ENTRY =
    "SELECT id,user_id,kind,status,amount,remaining_amount,available_from_ms,expires_at_ms,"
    "linked_usage_id,source_entry_id,reservation_id,description,created_at_ms,updated_at_ms,version"
    " FROM ledger_entries WHERE id=?;";

// conditional on the version the writer read
static constexpr const char* UPDATE_ENTRY =
    "UPDATE ledger_entries SET status=?,amount=?,remaining_amount=?,available_from_ms=?,expires_at_ms=?,"
    "linked_usage_id=?,source_entry_id=?,reservation_id=?,description=?,updated_at_ms=?,version=?"
    " WHERE id=? AND version=?;";

static constexpr const char* SELECT_ENTRY_VERSION =
    "SELECT version FROM ledger_entries WHERE id=?;";

// usage

static constexpr const char* INSERT_USAGE =
    "INSERT INTO usage_records("
    "id,user_id,reservation_id,total_amount,status,spend_entry_id,rollback_reason,rolled_back_at_ms,created_at_ms,version)"
    " VALUES(?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* INSERT_DRAW =
    "INSERT INTO usage_draws(usage_id,seq,grant_entry_id,amount_drawn) VALUES(?,?,?,?);";

static constexpr const char* SELECT_USAGE =
    "SELECT id,user_id,reservation_id,total_amount,status,spend_entry_id,rollback_reason,rolled_back_at_ms,created_at_ms,version"
    " FROM usage_records WHERE id=?;";

static constexpr const char* SELECT_DRAWS =
    "SELECT grant_entry_id,amount_drawn FROM usage_draws WHERE usage_id=? ORDER BY seq ASC;";

static constexpr const char* UPDATE_USAGE =
    "UPDATE usage_records SET status=?,rollback_reason=?,rolled_back_at_ms=?,version=?"
    " WHERE id=? AND version=?;";

static constexpr const char* SELECT_USAGE_VERSION =
    "SELECT version FROM usage_records WHERE id=?;";

static constexpr const char* LIST_USAGES =
    "SELECT id,user_id,reservation_id,total_amount,status,spend_entry_id,rollback_reason,rolled_back_at_ms,created_at_ms,version"
    " FROM usage_records WHERE user_id=? ORDER BY created_at_ms DESC, id DESC LIMIT ? OFFSET ?;";

// Builds SELECT (or SELECT COUNT(*)) over ledger_entries for an EntryQuery.
Statement BuildEntryQuery(const EntryQuery& query, bool count_only);

} // namespace loyalty::db::sql
