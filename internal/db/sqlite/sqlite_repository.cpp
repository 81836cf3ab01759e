#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <type_traits>

#include "internal/db/sql/sql_queries.hpp"

namespace loyalty::db::sqlite {

using loyalty::db::ErrorCode;
using loyalty::db::Result;
using loyalty::model::EntryKind;
using loyalty::model::EntryStatus;
using loyalty::model::UsageStatus;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindOptI64(sqlite3_stmt* st, int idx, const std::optional<int64_t>& v) {
    if (v) {
        BindI64(st, idx, *v);
    } else {
        sqlite3_bind_null(st, idx);
    }
}

static void BindParams(sqlite3_stmt* st, const sql::Params& params) {
    for (std::size_t i = 0; i < params.size(); ++i) {
        const int idx = static_cast<int>(i) + 1;
        std::visit(
            [&](const auto& value) {
                using T = std::decay_t<decltype(value)>;
                if constexpr (std::is_same_v<T, std::nullptr_t>) {
                    sqlite3_bind_null(st, idx);
                } else if constexpr (std::is_same_v<T, int64_t>) {
                    BindI64(st, idx, value);
                } else {
                    BindText(st, idx, value);
                }
            },
            params[i]);
    }
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

static model::LedgerEntryRecord ReadEntry(sqlite3_stmt* st) {
    model::LedgerEntryRecord r;
    r.id = ColText(st, 0);
    r.user_id = ColText(st, 1);
    r.kind = static_cast<EntryKind>(ColI64(st, 2));
    r.status = static_cast<EntryStatus>(ColI64(st, 3));
    r.amount = ColI64(st, 4);
    r.remaining_amount = ColI64(st, 5);
    r.available_from_ms = ColI64(st, 6);
    if (sqlite3_column_type(st, 7) != SQLITE_NULL) r.expires_at_ms = ColI64(st, 7);
    r.linked_usage_id = ColText(st, 8);
    r.source_entry_id = ColText(st, 9);
    r.reservation_id = ColText(st, 10);
    r.description = ColText(st, 11);
    r.created_at_ms = ColI64(st, 12);
    r.updated_at_ms = ColI64(st, 13);
    r.version = static_cast<uint64_t>(ColI64(st, 14));
    return r;
}

static model::UsageRecord ReadUsage(sqlite3_stmt* st) {
    model::UsageRecord r;
    r.id = ColText(st, 0);
    r.user_id = ColText(st, 1);
    r.reservation_id = ColText(st, 2);
    r.total_amount = ColI64(st, 3);
    r.status = static_cast<UsageStatus>(ColI64(st, 4));
    r.spend_entry_id = ColText(st, 5);
    r.rollback_reason = ColText(st, 6);
    r.rolled_back_at_ms = ColI64(st, 7);
    r.created_at_ms = ColI64(st, 8);
    r.version = static_cast<uint64_t>(ColI64(st, 9));
    return r;
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            if (sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_PRIMARYKEY)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// Distinguishes "row missing" from "row at another version" after a
// conditional UPDATE touched nothing.
Result SqliteRepository::VersionMismatch(SqliteTransaction& tx, const char* version_sql, const std::string& id) {
    auto st = tx.Prepare(version_sql);
    BindText(st.get(), 1, id);
    if (sqlite3_step(st.get()) != SQLITE_ROW)
        return Result::Err(ErrorCode::NotFound, id);
    return Result::Err(ErrorCode::Conflict, id);
}

// ------------------------------------------------------------------
// Ledger entries
// ------------------------------------------------------------------

Result SqliteRepository::InsertEntry(Transaction& t, const model::LedgerEntryRecord& r) {
    auto& tx = TX(t);
    auto st = tx.Prepare(sql::INSERT_ENTRY);

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.user_id);
    BindI64(st.get(), 3, static_cast<int64_t>(r.kind));
    BindI64(st.get(), 4, static_cast<int64_t>(r.status));
    BindI64(st.get(), 5, r.amount);
    BindI64(st.get(), 6, r.remaining_amount);
    BindI64(st.get(), 7, r.available_from_ms);
    BindOptI64(st.get(), 8, r.expires_at_ms);
    BindText(st.get(), 9, r.linked_usage_id);
    BindText(st.get(), 10, r.source_entry_id);
    BindText(st.get(), 11, r.reservation_id);
    BindText(st.get(), 12, r.description);
    BindI64(st.get(), 13, r.created_at_ms);
    BindI64(st.get(), 14, r.updated_at_ms);
    BindI64(st.get(), 15, static_cast<int64_t>(r.version));

    return Translate(tx.Handle(), sqlite3_step(st.get()));
}

std::optional<model::LedgerEntryRecord>
SqliteRepository::GetEntry(Transaction& t, const std::string& id) {
    auto& tx = TX(t);
    auto st = tx.Prepare(sql::SELECT_ENTRY);
    BindText(st.get(), 1, id);

    if (sqlite3_step(st.get()) != SQLITE_ROW)
        return std::nullopt;
    return ReadEntry(st.get());
}

Result SqliteRepository::UpdateEntry(Transaction& t, const model::LedgerEntryRecord& r, uint64_t expected_version) {
    auto& tx = TX(t);
    auto st = tx.Prepare(sql::UPDATE_ENTRY);

    BindI64(st.get(), 1, static_cast<int64_t>(r.status));
    BindI64(st.get(), 2, r.amount);
    BindI64(st.get(), 3, r.remaining_amount);
    BindI64(st.get(), 4, r.available_from_ms);
    BindOptI64(st.get(), 5, r.expires_at_ms);
    BindText(st.get(), 6, r.linked_usage_id);
    BindText(st.get(), 7, r.source_entry_id);
    BindText(st.get(), 8, r.reservation_id);
    BindText(st.get(), 9, r.description);
    BindI64(st.get(), 10, r.updated_at_ms);
    BindI64(st.get(), 11, static_cast<int64_t>(expected_version + 1));
    BindText(st.get(), 12, r.id);
    BindI64(st.get(), 13, static_cast<int64_t>(expected_version));

    auto result = Translate(tx.Handle(), sqlite3_step(st.get()));
    if (!result) return result;
    if (tx.Changes() == 0)
        return VersionMismatch(tx, sql::SELECT_ENTRY_VERSION, r.id);
    return Result::Ok();
}

std::vector<model::LedgerEntryRecord> SqliteRepository::ListEntries(Transaction& t, const EntryQuery& query) {
    auto& tx = TX(t);
    const auto statement = sql::BuildEntryQuery(query, false);
    auto st = tx.Prepare(statement.sql);
    BindParams(st.get(), statement.params);

    std::vector<model::LedgerEntryRecord> out;
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        out.push_back(ReadEntry(st.get()));
    }
    return out;
}

uint64_t SqliteRepository::CountEntries(Transaction& t, const EntryQuery& query) {
    auto& tx = TX(t);
    const auto statement = sql::BuildEntryQuery(query, true);
    auto st = tx.Prepare(statement.sql);
    BindParams(st.get(), statement.params);

    if (sqlite3_step(st.get()) != SQLITE_ROW)
        return 0;
    return static_cast<uint64_t>(ColI64(st.get(), 0));
}

// ------------------------------------------------------------------
// Usage records
// ------------------------------------------------------------------

Result SqliteRepository::InsertUsage(Transaction& t, const model::UsageRecord& r) {
    auto& tx = TX(t);
    auto st = tx.Prepare(sql::INSERT_USAGE);

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.user_id);
    BindText(st.get(), 3, r.reservation_id);
    BindI64(st.get(), 4, r.total_amount);
    BindI64(st.get(), 5, static_cast<int64_t>(r.status));
    BindText(st.get(), 6, r.spend_entry_id);
    BindText(st.get(), 7, r.rollback_reason);
    BindI64(st.get(), 8, r.rolled_back_at_ms);
    BindI64(st.get(), 9, r.created_at_ms);
    BindI64(st.get(), 10, static_cast<int64_t>(r.version));

    auto result = Translate(tx.Handle(), sqlite3_step(st.get()));
    if (!result) return result;

    int64_t seq = 0;
    for (const auto& draw : r.consumed_from) {
        auto ds = tx.Prepare(sql::INSERT_DRAW);
        BindText(ds.get(), 1, r.id);
        BindI64(ds.get(), 2, seq++);
        BindText(ds.get(), 3, draw.grant_entry_id);
        BindI64(ds.get(), 4, draw.amount_drawn);
        auto draw_result = Translate(tx.Handle(), sqlite3_step(ds.get()));
        if (!draw_result) return draw_result;
    }
    return Result::Ok();
}

std::vector<model::ConsumedDraw> SqliteRepository::LoadDraws(SqliteTransaction& tx, const std::string& usage_id) {
    auto st = tx.Prepare(sql::SELECT_DRAWS);
    BindText(st.get(), 1, usage_id);

    std::vector<model::ConsumedDraw> draws;
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        draws.push_back({ColText(st.get(), 0), ColI64(st.get(), 1)});
    }
    return draws;
}

std::optional<model::UsageRecord>
SqliteRepository::GetUsage(Transaction& t, const std::string& id) {
    auto& tx = TX(t);
    auto st = tx.Prepare(sql::SELECT_USAGE);
    BindText(st.get(), 1, id);

    if (sqlite3_step(st.get()) != SQLITE_ROW)
        return std::nullopt;

    auto usage = ReadUsage(st.get());
    usage.consumed_from = LoadDraws(tx, usage.id);
    return usage;
}

Result SqliteRepository::UpdateUsage(Transaction& t, const model::UsageRecord& r, uint64_t expected_version) {
    auto& tx = TX(t);
    auto st = tx.Prepare(sql::UPDATE_USAGE);

    BindI64(st.get(), 1, static_cast<int64_t>(r.status));
    BindText(st.get(), 2, r.rollback_reason);
    BindI64(st.get(), 3, r.rolled_back_at_ms);
    BindI64(st.get(), 4, static_cast<int64_t>(expected_version + 1));
    BindText(st.get(), 5, r.id);
    BindI64(st.get(), 6, static_cast<int64_t>(expected_version));

    auto result = Translate(tx.Handle(), sqlite3_step(st.get()));
    if (!result) return result;
    if (tx.Changes() == 0)
        return VersionMismatch(tx, sql::SELECT_USAGE_VERSION, r.id);
    return Result::Ok();
}

std::vector<model::UsageRecord>
SqliteRepository::ListUsages(Transaction& t, const std::string& user_id, const Pagination& pagination) {
    auto& tx = TX(t);
    auto st = tx.Prepare(sql::LIST_USAGES);
    BindText(st.get(), 1, user_id);
    BindI64(st.get(), 2, static_cast<int64_t>(pagination.limit));
    BindI64(st.get(), 3, static_cast<int64_t>(pagination.offset));

    std::vector<model::UsageRecord> out;
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        out.push_back(ReadUsage(st.get()));
    }
    for (auto& usage : out) {
        usage.consumed_from = LoadDraws(tx, usage.id);
    }
    return out;
}

} // namespace loyalty::db::sqlite
