#include "internal/db/sql/sql_queries.hpp"

namespace loyalty::db::sql {

namespace {

template <typename Enum>
void AppendInList(std::string& sql, Params& params, const char* column, const std::vector<Enum>& values) {
  if (values.empty()) {
    return;
  }
  sql += " AND ";
  sql += column;
  sql += " IN (";
  for (std::size_t i = 0; i < values.size(); ++i) {
    sql += i == 0 ? "?" : ",?";
    params.emplace_back(static_cast<int64_t>(values[i]));
  }
  sql += ")";
}

const char* OrderBy(EntryOrder order) {
  switch (order) {
    case EntryOrder::kFifo:
      return " ORDER BY available_from_ms ASC, created_at_ms ASC, id ASC";
    case EntryOrder::kNewestFirst:
      return " ORDER BY created_at_ms DESC, id DESC";
    case EntryOrder::kInsertion:
      return " ORDER BY created_at_ms ASC, id ASC";
  }
  return "";
}

} // namespace

std::string NumberPlaceholders(const std::string& sql) {
  std::string out;
  out.reserve(sql.size() + 16);
  int  index     = 0;
  bool in_string = false;
  for (char c : sql) {
    if (c == '\'') {
      in_string = !in_string;
    }
    if (c == '?' && !in_string) {
      out += "$" + std::to_string(++index);
    } else {
      out.push_back(c);
    }
  }
  return out;
}

Statement BuildEntryQuery(const EntryQuery& query, bool count_only) {
  Statement st;
  st.sql = count_only ? "SELECT COUNT(*) FROM ledger_entries WHERE 1=1" : std::string("SELECT ") + kEntryColumns + " FROM ledger_entries WHERE 1=1";

  if (query.user_id) {
    st.sql += " AND user_id=?";
    st.params.emplace_back(*query.user_id);
  }
  AppendInList(st.sql, st.params, "status", query.statuses);
  AppendInList(st.sql, st.params, "kind", query.kinds);
  if (query.available_from_lte_ms) {
    st.sql += " AND available_from_ms<=?";
    st.params.emplace_back(*query.available_from_lte_ms);
  }
  if (query.expires_at_lte_ms) {
    st.sql += " AND expires_at_ms IS NOT NULL AND expires_at_ms<=?";
    st.params.emplace_back(*query.expires_at_lte_ms);
  }
  if (query.created_from_ms) {
    st.sql += " AND created_at_ms>=?";
    st.params.emplace_back(*query.created_from_ms);
  }
  if (query.created_to_ms) {
    st.sql += " AND created_at_ms<=?";
    st.params.emplace_back(*query.created_to_ms);
  }

  if (count_only) {
    st.sql += ";";
    return st;
  }

  st.sql += OrderBy(query.order);
  if (query.pagination) {
    st.sql += " LIMIT ? OFFSET ?";
    st.params.emplace_back(static_cast<int64_t>(query.pagination->limit));
    st.params.emplace_back(static_cast<int64_t>(query.pagination->offset));
  }
  st.sql += ";";
  return st;
}

} // namespace loyalty::db::sql
