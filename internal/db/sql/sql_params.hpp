#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace loyalty::db::sql {

/*
  Parameter abstraction.

  Postgres: $1 $2 $3
  SQLite:   ? ? ?

  Both use ordered binding; NumberPlaceholders() rewrites the SQLite form
  for Postgres.
*/

using Param = std::variant<std::nullptr_t, int64_t, std::string>;

using Params = std::vector<Param>;

struct Statement {
  std::string sql;
  Params      params;
};

std::string NumberPlaceholders(const std::string& sql);

} // namespace loyalty::db::sql
