#include "internal/core/db_errors.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace loyalty::core {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::Conflict:
    case db::ErrorCode::Busy:
    case db::ErrorCode::SerializationFailure:
      throw util::VersionConflict(message);
    default:
      throw std::runtime_error(message + " (" + std::string(db::ToString(result.code)) + ")");
  }
}

} // namespace loyalty::core
