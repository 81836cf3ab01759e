#pragma once

#include <string>

#include "internal/db/api/result.hpp"

namespace loyalty::core {

// Throws the util:: exception matching a failed repository result.
// Conflict, Busy and SerializationFailure become util::VersionConflict.
void ThrowIfDbError(const db::Result& result, const std::string& context);

} // namespace loyalty::core
