#pragma once

#include <string>

#include "internal/db/api/result.hpp"

namespace gemfeed::store {

// Throws the util:: exception matching result.code; returns on OK.
void ThrowIfDbError(const db::Result& result, const std::string& context);

} // namespace gemfeed::store
