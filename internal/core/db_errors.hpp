#pragma once

#include <string>

#include "internal/db/api/result.hpp"

namespace flowlog::core {

// Maps a failed db::Result to the matching util exception; no-op on success.
void ThrowIfDbError(const db::Result& result, const std::string& context);

} // namespace flowlog::core
