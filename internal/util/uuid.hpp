#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace flowlog::util {

/*
  UUID helpers

  Lineage, record and snapshot ids are RFC4122 v4 UUIDs, persisted in their
  canonical 36 character text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// Shorthand for ToString(GenerateUUID()).
std::string NewId();

bool IsValidId(const std::string& str);

} // namespace flowlog::util
