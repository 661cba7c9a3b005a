#pragma once

#include <filesystem>
#include <string>

#include "internal/util/errors.hpp"

namespace flowlog::storage::common {

inline void ValidateArtifactKey(const std::string& key) {
  if (key.empty()) {
    throw util::InvalidArgument("artifact key must not be empty");
  }
  for (char c : key) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw util::InvalidArgument("artifact key contains invalid character");
    }
  }
  if (key == "." || key == "..") {
    throw util::InvalidArgument("artifact key must not be a relative path component");
  }
}

inline std::filesystem::path ArtifactPath(const std::filesystem::path& root, const std::string& key) {
  ValidateArtifactKey(key);
  return root / (key + ".bin");
}

} // namespace flowlog::storage::common
