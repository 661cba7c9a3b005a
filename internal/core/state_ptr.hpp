#pragma once

#include <string>
#include <string_view>

namespace flowlog::core::state_ptr {

// Snapshot state pointers:
//   "inline:<serialized state>"
//   "artifact:<key>"   (key issued by the artifact store)
inline constexpr std::string_view kInlinePrefix   = "inline:";
inline constexpr std::string_view kArtifactPrefix = "artifact:";

inline bool IsInline(std::string_view ptr) {
  return ptr.substr(0, kInlinePrefix.size()) == kInlinePrefix;
}

inline bool IsArtifact(std::string_view ptr) {
  return ptr.substr(0, kArtifactPrefix.size()) == kArtifactPrefix;
}

// Text after the prefix. Callers check IsInline / IsArtifact first.
inline std::string InlineState(std::string_view ptr) {
  return std::string(ptr.substr(kInlinePrefix.size()));
}

inline std::string ArtifactKey(std::string_view ptr) {
  return std::string(ptr.substr(kArtifactPrefix.size()));
}

inline std::string ForInline(std::string_view serialized) {
  return std::string(kInlinePrefix) + std::string(serialized);
}

inline std::string ForArtifact(std::string_view key) {
  return std::string(kArtifactPrefix) + std::string(key);
}

} // namespace flowlog::core::state_ptr
