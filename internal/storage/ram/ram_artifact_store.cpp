#include "ram_artifact_store.hpp"

#include <mutex>

#include "internal/util/uuid.hpp"

namespace flowlog::storage {

std::string RamArtifactStore::Put(const std::shared_ptr<arrow::Buffer>& buffer) {
  if (!buffer) throw util::InvalidArgument("artifact buffer must not be null");

  auto key = util::NewId();
  std::unique_lock lock(mutex_);
  buffers_[key] = buffer;
  return key;
}

/*
  Zero-copy read.
*/
std::shared_ptr<arrow::Buffer> RamArtifactStore::Get(const std::string& key) {
  std::shared_lock lock(mutex_);

  auto it = buffers_.find(key);
  if (it == buffers_.end()) throw util::NotFound("ram artifact not found: " + key);

  return it->second;
}

void RamArtifactStore::Remove(const std::string& key) {
  std::unique_lock lock(mutex_);
  buffers_.erase(key);
}

bool RamArtifactStore::Exists(const std::string& key) {
  std::shared_lock lock(mutex_);
  return buffers_.contains(key);
}

} // namespace flowlog::storage
