#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <memory>

#include <arrow/buffer.h>

#include "internal/storage/artifact_store.hpp"

namespace flowlog::storage {

/*
  RAM artifact store.

  Backed by Arrow buffers stored in-memory; lives as long as the process.
  Provides zero-copy reads to callers.

  Thread safety:
    - shared reads
    - exclusive writes
*/

class RamArtifactStore final : public ArtifactStore {
public:
  RamArtifactStore() = default;
  ~RamArtifactStore() override = default;

  std::string Put(const std::shared_ptr<arrow::Buffer>& buffer) override;
  std::shared_ptr<arrow::Buffer> Get(const std::string& key) override;
  void Remove(const std::string& key) override;
  bool Exists(const std::string& key) override;

  const char* Kind() const override {
    return "ram";
  }

private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<arrow::Buffer>> buffers_;
};

} // namespace flowlog::storage
