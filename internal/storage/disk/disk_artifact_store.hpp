#pragma once

#include <filesystem>
#include <arrow/buffer.h>

#include "internal/storage/artifact_store.hpp"

namespace flowlog::storage {

/*
  Durable disk artifact store using Arrow IO.

  Properties:
    - one <key>.bin file per artifact under root
    - atomic writes (tmp file + rename), flushed before the rename
    - survives restarts; keys stay valid across processes sharing root
*/

class DiskArtifactStore final : public ArtifactStore {
public:
  explicit DiskArtifactStore(std::filesystem::path root);

  std::string Put(const std::shared_ptr<arrow::Buffer>& buffer) override;
  std::shared_ptr<arrow::Buffer> Get(const std::string& key) override;
  void Remove(const std::string& key) override;
  bool Exists(const std::string& key) override;

  const char* Kind() const override {
    return "disk";
  }

  const std::filesystem::path& root() const {
    return root_;
  }

private:
  std::filesystem::path root_;
};

}
