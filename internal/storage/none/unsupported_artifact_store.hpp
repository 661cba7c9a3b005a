#pragma once

#include "internal/storage/artifact_store.hpp"

namespace flowlog::storage {

/*
  Store for deployments without artifact storage ("artifacts: {none: {}}").
  Snapshots must then stay inline; every call throws util::NotImplemented
  so callers can tell "unsupported" from a storage failure.
*/
class UnsupportedArtifactStore final : public ArtifactStore {
 public:
  std::string Put(const std::shared_ptr<arrow::Buffer>&) override {
    throw util::NotImplemented("artifact store disabled: put");
  }

  std::shared_ptr<arrow::Buffer> Get(const std::string&) override {
    throw util::NotImplemented("artifact store disabled: get");
  }

  void Remove(const std::string&) override {
    throw util::NotImplemented("artifact store disabled: remove");
  }

  bool Exists(const std::string&) override {
    throw util::NotImplemented("artifact store disabled: exists");
  }

  std::string CopyIfNeeded(const std::string&) override {
    throw util::NotImplemented("artifact store disabled: copy");
  }

  const char* Kind() const override {
    return "none";
  }
};

} // namespace flowlog::storage
