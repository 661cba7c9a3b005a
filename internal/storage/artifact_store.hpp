#pragma once

#include <arrow/buffer.h>

#include <memory>
#include <string>

#include "internal/util/errors.hpp"

namespace flowlog::storage {

/*
  Artifact storage abstraction.

  Holds snapshot states too large (or too binary) to live inline in a
  snapshot row. Every artifact is an immutable Arrow Buffer addressed by
  an opaque key chosen by the store.

  Implementations:
    RAM   → in-memory Arrow buffers
    DISK  → Arrow file IO, one file per key
    NONE  → every call throws util::NotImplemented

  Missing keys raise util::NotFound; IO failures util::StorageError.
*/

class ArtifactStore {
 public:
  virtual ~ArtifactStore() = default;

  // Store a blob; the returned key is what "artifact:<key>" refers to.
  virtual std::string Put(const std::shared_ptr<arrow::Buffer>& buffer) = 0;

  // Implementations may mmap / zero-copy when possible.
  virtual std::shared_ptr<arrow::Buffer> Get(const std::string& key) = 0;

  // Removing an absent key is not an error.
  virtual void Remove(const std::string& key) = 0;

  virtual bool Exists(const std::string& key) = 0;

  /*
    Key a copy of the artifact should use (e.g. when a snapshot is copied
    into a branch). Artifacts are immutable, so stores that never mutate
    or garbage-collect in place hand back the same key.
  */
  virtual std::string CopyIfNeeded(const std::string& key) {
    if (!Exists(key)) throw util::NotFound("artifact not found: " + key);
    return key;
  }

  virtual const char* Kind() const = 0;
};

using ArtifactStorePtr = std::shared_ptr<ArtifactStore>;

} // namespace flowlog::storage
