#pragma once

#include <memory>

#include "artifact_store.hpp"
#include "config/config.pb.h"

namespace flowlog::storage {

/*
  Builds the artifact store selected by configuration.

      auto artifacts = StorageFactory::Build(config.artifacts());
      auto key       = artifacts->Put(buffer);

  RAM when no store is configured.
*/

class StorageFactory {
public:
  static ArtifactStorePtr Build(const flowlog::runtime::config::ArtifactConfig& cfg);
};

} // namespace flowlog::storage
