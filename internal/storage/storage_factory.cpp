#include "storage_factory.hpp"

#include <filesystem>

#include "disk/disk_artifact_store.hpp"
#include "none/unsupported_artifact_store.hpp"
#include "ram/ram_artifact_store.hpp"

namespace flowlog::storage {

ArtifactStorePtr StorageFactory::Build(const flowlog::runtime::config::ArtifactConfig& cfg) {
  if (cfg.has_disk()) {
    std::filesystem::path root =
        cfg.disk().root().empty() ? std::filesystem::temp_directory_path() / "flowlog-artifacts" : std::filesystem::path{cfg.disk().root()};
    return std::make_shared<DiskArtifactStore>(std::move(root));
  }

  if (cfg.has_none()) {
    return std::make_shared<UnsupportedArtifactStore>();
  }

  return std::make_shared<RamArtifactStore>();
}

} // namespace flowlog::storage
