#include "disk_artifact_store.hpp"

#include <arrow/io/file.h>
#include <filesystem>
#include <system_error>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/uuid.hpp"

namespace flowlog::storage {

using namespace flowlog::storage::common;

DiskArtifactStore::DiskArtifactStore(std::filesystem::path root)
    : root_(std::move(root)) {

  std::error_code ec;
  std::filesystem::create_directories(root_, ec);
  if (ec) throw util::StorageError("artifact root " + root_.string() + ": " + ec.message());
}

/*
  Atomic write:
      write tmp → flush → rename
*/
std::string DiskArtifactStore::Put(const std::shared_ptr<arrow::Buffer>& buffer) {
  if (!buffer) throw util::InvalidArgument("artifact buffer must not be null");

  auto key        = util::NewId();
  auto final_path = ArtifactPath(root_, key);
  auto tmp_path   = final_path.string() + ".tmp";

  {
    auto out = Unwrap(arrow::io::FileOutputStream::Open(tmp_path));
    Unwrap(out->Write(buffer->data(), buffer->size()));
    Unwrap(out->Flush());
    Unwrap(out->Close());
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, final_path, ec);
  if (ec) {
    std::filesystem::remove(tmp_path, ec);
    throw util::StorageError("artifact rename " + final_path.string() + " failed");
  }
  return key;
}

std::shared_ptr<arrow::Buffer> DiskArtifactStore::Get(const std::string& key) {
  auto path = ArtifactPath(root_, key);
  if (!std::filesystem::exists(path)) throw util::NotFound("disk artifact not found: " + key);

  auto file = Unwrap(arrow::io::ReadableFile::Open(path.string()));
  return ReadAll(file);
}

void DiskArtifactStore::Remove(const std::string& key) {
  std::error_code ec;
  std::filesystem::remove(ArtifactPath(root_, key), ec);
  if (ec) throw util::StorageError("artifact remove " + key + ": " + ec.message());
}

bool DiskArtifactStore::Exists(const std::string& key) {
  return std::filesystem::exists(ArtifactPath(root_, key));
}

}
