#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/disk/disk_artifact_store.hpp"
#include "internal/storage/none/unsupported_artifact_store.hpp"
#include "internal/storage/ram/ram_artifact_store.hpp"
#include "internal/storage/storage_factory.hpp"
#include "internal/util/errors.hpp"

namespace {

using flowlog::storage::ArtifactStore;
using flowlog::storage::DiskArtifactStore;
using flowlog::storage::RamArtifactStore;
using flowlog::storage::UnsupportedArtifactStore;
using flowlog::storage::common::ToBuffer;
using flowlog::storage::common::ToString;

std::filesystem::path FreshDir(const std::string& name) {
  auto dir = std::filesystem::temp_directory_path() / "flowlog_artifact_store_tests" / name;
  std::filesystem::remove_all(dir);
  return dir;
}

void VerifyPutGetRemove(ArtifactStore& store) {
  const std::string blob("state\0with\0nul", 14);

  auto key = store.Put(ToBuffer(blob));
  assert(!key.empty());
  assert(store.Exists(key));
  assert(ToString(*store.Get(key)) == blob);

  // immutable blobs are shared, not copied
  assert(store.CopyIfNeeded(key) == key);

  auto other = store.Put(ToBuffer("second"));
  assert(other != key);

  store.Remove(key);
  assert(!store.Exists(key));
  store.Remove(key); // absent key is fine

  bool threw = false;
  try {
    (void)store.Get(key);
  } catch (const flowlog::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)store.CopyIfNeeded(key);
  } catch (const flowlog::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  assert(ToString(*store.Get(other)) == "second");
}

void TestRamStore() {
  RamArtifactStore store;
  assert(std::string(store.Kind()) == "ram");
  VerifyPutGetRemove(store);
}

void TestDiskStore() {
  const auto root = FreshDir("disk");
  DiskArtifactStore store(root);
  assert(std::string(store.Kind()) == "disk");
  VerifyPutGetRemove(store);
}

void TestDiskStoreSurvivesReopen() {
  const auto root = FreshDir("reopen");

  std::string key;
  {
    DiskArtifactStore store(root);
    key = store.Put(ToBuffer("persisted state"));
  }

  DiskArtifactStore reopened(root);
  assert(reopened.Exists(key));
  assert(ToString(*reopened.Get(key)) == "persisted state");
}

void TestDiskStoreRejectsPathKeys() {
  DiskArtifactStore store(FreshDir("keys"));

  bool threw = false;
  try {
    (void)store.Get("../escape");
  } catch (const flowlog::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestUnsupportedStore() {
  UnsupportedArtifactStore store;

  bool threw = false;
  try {
    (void)store.Put(ToBuffer("x"));
  } catch (const flowlog::util::NotImplemented&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)store.Get("any");
  } catch (const flowlog::util::NotImplemented&) {
    threw = true;
  }
  assert(threw);
}

void TestFactorySelection() {
  flowlog::runtime::config::ArtifactConfig cfg;
  assert(std::string(flowlog::storage::StorageFactory::Build(cfg)->Kind()) == "ram");

  cfg.mutable_none();
  assert(std::string(flowlog::storage::StorageFactory::Build(cfg)->Kind()) == "none");

  cfg.mutable_disk()->set_root(FreshDir("factory").string());
  auto disk = flowlog::storage::StorageFactory::Build(cfg);
  assert(std::string(disk->Kind()) == "disk");
  assert(std::filesystem::exists(cfg.disk().root()));
}

} // namespace

int main() {
  TestRamStore();
  TestDiskStore();
  TestDiskStoreSurvivesReopen();
  TestDiskStoreRejectsPathKeys();
  TestUnsupportedStore();
  TestFactorySelection();

  std::cout << "flowlog_unit_artifact_store: pass\n";
  return 0;
}
