#pragma once

#include <memory>
#include <string>

#include "internal/core/branch_manager.hpp"
#include "internal/core/flow_repository.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/storage/artifact_store.hpp"

namespace flowlog::core {

/*
  FlowStore

  The FlowRepository implementation shared by every backend. It owns the
  cursor/version accounting, idempotent replay and the child policy;
  db::Repository only stores rows.

  Writers of a flow are serialized by Repository::LockFlow. The store keeps
  no cache: every call reads through a fresh transaction, so several
  FlowStore instances over the same repository stay consistent. Pure reads
  use Repository::BeginRead and never queue behind writers.

  Documents (payload, metadata) are checked with model::CheckPersistable
  before anything is written.

  artifacts, when set, lets Branch take its own reference to
  artifact-backed snapshot states (ArtifactStore::CopyIfNeeded).
*/
class FlowStore final : public FlowRepository {
 public:
  explicit FlowStore(std::shared_ptr<db::Repository> repository, ChildPolicy child_policy = ChildPolicy::kOrphan,
                     storage::ArtifactStorePtr artifacts = nullptr);

  std::string    CreateFlow(const FlowSpec& spec) override;
  FlowMeta       GetFlowMeta(const std::string& flow_id) override;
  PersistOutcome Append(const NewRecord& record, int64_t expected_version) override;
  RecordStream   ReadRecords(const std::string& flow_id, int64_t from_cursor = 0) override;
  std::string    Branch(const BranchSpec& spec) override;
  bool           FlowExists(const std::string& flow_id) override;
  int64_t        CountRecords(const std::string& flow_id) override;
  void           DeleteFlow(const std::string& flow_id) override;

  std::string SaveSnapshot(const std::string& flow_id, int64_t cursor, const std::string& state_ptr,
                           const flowlog::model::Document& metadata = {}) override;
  std::optional<db::model::SnapshotRecord> LoadSnapshot(const std::string& snapshot_id) override;
  std::optional<db::model::SnapshotRecord> LoadLatestSnapshot(const std::string& flow_id) override;

  std::optional<std::string> GetStatus(const std::string& flow_id) override;
  void                       SetStatus(const std::string& flow_id, const std::optional<std::string>& status) override;
  bool                       CheckVersion(const std::string& flow_id, int64_t expected_version) override;
  int64_t                    PruneFrom(const std::string& flow_id, int64_t from_cursor) override;

  bool                                   DeleteSnapshot(const std::string& snapshot_id) override;
  std::vector<db::model::SnapshotRecord> ListSnapshots(const std::string& flow_id) override;
  std::vector<FlowMeta>                  ListChildren(const std::string& flow_id) override;

  ChildPolicy child_policy() const {
    return branches_.policy();
  }

 private:
  std::shared_ptr<db::Repository> repository_;
  BranchManager                   branches_;
};

} // namespace flowlog::core
