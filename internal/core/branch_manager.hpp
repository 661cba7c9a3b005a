#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/core/flow_repository.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/storage/artifact_store.hpp"

namespace flowlog::core {

/*
  BranchManager

  Owns everything that involves the parent/child relation between flows:
    - forking a flow at a cursor (copy of records 1..cursor and of the
      snapshots taken at or before it)
    - applying the ChildPolicy when a parent is deleted or pruned

  Lock order is always ancestor before descendant. A child listed under a
  parent may be deleted by a concurrent transaction before it is locked;
  such a child is skipped.

  Artifact-backed snapshot states copied into a branch go through
  ArtifactStore::CopyIfNeeded when an artifact store is set.
*/
class BranchManager {
 public:
  BranchManager(std::shared_ptr<db::Repository> repository, ChildPolicy policy, storage::ArtifactStorePtr artifacts = nullptr);

  // One transaction holding the parent's lock for the duration of the copy.
  // Throws util::NotFound (parent) and util::InvalidArgument (cursor outside
  // 0..parent cursor).
  std::string CreateBranch(const BranchSpec& spec);

  // Applies the child policy to children of parent_flow_id inside tx. With
  // from_cursor set only children branched at parent_cursor >= from_cursor
  // are affected. The parent must already be locked by tx.
  void ReleaseChildren(db::Transaction& tx, const std::string& parent_flow_id, std::optional<int64_t> from_cursor);

  // Deletes a locked flow's snapshots, records and row.
  void RemoveFlowRows(db::Transaction& tx, const std::string& flow_id);

  ChildPolicy policy() const {
    return policy_;
  }

 private:
  void DeleteSubtree(db::Transaction& tx, const std::string& flow_id);

  // False when the flow vanished before the lock was taken.
  bool LockIfPresent(db::Transaction& tx, const std::string& flow_id, const char* context);

  std::string CopyStatePtr(const std::string& state_ptr);

  std::shared_ptr<db::Repository> repository_;
  ChildPolicy                     policy_;
  storage::ArtifactStorePtr       artifacts_;
};

} // namespace flowlog::core
