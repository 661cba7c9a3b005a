#include "branch_manager.hpp"

#include "internal/core/db_errors.hpp"
#include "internal/core/state_ptr.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace flowlog::core {

namespace {

const char* PolicyName(ChildPolicy policy) {
  return policy == ChildPolicy::kCascade ? "cascade" : "orphan";
}

} // namespace

BranchManager::BranchManager(std::shared_ptr<db::Repository> repository, ChildPolicy policy, storage::ArtifactStorePtr artifacts)
    : repository_(std::move(repository)), policy_(policy), artifacts_(std::move(artifacts)) {
}

std::string BranchManager::CopyStatePtr(const std::string& ptr) {
  if (!artifacts_ || !state_ptr::IsArtifact(ptr)) return ptr;
  return state_ptr::ForArtifact(artifacts_->CopyIfNeeded(state_ptr::ArtifactKey(ptr)));
}

bool BranchManager::LockIfPresent(db::Transaction& tx, const std::string& flow_id, const char* context) {
  auto locked = repository_->LockFlow(tx, flow_id);
  if (locked.code == db::ErrorCode::NotFound) {
    FLOWLOG_LOG_DEBUG("child flow already deleted", {observability::StringField("flow_id", flow_id)});
    return false;
  }
  ThrowIfDbError(locked, context);
  return true;
}

std::string BranchManager::CreateBranch(const BranchSpec& spec) {
  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->LockFlow(*tx, spec.parent_flow_id), "branch: lock parent");

  auto parent = repository_->GetFlow(*tx, spec.parent_flow_id);
  if (!parent) throw util::NotFound("branch: parent flow not found: " + spec.parent_flow_id);

  if (spec.parent_cursor < 0 || spec.parent_cursor > parent->cursor) {
    throw util::InvalidArgument("branch: parent_cursor " + std::to_string(spec.parent_cursor) + " outside 0.." +
                                std::to_string(parent->cursor));
  }

  auto records   = repository_->ReadData(*tx, parent->id, 0, spec.parent_cursor, std::nullopt);
  auto snapshots = repository_->ListSnapshots(*tx, parent->id, spec.parent_cursor);

  db::model::FlowRecord child;
  child.id             = util::NewId();
  child.name           = spec.name;
  child.status         = spec.status;
  child.created_by     = spec.created_by;
  child.created_at_ms  = util::NowMillis();
  child.cursor         = static_cast<int64_t>(records.size());
  child.version        = spec.parent_cursor;
  child.parent_flow_id = parent->id;
  child.parent_cursor  = spec.parent_cursor;
  child.metadata       = spec.metadata;
  ThrowIfDbError(repository_->InsertFlow(*tx, child), "branch: insert flow");

  for (auto record : records) {
    record.id      = util::NewId();
    record.flow_id = child.id;
    ThrowIfDbError(repository_->InsertData(*tx, record), "branch: copy record");
  }

  for (auto snapshot : snapshots) {
    snapshot.id        = util::NewId();
    snapshot.flow_id   = child.id;
    snapshot.state_ptr = CopyStatePtr(snapshot.state_ptr);
    ThrowIfDbError(repository_->InsertSnapshot(*tx, snapshot), "branch: copy snapshot");
  }

  tx->Commit();

  FLOWLOG_LOG_INFO("flow branched", {observability::StringField("flow_id", child.id), observability::StringField("parent_flow_id", parent->id),
                                     observability::IntField("parent_cursor", spec.parent_cursor),
                                     observability::IntField("records", static_cast<int64_t>(records.size())),
                                     observability::IntField("snapshots", static_cast<int64_t>(snapshots.size()))});
  return child.id;
}

void BranchManager::ReleaseChildren(db::Transaction& tx, const std::string& parent_flow_id, std::optional<int64_t> from_cursor) {
  for (const auto& listed : repository_->ListChildren(tx, parent_flow_id)) {
    if (from_cursor && listed.parent_cursor.value_or(0) < *from_cursor) continue;

    if (!LockIfPresent(tx, listed.id, "release child: lock")) continue;

    if (policy_ == ChildPolicy::kCascade) {
      DeleteSubtree(tx, listed.id);
    } else {
      // re-read under the lock
      auto child = repository_->GetFlow(tx, listed.id);
      if (!child) continue;
      child->parent_flow_id.reset();
      child->parent_cursor.reset();
      ThrowIfDbError(repository_->UpdateFlow(tx, *child), "release child: orphan");
    }

    FLOWLOG_LOG_INFO("child flow released", {observability::StringField("flow_id", listed.id),
                                             observability::StringField("parent_flow_id", parent_flow_id),
                                             observability::StringField("policy", PolicyName(policy_))});
  }
}

void BranchManager::DeleteSubtree(db::Transaction& tx, const std::string& flow_id) {
  for (const auto& child : repository_->ListChildren(tx, flow_id)) {
    if (!LockIfPresent(tx, child.id, "cascade delete: lock")) continue;
    DeleteSubtree(tx, child.id);
  }
  RemoveFlowRows(tx, flow_id);
}

void BranchManager::RemoveFlowRows(db::Transaction& tx, const std::string& flow_id) {
  ThrowIfDbError(repository_->DeleteSnapshotsFrom(tx, flow_id, 0), "delete flow: snapshots");
  ThrowIfDbError(repository_->DeleteDataFrom(tx, flow_id, 0), "delete flow: records");
  ThrowIfDbError(repository_->DeleteFlow(tx, flow_id), "delete flow");
}

} // namespace flowlog::core
