#include "flow_store.hpp"

#include "internal/core/db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace flowlog::core {

using observability::IntField;
using observability::StringField;

FlowStore::FlowStore(std::shared_ptr<db::Repository> repository, ChildPolicy child_policy, storage::ArtifactStorePtr artifacts)
    : repository_(std::move(repository)), branches_(repository_, child_policy, std::move(artifacts)) {
}

std::string FlowStore::CreateFlow(const FlowSpec& spec) {
  flowlog::model::CheckPersistable(spec.metadata, "create flow: metadata");

  db::model::FlowRecord flow;
  flow.id            = util::NewId();
  flow.name          = spec.name;
  flow.status        = spec.status;
  flow.created_by    = spec.created_by;
  flow.created_at_ms = util::NowMillis();
  flow.metadata      = spec.metadata;

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->InsertFlow(*tx, flow), "create flow");
  tx->Commit();

  FLOWLOG_LOG_INFO("flow created", {StringField("flow_id", flow.id), StringField("name", flow.name.value_or(""))});
  return flow.id;
}

FlowMeta FlowStore::GetFlowMeta(const std::string& flow_id) {
  auto tx   = repository_->BeginRead();
  auto flow = repository_->GetFlow(*tx, flow_id);
  tx->Commit();

  if (!flow) throw util::NotFound("flow not found: " + flow_id);
  return *flow;
}

PersistOutcome FlowStore::Append(const NewRecord& record, int64_t expected_version) {
  flowlog::model::CheckPersistable(record.payload, "append: payload");
  flowlog::model::CheckPersistable(record.metadata, "append: metadata");

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->LockFlow(*tx, record.flow_id), "append: lock flow");

  auto flow = repository_->GetFlow(*tx, record.flow_id);
  if (!flow) throw util::NotFound("append: flow not found: " + record.flow_id);

  // replay check first: a retry still carrying its original (now stale)
  // expected version must observe the original outcome
  if (record.command_id) {
    if (auto stored = repository_->FindDataByCommand(*tx, flow->id, *record.command_id)) {
      tx->Commit();
      FLOWLOG_LOG_DEBUG("append replayed", {StringField("flow_id", flow->id), StringField("command_id", *record.command_id),
                                            IntField("version", stored->version)});
      return PersistOutcome::Ok(stored->version, /*replayed=*/true);
    }
  }

  if (flow->version != expected_version) {
    tx->Rollback();
    FLOWLOG_LOG_INFO("append conflict", {StringField("flow_id", flow->id), IntField("expected_version", expected_version),
                                         IntField("current_version", flow->version)});
    return PersistOutcome::Conflict(flow->version);
  }

  db::model::DataRecord data;
  data.id            = util::NewId();
  data.flow_id       = flow->id;
  data.cursor        = flow->cursor + 1;
  data.key           = record.key;
  data.payload       = record.payload;
  data.metadata      = record.metadata;
  data.command_id    = record.command_id;
  data.version       = flow->version + 1;
  data.created_at_ms = util::NowMillis();
  ThrowIfDbError(repository_->InsertData(*tx, data), "append: insert record");

  flow->cursor  = data.cursor;
  flow->version = data.version;
  ThrowIfDbError(repository_->UpdateFlow(*tx, *flow), "append: update flow");
  tx->Commit();

  FLOWLOG_LOG_DEBUG("record appended", {StringField("flow_id", flow->id), IntField("cursor", data.cursor), IntField("version", data.version)});
  return PersistOutcome::Ok(data.version);
}

RecordStream FlowStore::ReadRecords(const std::string& flow_id, int64_t from_cursor) {
  return RecordStream(repository_, flow_id, from_cursor);
}

std::string FlowStore::Branch(const BranchSpec& spec) {
  flowlog::model::CheckPersistable(spec.metadata, "branch: metadata");
  return branches_.CreateBranch(spec);
}

bool FlowStore::FlowExists(const std::string& flow_id) {
  auto tx     = repository_->BeginRead();
  bool exists = repository_->GetFlow(*tx, flow_id).has_value();
  tx->Commit();
  return exists;
}

int64_t FlowStore::CountRecords(const std::string& flow_id) {
  auto tx = repository_->BeginRead();
  if (!repository_->GetFlow(*tx, flow_id)) {
    tx->Commit();
    return -1;
  }
  auto count = repository_->CountData(*tx, flow_id);
  tx->Commit();
  return count;
}

void FlowStore::DeleteFlow(const std::string& flow_id) {
  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->LockFlow(*tx, flow_id), "delete flow: lock");

  branches_.ReleaseChildren(*tx, flow_id, std::nullopt);
  branches_.RemoveFlowRows(*tx, flow_id);
  tx->Commit();

  FLOWLOG_LOG_INFO("flow deleted", {StringField("flow_id", flow_id)});
}

std::string FlowStore::SaveSnapshot(const std::string& flow_id, int64_t cursor, const std::string& state_ptr,
                                    const flowlog::model::Document& metadata) {
  flowlog::model::CheckPersistable(metadata, "save snapshot: metadata");

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->LockFlow(*tx, flow_id), "save snapshot: lock flow");

  auto flow = repository_->GetFlow(*tx, flow_id);
  if (!flow) throw util::NotFound("save snapshot: flow not found: " + flow_id);
  if (cursor < 0 || cursor > flow->cursor) {
    throw util::InvalidArgument("save snapshot: cursor " + std::to_string(cursor) + " outside 0.." + std::to_string(flow->cursor));
  }

  db::model::SnapshotRecord snapshot;
  snapshot.id            = util::NewId();
  snapshot.flow_id       = flow_id;
  snapshot.cursor        = cursor;
  snapshot.state_ptr     = state_ptr;
  snapshot.metadata      = metadata;
  snapshot.created_at_ms = util::NowMillis();
  ThrowIfDbError(repository_->InsertSnapshot(*tx, snapshot), "save snapshot");
  tx->Commit();

  FLOWLOG_LOG_INFO("snapshot saved", {StringField("flow_id", flow_id), StringField("snapshot_id", snapshot.id), IntField("cursor", cursor)});
  return snapshot.id;
}

std::optional<db::model::SnapshotRecord> FlowStore::LoadSnapshot(const std::string& snapshot_id) {
  auto tx       = repository_->BeginRead();
  auto snapshot = repository_->GetSnapshot(*tx, snapshot_id);
  tx->Commit();
  return snapshot;
}

std::optional<db::model::SnapshotRecord> FlowStore::LoadLatestSnapshot(const std::string& flow_id) {
  auto tx   = repository_->BeginRead();
  auto flow = repository_->GetFlow(*tx, flow_id);
  if (!flow) {
    tx->Commit();
    return std::nullopt;
  }
  auto snapshot = repository_->LatestSnapshot(*tx, flow_id, flow->cursor);
  tx->Commit();
  return snapshot;
}

std::optional<std::string> FlowStore::GetStatus(const std::string& flow_id) {
  return GetFlowMeta(flow_id).status;
}

void FlowStore::SetStatus(const std::string& flow_id, const std::optional<std::string>& status) {
  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->LockFlow(*tx, flow_id), "set status: lock flow");

  auto flow = repository_->GetFlow(*tx, flow_id);
  if (!flow) throw util::NotFound("set status: flow not found: " + flow_id);

  flow->status = status;
  ThrowIfDbError(repository_->UpdateFlow(*tx, *flow), "set status");
  tx->Commit();

  FLOWLOG_LOG_INFO("flow status updated", {StringField("flow_id", flow_id), StringField("status", status.value_or(""))});
}

bool FlowStore::CheckVersion(const std::string& flow_id, int64_t expected_version) {
  return GetFlowMeta(flow_id).version == expected_version;
}

int64_t FlowStore::PruneFrom(const std::string& flow_id, int64_t from_cursor) {
  if (from_cursor < 0) {
    throw util::InvalidArgument("prune: negative cursor " + std::to_string(from_cursor));
  }

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->LockFlow(*tx, flow_id), "prune: lock flow");

  auto flow = repository_->GetFlow(*tx, flow_id);
  if (!flow) throw util::NotFound("prune: flow not found: " + flow_id);

  if (from_cursor > flow->cursor) {
    tx->Rollback();
    return 0;
  }

  branches_.ReleaseChildren(*tx, flow_id, from_cursor);
  ThrowIfDbError(repository_->DeleteSnapshotsFrom(*tx, flow_id, from_cursor), "prune: snapshots");
  ThrowIfDbError(repository_->DeleteDataFrom(*tx, flow_id, from_cursor), "prune: records");

  const auto remaining = repository_->CountData(*tx, flow_id);
  const auto removed   = flow->cursor - remaining;

  flow->cursor = remaining;
  flow->version += 1;
  ThrowIfDbError(repository_->UpdateFlow(*tx, *flow), "prune: update flow");
  tx->Commit();

  FLOWLOG_LOG_INFO("flow pruned", {StringField("flow_id", flow_id), IntField("from_cursor", from_cursor), IntField("removed", removed),
                                   IntField("version", flow->version)});
  return removed;
}

bool FlowStore::DeleteSnapshot(const std::string& snapshot_id) {
  auto tx     = repository_->Begin();
  auto result = repository_->DeleteSnapshot(*tx, snapshot_id);
  if (result.code == db::ErrorCode::NotFound) {
    tx->Rollback();
    return false;
  }
  ThrowIfDbError(result, "delete snapshot");
  tx->Commit();

  FLOWLOG_LOG_INFO("snapshot deleted", {StringField("snapshot_id", snapshot_id)});
  return true;
}

std::vector<db::model::SnapshotRecord> FlowStore::ListSnapshots(const std::string& flow_id) {
  auto tx   = repository_->BeginRead();
  auto flow = repository_->GetFlow(*tx, flow_id);
  if (!flow) throw util::NotFound("list snapshots: flow not found: " + flow_id);

  auto snapshots = repository_->ListSnapshots(*tx, flow_id, flow->cursor);
  tx->Commit();
  return snapshots;
}

std::vector<FlowMeta> FlowStore::ListChildren(const std::string& flow_id) {
  auto tx       = repository_->BeginRead();
  auto children = repository_->ListChildren(*tx, flow_id);
  tx->Commit();
  return children;
}

} // namespace flowlog::core
