#include "rehydration_engine.hpp"

#include "internal/core/state_ptr.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace flowlog::core {

using observability::IntField;
using observability::StringField;

RehydrationEngine::RehydrationEngine(std::shared_ptr<FlowRepository> flows, storage::ArtifactStorePtr artifacts, EngineOptions options)
    : flows_(std::move(flows)), artifacts_(std::move(artifacts)), options_(options) {
  if (options_.inline_limit_bytes == 0) options_.inline_limit_bytes = EngineOptions::kDefaultInlineLimitBytes;
}

std::string RehydrationEngine::StoreState(const std::string& serialized) {
  const bool fits_inline = serialized.size() <= options_.inline_limit_bytes && serialized.find('\0') == std::string::npos;
  if (fits_inline) return state_ptr::ForInline(serialized);

  if (!artifacts_) throw util::NotImplemented("state exceeds the inline limit and no artifact store is configured");

  auto key = artifacts_->Put(storage::common::ToBuffer(serialized));
  FLOWLOG_LOG_DEBUG("state stored as artifact", {StringField("key", key), IntField("bytes", static_cast<int64_t>(serialized.size()))});
  return state_ptr::ForArtifact(key);
}

std::string RehydrationEngine::LoadState(const std::string& ptr) {
  if (state_ptr::IsInline(ptr)) {
    return state_ptr::InlineState(ptr);
  }

  if (state_ptr::IsArtifact(ptr)) {
    if (!artifacts_) throw util::NotImplemented("snapshot references an artifact but no artifact store is configured");
    return storage::common::ToString(*artifacts_->Get(state_ptr::ArtifactKey(ptr)));
  }

  throw util::StorageError("malformed snapshot state pointer");
}

std::string RehydrationEngine::SaveState(const std::string& flow_id, int64_t cursor, const std::string& serialized,
                                         const flowlog::model::Document& metadata) {
  return flows_->SaveSnapshot(flow_id, cursor, StoreState(serialized), metadata);
}

bool RehydrationEngine::SnapshotDue(int64_t cursor) const {
  if (options_.snapshot_interval == 0 || cursor <= 0) return false;
  return static_cast<uint64_t>(cursor) % options_.snapshot_interval == 0;
}

flowlog::model::Document RehydrationEngine::SnapshotPolicyMetadata() {
  return flowlog::model::Document::MakeObject({{"origin", "snapshot_policy"}});
}

bool RehydrationEngine::SnapshotStillValid(const std::optional<std::string>& snapshot_id) {
  return !snapshot_id || flows_->LoadSnapshot(*snapshot_id).has_value();
}

void RehydrationEngine::LogRetry(const std::string& flow_id, int attempt, const std::string& reason) {
  FLOWLOG_LOG_WARN("rehydrate retry: flow changed during replay",
                   {StringField("flow_id", flow_id), IntField("attempt", attempt), StringField("reason", reason)});
}

void RehydrationEngine::LogRehydrated(const std::string& flow_id, int64_t cursor, const std::optional<std::string>& snapshot_id,
                                      int64_t replayed) {
  FLOWLOG_LOG_DEBUG("flow rehydrated", {StringField("flow_id", flow_id), IntField("cursor", cursor),
                                        StringField("snapshot_id", snapshot_id.value_or("")), IntField("replayed", replayed)});
}

} // namespace flowlog::core
