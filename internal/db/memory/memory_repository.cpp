#include "memory_repository.hpp"

#include <algorithm>
#include <shared_mutex>
#include <tuple>

#include "memory_tx.hpp"

namespace flowlog::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this, /*read_only=*/false);
}

std::unique_ptr<db::Transaction> MemoryRepository::BeginRead() {
  return std::make_unique<MemoryTransaction>(*this, /*read_only=*/true);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

static Result ReadOnly() {
  return Result::Err(ErrorCode::InvalidArgument, "write in a read-only transaction");
}

std::shared_ptr<MemoryRepository::Slot> MemoryRepository::FindSlot(const std::string& flow_id) const {
  std::scoped_lock lock(index_mutex_);
  auto it = slots_.find(flow_id);
  if (it == slots_.end()) return nullptr;
  return it->second;
}

std::shared_ptr<MemoryRepository::Slot> MemoryRepository::GetOrCreateSlot(const std::string& flow_id) {
  std::scoped_lock lock(index_mutex_);
  auto& slot = slots_[flow_id];
  if (!slot) slot = std::make_shared<Slot>();
  return slot;
}

std::vector<std::shared_ptr<MemoryRepository::Slot>> MemoryRepository::AllSlots() const {
  std::scoped_lock lock(index_mutex_);
  std::vector<std::shared_ptr<Slot>> out;
  out.reserve(slots_.size());
  for (const auto& [_, slot] : slots_) {
    out.push_back(slot);
  }
  return out;
}

Result MemoryRepository::LockFlow(Transaction& t, const std::string& flow_id) {
  return TX(t).Lock(flow_id);
}

// ------------------------------------------------------------------
// Flows
// ------------------------------------------------------------------

Result MemoryRepository::InsertFlow(Transaction& t, const model::FlowRecord& r) {
  if (TX(t).read_only()) return ReadOnly();
  return TX(t).Create(r);
}

std::optional<model::FlowRecord> MemoryRepository::GetFlow(Transaction& t, const std::string& flow_id) {
  return TX(t).Flow(flow_id);
}

Result MemoryRepository::UpdateFlow(Transaction& t, const model::FlowRecord& r) {
  if (TX(t).read_only()) return ReadOnly();
  return TX(t).PutFlow(r);
}

Result MemoryRepository::DeleteFlow(Transaction& t, const std::string& flow_id) {
  if (TX(t).read_only()) return ReadOnly();
  return TX(t).Remove(flow_id);
}

std::vector<model::FlowRecord> MemoryRepository::ListChildren(Transaction& t, const std::string& parent_flow_id) {
  auto staged = TX(t).StagedFlows();

  std::vector<model::FlowRecord> out;
  for (const auto& [flow_id, flow] : staged) {
    if (flow && flow->parent_flow_id == parent_flow_id) out.push_back(*flow);
  }

  for (const auto& slot : AllSlots()) {
    std::shared_lock lock(slot->data_mutex);
    if (!slot->exists || staged.contains(slot->rows.flow.id)) continue;
    if (slot->rows.flow.parent_flow_id == parent_flow_id) out.push_back(slot->rows.flow);
  }

  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return a.created_at_ms != b.created_at_ms ? a.created_at_ms < b.created_at_ms : a.id < b.id;
  });
  return out;
}

// ------------------------------------------------------------------
// Flow data
// ------------------------------------------------------------------

Result MemoryRepository::InsertData(Transaction& t, const model::DataRecord& r) {
  if (TX(t).read_only()) return ReadOnly();
  return TX(t).AppendData(r);
}

std::vector<model::DataRecord> MemoryRepository::ReadData(Transaction& t, const std::string& flow_id, int64_t after_cursor,
                                                          std::optional<int64_t> until_cursor, std::optional<uint64_t> limit) {
  return TX(t).Data(flow_id, after_cursor, until_cursor, limit);
}

std::optional<model::DataRecord> MemoryRepository::FindDataByCommand(Transaction& t, const std::string& flow_id,
                                                                     const std::string& command_id) {
  return TX(t).DataByCommand(flow_id, command_id);
}

int64_t MemoryRepository::CountData(Transaction& t, const std::string& flow_id) {
  return TX(t).DataCount(flow_id);
}

Result MemoryRepository::DeleteDataFrom(Transaction& t, const std::string& flow_id, int64_t from_cursor) {
  if (TX(t).read_only()) return ReadOnly();
  return TX(t).TruncateData(flow_id, from_cursor);
}

// ------------------------------------------------------------------
// Snapshots
// ------------------------------------------------------------------

Result MemoryRepository::InsertSnapshot(Transaction& t, const model::SnapshotRecord& r) {
  if (TX(t).read_only()) return ReadOnly();

  auto* snapshots = TX(t).MutableSnapshots(r.flow_id);
  if (!snapshots) return Result::Err(ErrorCode::NotFound, "flow " + r.flow_id);

  const bool duplicate = std::any_of(snapshots->begin(), snapshots->end(), [&](const auto& s) { return s.id == r.id; });
  if (duplicate) return Result::Err(ErrorCode::AlreadyExists, "snapshot " + r.id);

  snapshots->push_back(r);
  return Result::Ok();
}

std::optional<model::SnapshotRecord> MemoryRepository::GetSnapshot(Transaction& t, const std::string& snapshot_id) {
  auto& tx = TX(t);

  auto find_in = [&](const std::string& flow_id) -> std::optional<model::SnapshotRecord> {
    for (const auto& s : tx.Snapshots(flow_id)) {
      if (s.id == snapshot_id) return s;
    }
    return std::nullopt;
  };

  // snapshots staged by this transaction are not indexed yet
  for (const auto& [flow_id, flow] : tx.StagedFlows()) {
    if (!flow) continue;
    if (auto found = find_in(flow_id)) return found;
  }

  std::string flow_id;
  {
    std::scoped_lock lock(index_mutex_);
    auto it = snapshot_flow_.find(snapshot_id);
    if (it == snapshot_flow_.end()) return std::nullopt;
    flow_id = it->second;
  }
  return find_in(flow_id);
}

std::optional<model::SnapshotRecord> MemoryRepository::LatestSnapshot(Transaction& t, const std::string& flow_id, int64_t max_cursor) {
  auto snapshots = TX(t).Snapshots(flow_id);

  const model::SnapshotRecord* best = nullptr;
  for (const auto& s : snapshots) {
    if (s.cursor > max_cursor) continue;
    if (!best || std::tie(s.cursor, s.created_at_ms, s.id) > std::tie(best->cursor, best->created_at_ms, best->id)) {
      best = &s;
    }
  }
  if (!best) return std::nullopt;
  return *best;
}

std::vector<model::SnapshotRecord> MemoryRepository::ListSnapshots(Transaction& t, const std::string& flow_id, int64_t max_cursor) {
  auto out = TX(t).Snapshots(flow_id);
  std::erase_if(out, [&](const auto& s) { return s.cursor > max_cursor; });
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.cursor < b.cursor; });
  return out;
}

Result MemoryRepository::DeleteSnapshot(Transaction& t, const std::string& snapshot_id) {
  if (TX(t).read_only()) return ReadOnly();

  auto existing = GetSnapshot(t, snapshot_id);
  if (!existing) return Result::Err(ErrorCode::NotFound, "snapshot " + snapshot_id);

  auto* snapshots = TX(t).MutableSnapshots(existing->flow_id);
  if (!snapshots) return Result::Err(ErrorCode::NotFound, "flow " + existing->flow_id);

  std::erase_if(*snapshots, [&](const auto& s) { return s.id == snapshot_id; });
  return Result::Ok();
}

Result MemoryRepository::DeleteSnapshotsFrom(Transaction& t, const std::string& flow_id, int64_t from_cursor) {
  if (TX(t).read_only()) return ReadOnly();

  auto* snapshots = TX(t).MutableSnapshots(flow_id);
  if (!snapshots) return Result::Err(ErrorCode::NotFound, "flow " + flow_id);

  std::erase_if(*snapshots, [&](const auto& s) { return s.cursor >= from_cursor; });
  return Result::Ok();
}

} // namespace flowlog::db::memory
