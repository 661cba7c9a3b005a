#include "memory_tx.hpp"

#include <algorithm>
#include <shared_mutex>
#include <stdexcept>

namespace flowlog::db::memory {

namespace {

Result MissingFlow(const std::string& flow_id) {
  return Result::Err(ErrorCode::NotFound, "flow " + flow_id);
}

auto FirstAtOrAfter(const std::vector<model::DataRecord>& data, int64_t cursor) {
  return std::lower_bound(data.begin(), data.end(), cursor, [](const model::DataRecord& d, int64_t c) { return d.cursor < c; });
}

} // namespace

MemoryTransaction::MemoryTransaction(MemoryRepository& repo, bool read_only) : repo_(repo), read_only_(read_only) {
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::EnsureWritable() const {
  if (committed_ || rolled_back_) {
    throw std::logic_error("memory transaction already finished");
  }
  if (read_only_) {
    throw std::logic_error("write in a read-only memory transaction");
  }
}

MemoryTransaction::Entry* MemoryTransaction::Acquire(const std::string& flow_id, bool create_slot) {
  EnsureWritable();

  auto it = entries_.find(flow_id);
  if (it != entries_.end()) return &it->second;

  while (true) {
    auto slot = create_slot ? repo_.GetOrCreateSlot(flow_id) : repo_.FindSlot(flow_id);
    if (!slot) return nullptr;

    std::unique_lock<std::mutex> writer(slot->writer);
    // a committed removal may have unlinked the slot while we waited
    if (create_slot && repo_.FindSlot(flow_id) != slot) continue;

    Entry entry;
    entry.slot   = std::move(slot);
    entry.writer = std::move(writer);
    return &entries_.emplace(flow_id, std::move(entry)).first->second;
  }
}

const MemoryTransaction::Entry* MemoryTransaction::Find(const std::string& flow_id) const {
  auto it = entries_.find(flow_id);
  return it == entries_.end() ? nullptr : &it->second;
}

bool MemoryTransaction::Exists(const Entry& entry) const {
  if (entry.staged) return entry.staged->exists;
  std::shared_lock lock(entry.slot->data_mutex);
  return entry.slot->exists;
}

// Caller holds slot.data_mutex.
std::size_t MemoryTransaction::VisibleBase(const Slot& slot, const Entry* entry) {
  if (!slot.exists) return 0;

  const auto& data = slot.rows.data;
  if (!entry || !entry->staged) return data.size();

  const auto& staged = *entry->staged;
  if (staged.replaced || !staged.exists) return 0;
  if (!staged.truncate_from) return data.size();
  return static_cast<std::size_t>(FirstAtOrAfter(data, *staged.truncate_from) - data.begin());
}

MemoryTransaction::Staged* MemoryTransaction::Stage(const std::string& flow_id) {
  auto* entry = Acquire(flow_id, /*create_slot=*/false);
  if (!entry) return nullptr;

  if (!entry->staged) {
    std::shared_lock lock(entry->slot->data_mutex);
    if (!entry->slot->exists) return nullptr;

    Staged staged;
    staged.exists = true;
    staged.flow   = entry->slot->rows.flow;
    entry->staged = std::move(staged);
  }
  return entry->staged->exists ? &*entry->staged : nullptr;
}

Result MemoryTransaction::Lock(const std::string& flow_id) {
  if (read_only_) return Result::Err(ErrorCode::InvalidArgument, "LockFlow in a read-only transaction");

  auto* entry = Acquire(flow_id, /*create_slot=*/false);
  if (!entry || !Exists(*entry)) return MissingFlow(flow_id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Writes
// ------------------------------------------------------------------

Result MemoryTransaction::Create(const model::FlowRecord& flow) {
  auto* entry = Acquire(flow.id, /*create_slot=*/true);
  if (Exists(*entry)) return Result::Err(ErrorCode::AlreadyExists, "flow " + flow.id);

  Staged staged;
  staged.exists   = true;
  staged.replaced = true;
  staged.flow     = flow;
  staged.snapshots.emplace();

  entry->staged  = std::move(staged);
  entry->created = true;
  return Result::Ok();
}

Result MemoryTransaction::PutFlow(const model::FlowRecord& flow) {
  auto* staged = Stage(flow.id);
  if (!staged) return MissingFlow(flow.id);
  staged->flow = flow;
  return Result::Ok();
}

Result MemoryTransaction::Remove(const std::string& flow_id) {
  auto* staged = Stage(flow_id);
  if (!staged) return MissingFlow(flow_id);

  *staged          = Staged{};
  staged->replaced = true;
  staged->snapshots.emplace();
  return Result::Ok();
}

Result MemoryTransaction::AppendData(const model::DataRecord& record) {
  auto* staged = Stage(record.flow_id);
  if (!staged) return MissingFlow(record.flow_id);

  int64_t last_cursor = 0;
  if (!staged->appended.empty()) {
    last_cursor = staged->appended.back().cursor;
  } else {
    const auto* entry = Find(record.flow_id);
    std::shared_lock lock(entry->slot->data_mutex);
    const auto visible = VisibleBase(*entry->slot, entry);
    if (visible > 0) last_cursor = entry->slot->rows.data[visible - 1].cursor;
  }

  if (last_cursor >= record.cursor) {
    return Result::Err(ErrorCode::ConstraintViolation, "cursor " + std::to_string(record.cursor) + " already used");
  }
  if (record.command_id && DataByCommand(record.flow_id, *record.command_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "command id " + *record.command_id + " already used");
  }

  staged->appended.push_back(record);
  return Result::Ok();
}

Result MemoryTransaction::TruncateData(const std::string& flow_id, int64_t from_cursor) {
  auto* staged = Stage(flow_id);
  if (!staged) return MissingFlow(flow_id);

  std::erase_if(staged->appended, [&](const auto& d) { return d.cursor >= from_cursor; });
  staged->truncate_from = staged->truncate_from ? std::min(*staged->truncate_from, from_cursor) : from_cursor;
  return Result::Ok();
}

std::vector<model::SnapshotRecord>* MemoryTransaction::MutableSnapshots(const std::string& flow_id) {
  auto* staged = Stage(flow_id);
  if (!staged) return nullptr;

  if (!staged->snapshots) {
    const auto* entry = Find(flow_id);
    std::shared_lock lock(entry->slot->data_mutex);
    staged->snapshots = entry->slot->rows.snapshots;
  }
  return &*staged->snapshots;
}

// ------------------------------------------------------------------
// Reads
// ------------------------------------------------------------------

std::optional<model::FlowRecord> MemoryTransaction::Flow(const std::string& flow_id) const {
  const auto* entry = Find(flow_id);
  if (entry && entry->staged) {
    if (!entry->staged->exists) return std::nullopt;
    return entry->staged->flow;
  }

  auto slot = entry ? entry->slot : repo_.FindSlot(flow_id);
  if (!slot) return std::nullopt;

  std::shared_lock lock(slot->data_mutex);
  if (!slot->exists) return std::nullopt;
  return slot->rows.flow;
}

std::vector<model::DataRecord> MemoryTransaction::Data(const std::string& flow_id, int64_t after_cursor,
                                                       std::optional<int64_t> until_cursor, std::optional<uint64_t> limit) const {
  std::vector<model::DataRecord> out;
  if (limit && *limit == 0) return out;

  const auto* entry = Find(flow_id);
  if (entry && entry->staged && !entry->staged->exists) return out;

  auto slot = entry ? entry->slot : repo_.FindSlot(flow_id);
  if (!slot) return out;

  // false once the window is full
  auto take = [&](const model::DataRecord& d) {
    if (d.cursor <= after_cursor) return true;
    if (until_cursor && d.cursor > *until_cursor) return false;
    out.push_back(d);
    return !limit || out.size() < *limit;
  };

  {
    std::shared_lock lock(slot->data_mutex);
    const auto& data = slot->rows.data;
    const auto  end  = data.begin() + static_cast<std::ptrdiff_t>(VisibleBase(*slot, entry));
    auto it = std::upper_bound(data.begin(), end, after_cursor, [](int64_t c, const model::DataRecord& d) { return c < d.cursor; });
    for (; it != end; ++it) {
      if (!take(*it)) return out;
    }
  }

  if (entry && entry->staged) {
    for (const auto& d : entry->staged->appended) {
      if (!take(d)) break;
    }
  }
  return out;
}

std::optional<model::DataRecord> MemoryTransaction::DataByCommand(const std::string& flow_id, const std::string& command_id) const {
  const auto* entry = Find(flow_id);
  if (entry && entry->staged) {
    if (!entry->staged->exists) return std::nullopt;
    for (const auto& d : entry->staged->appended) {
      if (d.command_id == command_id) return d;
    }
  }

  auto slot = entry ? entry->slot : repo_.FindSlot(flow_id);
  if (!slot) return std::nullopt;

  std::shared_lock lock(slot->data_mutex);
  auto it = slot->rows.by_command.find(command_id);
  if (it == slot->rows.by_command.end() || it->second >= VisibleBase(*slot, entry)) return std::nullopt;
  return slot->rows.data[it->second];
}

int64_t MemoryTransaction::DataCount(const std::string& flow_id) const {
  const auto* entry = Find(flow_id);
  if (entry && entry->staged && !entry->staged->exists) return 0;

  auto slot = entry ? entry->slot : repo_.FindSlot(flow_id);
  if (!slot) return 0;

  std::size_t count = 0;
  {
    std::shared_lock lock(slot->data_mutex);
    count = VisibleBase(*slot, entry);
  }
  if (entry && entry->staged) count += entry->staged->appended.size();
  return static_cast<int64_t>(count);
}

std::vector<model::SnapshotRecord> MemoryTransaction::Snapshots(const std::string& flow_id) const {
  const auto* entry = Find(flow_id);
  if (entry && entry->staged) {
    if (!entry->staged->exists) return {};
    if (entry->staged->snapshots) return *entry->staged->snapshots;
  }

  auto slot = entry ? entry->slot : repo_.FindSlot(flow_id);
  if (!slot) return {};

  std::shared_lock lock(slot->data_mutex);
  if (!slot->exists) return {};
  return slot->rows.snapshots;
}

std::unordered_map<std::string, std::optional<model::FlowRecord>> MemoryTransaction::StagedFlows() const {
  std::unordered_map<std::string, std::optional<model::FlowRecord>> out;
  for (const auto& [flow_id, entry] : entries_) {
    if (!entry.staged) continue;
    out.emplace(flow_id, entry.staged->exists ? std::optional<model::FlowRecord>(entry.staged->flow) : std::nullopt);
  }
  return out;
}

// ------------------------------------------------------------------
// Commit / rollback
// ------------------------------------------------------------------

void MemoryTransaction::Apply(const std::string& flow_id, Entry& entry) {
  auto& staged = *entry.staged;
  auto& slot   = *entry.slot;

  std::vector<std::string> dropped_snapshots;
  std::vector<std::string> added_snapshots;
  {
    std::unique_lock lock(slot.data_mutex);
    auto&            rows = slot.rows;

    if (staged.snapshots || !staged.exists) {
      for (const auto& snapshot : rows.snapshots) dropped_snapshots.push_back(snapshot.id);
    }
    if (staged.replaced) rows = MemoryRepository::Partition{};

    if (!staged.exists) {
      slot.exists = false;
    } else {
      if (staged.truncate_from) {
        auto first = FirstAtOrAfter(rows.data, *staged.truncate_from);
        for (auto it = first; it != rows.data.end(); ++it) {
          if (it->command_id) rows.by_command.erase(*it->command_id);
        }
        rows.data.erase(first, rows.data.end());
      }

      for (auto& record : staged.appended) {
        if (record.command_id) rows.by_command[*record.command_id] = rows.data.size();
        rows.data.push_back(std::move(record));
      }

      rows.flow = staged.flow;
      if (staged.snapshots) {
        rows.snapshots = std::move(*staged.snapshots);
        for (const auto& snapshot : rows.snapshots) added_snapshots.push_back(snapshot.id);
      }
      slot.exists = true;
    }
  }

  std::scoped_lock index_lock(repo_.index_mutex_);
  for (const auto& id : dropped_snapshots) repo_.snapshot_flow_.erase(id);
  for (const auto& id : added_snapshots) repo_.snapshot_flow_[id] = flow_id;

  if (!staged.exists) {
    auto slot_it = repo_.slots_.find(flow_id);
    if (slot_it != repo_.slots_.end() && slot_it->second == entry.slot) {
      repo_.slots_.erase(slot_it);
    }
  }
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw std::logic_error("memory transaction already finished");
  }

  for (auto& [flow_id, entry] : entries_) {
    if (entry.staged) Apply(flow_id, entry);
  }

  committed_ = true;
  Release();
}

void MemoryTransaction::Rollback() {
  if (committed_ || rolled_back_) return;

  {
    std::scoped_lock index_lock(repo_.index_mutex_);
    for (auto& [flow_id, entry] : entries_) {
      if (!entry.created) continue;
      // drop the placeholder slot of a flow that was never published
      auto slot_it = repo_.slots_.find(flow_id);
      if (slot_it == repo_.slots_.end() || slot_it->second != entry.slot) continue;

      std::shared_lock data_lock(entry.slot->data_mutex);
      if (!entry.slot->exists) repo_.slots_.erase(slot_it);
    }
  }

  rolled_back_ = true;
  Release();
}

void MemoryTransaction::Release() {
  // unique_lock members unlock the flow writers
  entries_.clear();
}

} // namespace flowlog::db::memory
