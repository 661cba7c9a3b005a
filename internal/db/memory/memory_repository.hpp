#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace flowlog::db::memory {

class MemoryTransaction;

/*
  Process-wide in-memory backend.

  Locking discipline:
    - one Slot per flow id; its writer mutex is the flow's row lock and is
      held by a transaction from LockFlow (or its first write) until the
      transaction ends
    - a transaction stages only its delta (flow row, appended records,
      truncation, snapshot list); Commit() applies it to the slot's rows
      under the data mutex, so an append costs O(1) regardless of how long
      the flow is and readers never see staged writes
    - index_mutex_ only guards the slot map and snapshot index and is never
      held across an operation

  There is no global lock: transactions on unrelated flows never contend.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;
  std::unique_ptr<Transaction> BeginRead() override;

  Result LockFlow(Transaction&, const std::string& flow_id) override;

  Result InsertFlow(Transaction&, const model::FlowRecord&) override;
  std::optional<model::FlowRecord> GetFlow(Transaction&, const std::string&) override;
  Result UpdateFlow(Transaction&, const model::FlowRecord&) override;
  Result DeleteFlow(Transaction&, const std::string&) override;
  std::vector<model::FlowRecord> ListChildren(Transaction&, const std::string&) override;

  Result InsertData(Transaction&, const model::DataRecord&) override;
  std::vector<model::DataRecord> ReadData(Transaction&, const std::string& flow_id, int64_t after_cursor,
                                          std::optional<int64_t> until_cursor, std::optional<uint64_t> limit) override;
  std::optional<model::DataRecord> FindDataByCommand(Transaction&, const std::string& flow_id,
                                                     const std::string& command_id) override;
  int64_t CountData(Transaction&, const std::string& flow_id) override;
  Result DeleteDataFrom(Transaction&, const std::string& flow_id, int64_t from_cursor) override;

  Result InsertSnapshot(Transaction&, const model::SnapshotRecord&) override;
  std::optional<model::SnapshotRecord> GetSnapshot(Transaction&, const std::string&) override;
  std::optional<model::SnapshotRecord> LatestSnapshot(Transaction&, const std::string& flow_id, int64_t max_cursor) override;
  std::vector<model::SnapshotRecord> ListSnapshots(Transaction&, const std::string& flow_id, int64_t max_cursor) override;
  Result DeleteSnapshot(Transaction&, const std::string&) override;
  Result DeleteSnapshotsFrom(Transaction&, const std::string& flow_id, int64_t from_cursor) override;

private:
  friend class MemoryTransaction;

  // Committed rows of one flow.
  struct Partition {
    model::FlowRecord                            flow;
    std::vector<model::DataRecord>               data;       // ascending cursor
    std::unordered_map<std::string, std::size_t> by_command; // command id -> index into data
    std::vector<model::SnapshotRecord>           snapshots;  // insertion order
  };

  struct Slot {
    std::mutex                writer;
    mutable std::shared_mutex data_mutex;
    bool                      exists = false;
    Partition                 rows;
  };

  std::shared_ptr<Slot> FindSlot(const std::string& flow_id) const;
  std::shared_ptr<Slot> GetOrCreateSlot(const std::string& flow_id);
  std::vector<std::shared_ptr<Slot>> AllSlots() const;

  mutable std::mutex index_mutex_;
  std::unordered_map<std::string, std::shared_ptr<Slot>> slots_;
  std::unordered_map<std::string, std::string> snapshot_flow_; // snapshot id -> flow id
};

}
