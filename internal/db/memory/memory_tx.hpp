#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace flowlog::db::memory {

/*
  Transaction = per-flow writer locks + staged deltas

  A flow is locked at most once per transaction. Writes never copy the
  committed rows: they record the new flow row, the records appended,
  the cursor the committed records are truncated at and, when snapshots
  change, the new snapshot list. Reads merge that delta over the committed
  rows, which cannot change while the writer lock is held. Commit()
  applies every delta and releases the locks.

  A read-only transaction takes no locks and sees committed rows only.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  using Slot = MemoryRepository::Slot;

  MemoryTransaction(MemoryRepository& repo, bool read_only);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  bool read_only() const {
    return read_only_;
  }

  // Acquire the flow's writer lock. NotFound if the flow does not exist.
  Result Lock(const std::string& flow_id);

  // ---------------------------------------------------------------------
  // Writes (the flow is locked on first use; std::logic_error when the
  // transaction is read-only or finished)
  // ---------------------------------------------------------------------

  // Stage a brand new flow. AlreadyExists if the id is taken.
  Result Create(const model::FlowRecord& flow);
  Result PutFlow(const model::FlowRecord& flow);
  // Stage removal of the flow and all its rows.
  Result Remove(const std::string& flow_id);

  Result AppendData(const model::DataRecord& record);
  Result TruncateData(const std::string& flow_id, int64_t from_cursor);

  // Writable snapshot list of the flow, nullptr if absent.
  std::vector<model::SnapshotRecord>* MutableSnapshots(const std::string& flow_id);

  // ---------------------------------------------------------------------
  // Reads (own writes visible)
  // ---------------------------------------------------------------------

  std::optional<model::FlowRecord> Flow(const std::string& flow_id) const;

  std::vector<model::DataRecord> Data(const std::string& flow_id, int64_t after_cursor, std::optional<int64_t> until_cursor,
                                      std::optional<uint64_t> limit) const;

  std::optional<model::DataRecord> DataByCommand(const std::string& flow_id, const std::string& command_id) const;

  int64_t DataCount(const std::string& flow_id) const;

  std::vector<model::SnapshotRecord> Snapshots(const std::string& flow_id) const;

  // Flow rows staged by this transaction; nullopt for staged removals.
  std::unordered_map<std::string, std::optional<model::FlowRecord>> StagedFlows() const;

 private:
  struct Staged {
    bool                   exists   = false;
    bool                   replaced = false; // committed rows discarded
    model::FlowRecord      flow;
    std::optional<int64_t> truncate_from; // committed records with cursor >= this are dropped

    std::vector<model::DataRecord>                    appended; // ascending cursor
    std::optional<std::vector<model::SnapshotRecord>> snapshots;
  };

  struct Entry {
    std::shared_ptr<Slot>        slot;
    std::unique_lock<std::mutex> writer;
    std::optional<Staged>        staged; // set by the first write
    bool                         created = false;
  };

  Entry* Acquire(const std::string& flow_id, bool create_slot);
  // Staged delta of an existing flow (locked), nullptr if absent.
  Staged* Stage(const std::string& flow_id);

  const Entry* Find(const std::string& flow_id) const;
  bool         Exists(const Entry& entry) const;

  // Number of committed records still visible through entry (all of them
  // when entry is null).
  static std::size_t VisibleBase(const Slot& slot, const Entry* entry);

  void EnsureWritable() const;
  void Apply(const std::string& flow_id, Entry& entry);
  void Release();

  MemoryRepository&                      repo_;
  const bool                             read_only_;
  std::unordered_map<std::string, Entry> entries_;
  bool                                   committed_   = false;
  bool                                   rolled_back_ = false;
};

} // namespace flowlog::db::memory
