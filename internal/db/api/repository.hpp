#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/data_record.hpp"
#include "internal/db/model/flow_record.hpp"
#include "internal/db/model/snapshot_record.hpp"

namespace flowlog::db {

/*
  Repository abstraction (row level).

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - LockFlow() serializes writers of the same flow until the
    transaction ends; writers of different flows never contend
    (except where the engine itself serializes, e.g. sqlite)
  - BeginRead() transactions see committed rows only and do not
    queue behind writers (private sqlite databases excepted)
  - Data records of a flow are returned in ascending cursor order

  The DB is the source of truth for:
    flows
    flow data
    snapshots

  core::FlowStore is the only caller. It owns the invariants
  (cursor/version accounting, idempotency, branching); backends only
  store rows.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // Read-only transaction: sees committed rows only and never blocks
  // writers. It does not wait for them either, except on a private SQLite
  // database (":memory:"), which has a single connection. Only reads are
  // valid inside it; LockFlow returns InvalidArgument.
  virtual std::unique_ptr<Transaction> BeginRead() = 0;

  // Take the write lock of a flow for the rest of the transaction.
  // NotFound if the flow does not exist.
  virtual Result LockFlow(Transaction&, const std::string& flow_id) = 0;

  // ---------------------------------------------------------------------
  // Flows
  // ---------------------------------------------------------------------

  virtual Result InsertFlow(Transaction&, const model::FlowRecord&) = 0;

  virtual std::optional<model::FlowRecord> GetFlow(Transaction&, const std::string& flow_id) = 0;

  virtual Result UpdateFlow(Transaction&, const model::FlowRecord&) = 0;

  // Removes the flow row only; callers delete data and snapshots first.
  virtual Result DeleteFlow(Transaction&, const std::string& flow_id) = 0;

  virtual std::vector<model::FlowRecord> ListChildren(Transaction&, const std::string& parent_flow_id) = 0;

  // ---------------------------------------------------------------------
  // Flow data
  // ---------------------------------------------------------------------

  virtual Result InsertData(Transaction&, const model::DataRecord&) = 0;

  // Records with after_cursor < cursor <= until_cursor, ascending.
  // until_cursor = nullopt means no upper bound.
  virtual std::vector<model::DataRecord> ReadData(Transaction&, const std::string& flow_id, int64_t after_cursor,
                                                  std::optional<int64_t> until_cursor, std::optional<uint64_t> limit) = 0;

  virtual std::optional<model::DataRecord> FindDataByCommand(Transaction&, const std::string& flow_id,
                                                             const std::string& command_id) = 0;

  virtual int64_t CountData(Transaction&, const std::string& flow_id) = 0;

  // Deletes records with cursor >= from_cursor.
  virtual Result DeleteDataFrom(Transaction&, const std::string& flow_id, int64_t from_cursor) = 0;

  // ---------------------------------------------------------------------
  // Snapshots
  // ---------------------------------------------------------------------

  virtual Result InsertSnapshot(Transaction&, const model::SnapshotRecord&) = 0;

  virtual std::optional<model::SnapshotRecord> GetSnapshot(Transaction&, const std::string& snapshot_id) = 0;

  // Highest cursor <= max_cursor; ties resolved by newest created_at_ms, then id.
  virtual std::optional<model::SnapshotRecord> LatestSnapshot(Transaction&, const std::string& flow_id, int64_t max_cursor) = 0;

  // Snapshots with cursor <= max_cursor, ascending by cursor.
  virtual std::vector<model::SnapshotRecord> ListSnapshots(Transaction&, const std::string& flow_id, int64_t max_cursor) = 0;

  virtual Result DeleteSnapshot(Transaction&, const std::string& snapshot_id) = 0;

  // Deletes snapshots with cursor >= from_cursor.
  virtual Result DeleteSnapshotsFrom(Transaction&, const std::string& flow_id, int64_t from_cursor) = 0;
};

} // namespace flowlog::db
