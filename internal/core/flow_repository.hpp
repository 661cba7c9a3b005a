#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/record_stream.hpp"
#include "internal/db/model/data_record.hpp"
#include "internal/db/model/flow_record.hpp"
#include "internal/db/model/snapshot_record.hpp"
#include "internal/model/document.hpp"

namespace flowlog::core {

using FlowMeta = db::model::FlowRecord;

// What happens to branches whose parent is deleted, or pruned past the
// cursor they branched at.
enum class ChildPolicy {
  kOrphan,  // parent reference cleared, child kept
  kCascade, // child and its own subtree deleted
};

struct FlowSpec {
  std::optional<std::string> name;
  std::optional<std::string> status;
  std::optional<std::string> created_by;
  flowlog::model::Document   metadata;
};

struct BranchSpec {
  std::string                parent_flow_id;
  int64_t                    parent_cursor = 0;
  std::optional<std::string> name;
  std::optional<std::string> status;
  std::optional<std::string> created_by;
  flowlog::model::Document   metadata;
};

struct NewRecord {
  std::string                flow_id;
  std::string                key;
  flowlog::model::Document   payload;
  flowlog::model::Document   metadata;
  std::optional<std::string> command_id;
};

/*
  Result of an append attempt.

  kOk:       the record is stored; version is the flow version it produced.
             replayed is set when the command id had already been stored and
             nothing new was written.
  kConflict: expected_version was stale; nothing was written and version is
             the flow's current version.
*/
struct PersistOutcome {
  enum class Status { kOk, kConflict };

  Status  status   = Status::kOk;
  int64_t version  = 0;
  bool    replayed = false;

  static PersistOutcome Ok(int64_t version, bool replayed = false) {
    return {Status::kOk, version, replayed};
  }

  static PersistOutcome Conflict(int64_t current_version) {
    return {Status::kConflict, current_version, false};
  }

  bool ok() const {
    return status == Status::kOk;
  }
};

/*
  FlowRepository

  The record store contract: sole authority over flows, their records and
  their snapshots. Every operation touching more than one row runs in one
  backend transaction.

  Errors:
    util::NotFound        flow missing (where noted)
    util::InvalidArgument bad cursors or ids
    util::StorageError    backend failure
    util::NotImplemented  unsupported by the configured backend
  A version mismatch is a PersistOutcome, not an error.
*/
class FlowRepository {
 public:
  virtual ~FlowRepository() = default;

  // New flow with cursor = version = 0 and no parent.
  virtual std::string CreateFlow(const FlowSpec& spec) = 0;

  // Throws util::NotFound.
  virtual FlowMeta GetFlowMeta(const std::string& flow_id) = 0;

  virtual PersistOutcome Append(const NewRecord& record, int64_t expected_version) = 0;

  // Records with cursor > from_cursor, ascending. Empty for unknown flows.
  virtual RecordStream ReadRecords(const std::string& flow_id, int64_t from_cursor = 0) = 0;

  virtual std::string Branch(const BranchSpec& spec) = 0;

  virtual bool FlowExists(const std::string& flow_id) = 0;

  // -1 when the flow does not exist.
  virtual int64_t CountRecords(const std::string& flow_id) = 0;

  // Removes the flow with its records and snapshots; children follow the
  // configured ChildPolicy. Throws util::NotFound.
  virtual void DeleteFlow(const std::string& flow_id) = 0;

  virtual std::string SaveSnapshot(const std::string& flow_id, int64_t cursor, const std::string& state_ptr,
                                   const flowlog::model::Document& metadata = {}) = 0;
  virtual std::optional<db::model::SnapshotRecord> LoadSnapshot(const std::string& snapshot_id) = 0;
  // Highest cursor not exceeding the flow's current cursor.
  virtual std::optional<db::model::SnapshotRecord> LoadLatestSnapshot(const std::string& flow_id) = 0;

  virtual std::optional<std::string> GetStatus(const std::string& flow_id) = 0;
  virtual void SetStatus(const std::string& flow_id, const std::optional<std::string>& status) = 0;

  virtual bool CheckVersion(const std::string& flow_id, int64_t expected_version) = 0;

  // Removes records and snapshots with cursor >= from_cursor; returns the
  // number of records removed.
  virtual int64_t PruneFrom(const std::string& flow_id, int64_t from_cursor) = 0;

  virtual bool DeleteSnapshot(const std::string& snapshot_id) = 0;
  virtual std::vector<db::model::SnapshotRecord> ListSnapshots(const std::string& flow_id) = 0;

  virtual std::vector<FlowMeta> ListChildren(const std::string& flow_id) = 0;
};

} // namespace flowlog::core
