#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "internal/core/flow_repository.hpp"
#include "internal/storage/artifact_store.hpp"
#include "internal/util/errors.hpp"

namespace flowlog::core {

/*
  How a caller's state type is built from records and (de)serialized.

  apply must be a pure function of (state, record); replay is then
  deterministic and rehydrating from any snapshot gives the same result
  as replaying from scratch.
*/
template <typename State>
struct Reducer {
  State initial{};

  std::function<State(State, const db::model::DataRecord&)> apply;

  std::function<std::string(const State&)> encode;
  std::function<State(const std::string&)>  decode;
};

template <typename State>
struct Rehydration {
  State   state{};
  int64_t cursor = 0;

  // snapshot the replay started from, if any
  std::optional<std::string> snapshot_id;

  int64_t replayed = 0;
};

struct EngineOptions {
  static constexpr uint64_t kDefaultInlineLimitBytes = 64 * 1024;

  // serialized states above this size go to the artifact store
  uint64_t inline_limit_bytes = kDefaultInlineLimitBytes;

  // snapshot after an append whenever cursor % snapshot_interval == 0; 0 = off
  uint64_t snapshot_interval = 0;
};

/*
  RehydrationEngine

  Rebuilds the state of a flow from its latest applicable snapshot plus an
  ordered replay of the records after it. The engine does not know what a
  record means; the Reducer does.

  Snapshot states are referenced by state_ptr (see state_ptr.hpp).

  A prune that lands while a replay is running invalidates it: the
  snapshot it started from is gone, or the record stream raises
  util::InvalidState. The replay is then restarted, at most
  kMaxAttempts times in total.
*/
class RehydrationEngine {
 public:
  static constexpr int kMaxAttempts = 3;

  RehydrationEngine(std::shared_ptr<FlowRepository> flows, storage::ArtifactStorePtr artifacts, EngineOptions options = {});

  template <typename State>
  Rehydration<State> Rehydrate(const std::string& flow_id, const Reducer<State>& reducer) {
    return Run(flow_id, reducer, /*use_snapshots=*/true);
  }

  // Ignores snapshots; replays every record from the initial state.
  template <typename State>
  Rehydration<State> RehydrateFromScratch(const std::string& flow_id, const Reducer<State>& reducer) {
    return Run(flow_id, reducer, /*use_snapshots=*/false);
  }

  // Serializes state (valid at cursor) and saves it as a snapshot; returns
  // the snapshot id.
  template <typename State>
  std::string Capture(const std::string& flow_id, int64_t cursor, const State& state, const Reducer<State>& reducer,
                      const flowlog::model::Document& metadata = {}) {
    return SaveState(flow_id, cursor, reducer.encode(state), metadata);
  }

  // Appends one record and applies the snapshot policy: when the new cursor
  // is a multiple of the snapshot interval, the rehydrated state is captured.
  template <typename State>
  PersistOutcome AppendRecord(const NewRecord& record, int64_t expected_version, const Reducer<State>& reducer) {
    auto outcome = flows_->Append(record, expected_version);
    if (!outcome.ok() || outcome.replayed || options_.snapshot_interval == 0) return outcome;

    auto cursor = flows_->GetFlowMeta(record.flow_id).cursor;
    if (!SnapshotDue(cursor)) return outcome;

    auto rebuilt = Rehydrate(record.flow_id, reducer);
    if (SnapshotDue(rebuilt.cursor)) {
      Capture(record.flow_id, rebuilt.cursor, rebuilt.state, reducer, SnapshotPolicyMetadata());
    }
    return outcome;
  }

  // state_ptr for a serialized state; artifact-backed when above the
  // inline limit or not representable inline.
  std::string StoreState(const std::string& serialized);

  // Serialized state referenced by state_ptr. Throws util::StorageError on
  // malformed pointers and util::NotFound on missing artifacts.
  std::string LoadState(const std::string& ptr);

  std::string SaveState(const std::string& flow_id, int64_t cursor, const std::string& serialized,
                        const flowlog::model::Document& metadata = {});

  bool SnapshotDue(int64_t cursor) const;

  const EngineOptions& options() const {
    return options_;
  }

 private:
  template <typename State>
  Rehydration<State> Run(const std::string& flow_id, const Reducer<State>& reducer, bool use_snapshots) {
    for (int attempt = 1;; ++attempt) {
      std::string reason;
      try {
        auto out = RunOnce(flow_id, reducer, use_snapshots);
        if (SnapshotStillValid(out.snapshot_id)) {
          LogRehydrated(flow_id, out.cursor, out.snapshot_id, out.replayed);
          return out;
        }
        reason = "snapshot removed";
      } catch (const util::InvalidState& e) {
        reason = e.what();
      }

      if (attempt >= kMaxAttempts) {
        throw util::InvalidState("rehydrate " + flow_id + ": flow kept changing during replay (" + reason + ")");
      }
      LogRetry(flow_id, attempt, reason);
    }
  }

  template <typename State>
  Rehydration<State> RunOnce(const std::string& flow_id, const Reducer<State>& reducer, bool use_snapshots) {
    // NotFound propagates
    auto meta = flows_->GetFlowMeta(flow_id);

    Rehydration<State> out;
    out.state = reducer.initial;

    if (use_snapshots) {
      if (auto snapshot = flows_->LoadLatestSnapshot(flow_id); snapshot && snapshot->cursor <= meta.cursor) {
        out.state       = reducer.decode(LoadState(snapshot->state_ptr));
        out.cursor      = snapshot->cursor;
        out.snapshot_id = snapshot->id;
      }
    }

    auto stream = flows_->ReadRecords(flow_id, out.cursor);
    while (auto record = stream.Next()) {
      out.state  = reducer.apply(std::move(out.state), *record);
      out.cursor = record->cursor;
      ++out.replayed;
    }
    return out;
  }

  // False once the snapshot a replay started from has been removed.
  bool SnapshotStillValid(const std::optional<std::string>& snapshot_id);

  static flowlog::model::Document SnapshotPolicyMetadata();
  static void LogRetry(const std::string& flow_id, int attempt, const std::string& reason);
  static void LogRehydrated(const std::string& flow_id, int64_t cursor, const std::optional<std::string>& snapshot_id, int64_t replayed);

  std::shared_ptr<FlowRepository> flows_;
  storage::ArtifactStorePtr       artifacts_;
  EngineOptions                   options_;
};

} // namespace flowlog::core
