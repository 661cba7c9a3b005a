#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/core/flow_store.hpp"
#include "internal/core/rehydration_engine.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/storage/none/unsupported_artifact_store.hpp"
#include "internal/storage/ram/ram_artifact_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace {

using flowlog::core::EngineOptions;
using flowlog::core::FlowSpec;
using flowlog::core::FlowStore;
using flowlog::core::NewRecord;
using flowlog::core::Reducer;
using flowlog::core::RehydrationEngine;
using flowlog::db::memory::MemoryRepository;
using flowlog::model::Document;

// Order-sensitive state: the concatenated step keys.
Reducer<std::string> TrailReducer() {
  Reducer<std::string> reducer;
  reducer.apply = [](std::string state, const flowlog::db::model::DataRecord& record) {
    if (!state.empty()) state += ",";
    return state + record.key;
  };
  reducer.encode = [](const std::string& state) { return state; };
  reducer.decode = [](const std::string& text) { return text; };
  return reducer;
}

struct Fixture {
  explicit Fixture(EngineOptions options = {}, flowlog::storage::ArtifactStorePtr store = nullptr)
      : artifacts(store ? store : std::make_shared<flowlog::storage::RamArtifactStore>()),
        flows(std::make_shared<FlowStore>(std::make_shared<MemoryRepository>())),
        engine(flows, artifacts, options) {
  }

  std::string FlowWith(int records) {
    auto id = flows->CreateFlow(FlowSpec{});
    for (int i = 1; i <= records; ++i) {
      NewRecord record;
      record.flow_id = id;
      record.key     = "s" + std::to_string(i);
      assert(flows->Append(record, i - 1).ok());
    }
    return id;
  }

  flowlog::storage::ArtifactStorePtr artifacts;
  std::shared_ptr<FlowStore>         flows;
  RehydrationEngine                  engine;
};

void TestReplayFromScratch() {
  Fixture f;
  auto    id      = f.FlowWith(4);
  auto    reducer = TrailReducer();

  auto result = f.engine.Rehydrate(id, reducer);
  assert(result.state == "s1,s2,s3,s4");
  assert(result.cursor == 4);
  assert(result.replayed == 4);
  assert(!result.snapshot_id.has_value());
}

void TestEmptyFlowYieldsInitialState() {
  Fixture f;
  auto    id      = f.FlowWith(0);
  auto    reducer = TrailReducer();
  reducer.initial = "seed";

  auto result = f.engine.Rehydrate(id, reducer);
  assert(result.state == "seed");
  assert(result.cursor == 0);
  assert(result.replayed == 0);
}

// Rehydrating from a snapshot at any cursor equals replaying from scratch.
void TestSnapshotEquivalence() {
  Fixture f;
  auto    id      = f.FlowWith(6);
  auto    reducer = TrailReducer();

  const auto scratch = f.engine.RehydrateFromScratch(id, reducer).state;

  for (int64_t at = 0; at <= 6; ++at) {
    auto branch_spec           = flowlog::core::BranchSpec{};
    branch_spec.parent_flow_id = id;
    branch_spec.parent_cursor  = 6;
    auto copy                  = f.flows->Branch(branch_spec);

    std::string prefix;
    for (const auto& record : f.flows->ReadRecords(copy, 0).Collect()) {
      if (record.cursor > at) break;
      prefix = reducer.apply(prefix, record);
    }
    auto snapshot_id = f.engine.Capture(copy, at, prefix, reducer);

    auto result = f.engine.Rehydrate(copy, reducer);
    assert(result.state == scratch);
    assert(result.snapshot_id == snapshot_id);
    assert(result.replayed == 6 - at);
    assert(result.cursor == 6);
  }
}

void TestLargeStatesGoToArtifacts() {
  EngineOptions options;
  options.inline_limit_bytes = 8;
  Fixture f(options);

  auto small = f.engine.StoreState("tiny");
  assert(small == "inline:tiny");

  auto large = f.engine.StoreState("well past eight bytes");
  assert(large.rfind("artifact:", 0) == 0);
  assert(f.artifacts->Exists(large.substr(9)));
  assert(f.engine.LoadState(large) == "well past eight bytes");

  const std::string binary("a\0b", 3);
  auto              with_nul = f.engine.StoreState(binary);
  assert(with_nul.rfind("artifact:", 0) == 0);
  assert(f.engine.LoadState(with_nul) == binary);

  // end to end through a snapshot
  auto id      = f.FlowWith(3);
  auto reducer = TrailReducer();
  auto snap    = f.engine.Capture(id, 3, f.engine.RehydrateFromScratch(id, reducer).state, reducer);
  assert(f.flows->LoadSnapshot(snap)->state_ptr.rfind("artifact:", 0) == 0);

  auto result = f.engine.Rehydrate(id, reducer);
  assert(result.state == "s1,s2,s3");
  assert(result.replayed == 0);
}

void TestBadStatePointers() {
  Fixture f;

  bool threw = false;
  try {
    (void)f.engine.LoadState("gzip:abc");
  } catch (const flowlog::util::StorageError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)f.engine.LoadState("artifact:" + flowlog::util::NewId());
  } catch (const flowlog::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestUnsupportedStoreKeepsSmallStatesInline() {
  EngineOptions options;
  options.inline_limit_bytes = 8;
  Fixture f(options, std::make_shared<flowlog::storage::UnsupportedArtifactStore>());

  assert(f.engine.StoreState("short") == "inline:short");

  bool threw = false;
  try {
    (void)f.engine.StoreState("far too long for inline");
  } catch (const flowlog::util::NotImplemented&) {
    threw = true;
  }
  assert(threw);
}

void TestSnapshotPolicy() {
  EngineOptions options;
  options.snapshot_interval = 3;
  Fixture f(options);
  auto    reducer = TrailReducer();
  auto    id      = f.FlowWith(0);

  for (int64_t v = 0; v < 7; ++v) {
    NewRecord record;
    record.flow_id = id;
    record.key     = "p" + std::to_string(v + 1);
    auto outcome   = f.engine.AppendRecord(record, v, reducer);
    assert(outcome.ok());
  }

  auto snapshots = f.flows->ListSnapshots(id);
  assert(snapshots.size() == 2);
  assert(snapshots[0].cursor == 3);
  assert(snapshots[1].cursor == 6);
  assert(f.engine.LoadState(snapshots[1].state_ptr) == "p1,p2,p3,p4,p5,p6");
  assert(snapshots[1].metadata["origin"].AsString() == "snapshot_policy");

  auto result = f.engine.Rehydrate(id, reducer);
  assert(result.snapshot_id == snapshots[1].id);
  assert(result.replayed == 1);
  assert(result.state == "p1,p2,p3,p4,p5,p6,p7");

  // conflicts never snapshot
  NewRecord stale;
  stale.flow_id = id;
  stale.key     = "stale";
  assert(!f.engine.AppendRecord(stale, 0, reducer).ok());
  assert(f.flows->ListSnapshots(id).size() == 2);

  assert(!f.engine.SnapshotDue(0));
  assert(f.engine.SnapshotDue(9));
  assert(!f.engine.SnapshotDue(10));
}

void TestPrunedSnapshotsAreNotUsed() {
  Fixture f;
  auto    id      = f.FlowWith(4);
  auto    reducer = TrailReducer();

  (void)f.engine.Capture(id, 4, std::string("s1,s2,s3,s4"), reducer);
  (void)f.flows->PruneFrom(id, 3);

  auto result = f.engine.Rehydrate(id, reducer);
  assert(!result.snapshot_id.has_value());
  assert(result.state == "s1,s2");
}

void TestMissingFlowThrows() {
  Fixture f;
  auto    reducer = TrailReducer();
  bool    threw   = false;
  try {
    (void)f.engine.Rehydrate(flowlog::util::NewId(), reducer);
  } catch (const flowlog::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

// The reducer prunes the flow under the running replay, dropping the
// snapshot the replay started from; the engine starts over and lands on
// the post-prune state.
void TestReplayRestartsAfterConcurrentPrune() {
  Fixture f;
  auto    id      = f.FlowWith(4);
  auto    reducer = TrailReducer();

  (void)f.engine.Capture(id, 4, std::string("s1,s2,s3,s4"), reducer);
  for (int i = 5; i <= 6; ++i) {
    NewRecord record;
    record.flow_id = id;
    record.key     = "s" + std::to_string(i);
    assert(f.flows->Append(record, i - 1).ok());
  }

  bool pruned = false;
  auto racing = reducer;
  racing.apply = [&, inner = reducer.apply](std::string state, const flowlog::db::model::DataRecord& record) {
    if (!pruned) {
      pruned = true;
      (void)f.flows->PruneFrom(id, 3);

      NewRecord replacement;
      replacement.flow_id = id;
      replacement.key     = "t3";
      assert(f.flows->Append(replacement, f.flows->GetFlowMeta(id).version).ok());
    }
    return inner(std::move(state), record);
  };

  auto result = f.engine.Rehydrate(id, racing);
  assert(pruned);
  assert(!result.snapshot_id.has_value());
  assert(result.state == "s1,s2,t3");
  assert(result.cursor == 3);
  assert(result.state == f.engine.RehydrateFromScratch(id, reducer).state);
}

} // namespace

int main() {
  TestReplayFromScratch();
  TestEmptyFlowYieldsInitialState();
  TestSnapshotEquivalence();
  TestLargeStatesGoToArtifacts();
  TestBadStatePointers();
  TestUnsupportedStoreKeepsSmallStatesInline();
  TestSnapshotPolicy();
  TestPrunedSnapshotsAreNotUsed();
  TestReplayRestartsAfterConcurrentPrune();
  TestMissingFlowThrows();

  std::cout << "flowlog_unit_rehydration_engine: pass\n";
  return 0;
}
