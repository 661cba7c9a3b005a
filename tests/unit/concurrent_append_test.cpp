#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/core/flow_store.hpp"
#include "internal/db/memory/memory_repository.hpp"

namespace {

using flowlog::core::FlowSpec;
using flowlog::core::FlowStore;
using flowlog::core::NewRecord;
using flowlog::db::memory::MemoryRepository;

NewRecord Record(const std::string& flow_id, int writer) {
  NewRecord record;
  record.flow_id = flow_id;
  record.key     = "writer:" + std::to_string(writer);
  return record;
}

// N writers race on the same expected version: exactly one wins.
void TestSameExpectedVersionHasOneWinner() {
  constexpr int kWriters = 16;

  auto store = std::make_shared<FlowStore>(std::make_shared<MemoryRepository>());
  auto id    = store->CreateFlow(FlowSpec{});

  std::atomic<bool>        go{false};
  std::atomic<int>         wins{0};
  std::atomic<int>         conflicts{0};
  std::vector<std::thread> writers;

  for (int w = 0; w < kWriters; ++w) {
    writers.emplace_back([&, w] {
      while (!go.load()) std::this_thread::yield();
      auto outcome = store->Append(Record(id, w), 0);
      if (outcome.ok()) {
        wins.fetch_add(1);
      } else {
        assert(outcome.version == 1);
        conflicts.fetch_add(1);
      }
    });
  }

  go.store(true);
  for (auto& t : writers) t.join();

  assert(wins.load() == 1);
  assert(conflicts.load() == kWriters - 1);
  assert(store->CountRecords(id) == 1);
  assert(store->GetFlowMeta(id).version == 1);
}

// Writers that re-read and retry on conflict never lose an update.
void TestRetryingWritersLoseNothing() {
  constexpr int kWriters   = 8;
  constexpr int kPerWriter = 25;

  auto store = std::make_shared<FlowStore>(std::make_shared<MemoryRepository>());
  auto id    = store->CreateFlow(FlowSpec{});

  std::vector<std::thread> writers;
  for (int w = 0; w < kWriters; ++w) {
    writers.emplace_back([&, w] {
      for (int i = 0; i < kPerWriter; ++i) {
        auto version = store->GetFlowMeta(id).version;
        while (true) {
          auto outcome = store->Append(Record(id, w), version);
          if (outcome.ok()) break;
          version = outcome.version;
        }
      }
    });
  }
  for (auto& t : writers) t.join();

  auto meta = store->GetFlowMeta(id);
  assert(meta.cursor == kWriters * kPerWriter);
  assert(meta.version == kWriters * kPerWriter);

  auto records = store->ReadRecords(id, 0).Collect();
  assert(records.size() == static_cast<std::size_t>(kWriters * kPerWriter));
  for (std::size_t i = 0; i < records.size(); ++i) {
    assert(records[i].cursor == static_cast<int64_t>(i + 1));
  }
}

// Concurrent retries of one command store it once.
void TestConcurrentCommandReplay() {
  constexpr int kWriters = 8;

  auto store = std::make_shared<FlowStore>(std::make_shared<MemoryRepository>());
  auto id    = store->CreateFlow(FlowSpec{});

  std::atomic<int>         fresh{0};
  std::vector<std::thread> writers;
  for (int w = 0; w < kWriters; ++w) {
    writers.emplace_back([&, w] {
      auto record       = Record(id, w);
      record.command_id = "once";
      auto outcome      = store->Append(record, 0);
      assert(outcome.ok());
      assert(outcome.version == 1);
      if (!outcome.replayed) fresh.fetch_add(1);
    });
  }
  for (auto& t : writers) t.join();

  assert(fresh.load() == 1);
  assert(store->CountRecords(id) == 1);
}

// Appends to different flows proceed independently.
void TestIndependentFlows() {
  constexpr int kFlows   = 6;
  constexpr int kAppends = 40;

  auto store = std::make_shared<FlowStore>(std::make_shared<MemoryRepository>());

  std::vector<std::string> ids;
  for (int f = 0; f < kFlows; ++f) ids.push_back(store->CreateFlow(FlowSpec{}));

  std::vector<std::thread> writers;
  for (int f = 0; f < kFlows; ++f) {
    writers.emplace_back([&, f] {
      for (int i = 0; i < kAppends; ++i) {
        auto outcome = store->Append(Record(ids[f], f), i);
        assert(outcome.ok());
      }
    });
  }
  for (auto& t : writers) t.join();

  for (const auto& id : ids) {
    assert(store->CountRecords(id) == kAppends);
  }
}

} // namespace

int main() {
  TestSameExpectedVersionHasOneWinner();
  TestRetryingWritersLoseNothing();
  TestConcurrentCommandReplay();
  TestIndependentFlows();

  std::cout << "flowlog_unit_concurrent_append: pass\n";
  return 0;
}
