#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/core/flow_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace {

using flowlog::core::FlowSpec;
using flowlog::core::FlowStore;
using flowlog::core::NewRecord;
using flowlog::db::ErrorCode;
using flowlog::db::memory::MemoryRepository;
using flowlog::db::model::DataRecord;
using flowlog::db::model::FlowRecord;
using flowlog::util::NewId;

FlowRecord MakeFlow() {
  FlowRecord flow;
  flow.id            = NewId();
  flow.created_at_ms = flowlog::util::NowMillis();
  return flow;
}

DataRecord MakeData(const std::string& flow_id, int64_t cursor, const std::string& command_id) {
  DataRecord data;
  data.id         = NewId();
  data.flow_id    = flow_id;
  data.cursor     = cursor;
  data.key        = "k";
  data.command_id = command_id;
  data.version    = cursor;
  return data;
}

// Appending to a long flow costs about as much as appending to a short one.
void TestAppendCostDoesNotGrowWithFlowLength() {
  constexpr int kBatch = 500;
  constexpr int kTotal = 8 * kBatch;

  FlowStore store(std::make_shared<MemoryRepository>());
  auto      id = store.CreateFlow(FlowSpec{});

  auto append_batch = [&](int start) {
    auto began = std::chrono::steady_clock::now();
    for (int i = start; i < start + kBatch; ++i) {
      NewRecord record;
      record.flow_id    = id;
      record.key        = "step";
      record.command_id = "cmd-" + std::to_string(i);
      assert(store.Append(record, i).ok());
    }
    return std::chrono::steady_clock::now() - began;
  };

  auto early = append_batch(0);
  for (int start = kBatch; start < kTotal - kBatch; start += kBatch) (void)append_batch(start);
  auto late = append_batch(kTotal - kBatch);

  assert(store.CountRecords(id) == kTotal);
  assert(late <= early * 8 + std::chrono::milliseconds(50));
}

void TestCommandIndexFollowsTruncation() {
  MemoryRepository repo;
  auto             flow = MakeFlow();

  auto tx = repo.Begin();
  assert(repo.InsertFlow(*tx, flow));
  for (int64_t c = 1; c <= 4; ++c) assert(repo.InsertData(*tx, MakeData(flow.id, c, "cmd-" + std::to_string(c))));
  tx->Commit();

  tx = repo.Begin();
  assert(repo.LockFlow(*tx, flow.id));
  assert(repo.DeleteDataFrom(*tx, flow.id, 3));
  // the truncation is visible inside the transaction before commit
  assert(!repo.FindDataByCommand(*tx, flow.id, "cmd-3").has_value());
  assert(repo.FindDataByCommand(*tx, flow.id, "cmd-2")->cursor == 2);
  assert(repo.InsertData(*tx, MakeData(flow.id, 3, "cmd-4")));
  assert(repo.FindDataByCommand(*tx, flow.id, "cmd-4")->cursor == 3);
  tx->Commit();

  tx = repo.BeginRead();
  assert(repo.CountData(*tx, flow.id) == 3);
  assert(!repo.FindDataByCommand(*tx, flow.id, "cmd-3").has_value());
  assert(repo.FindDataByCommand(*tx, flow.id, "cmd-4")->cursor == 3);
  tx->Commit();

  // a rolled back append leaves the index alone
  tx = repo.Begin();
  assert(repo.InsertData(*tx, MakeData(flow.id, 4, "cmd-5")));
  tx->Rollback();

  tx = repo.BeginRead();
  assert(!repo.FindDataByCommand(*tx, flow.id, "cmd-5").has_value());
  assert(repo.CountData(*tx, flow.id) == 3);
  tx->Commit();
}

void TestReadTransactions() {
  MemoryRepository repo;
  auto             flow = MakeFlow();
  {
    auto tx = repo.Begin();
    assert(repo.InsertFlow(*tx, flow));
    tx->Commit();
  }

  auto writer = repo.Begin();
  assert(repo.LockFlow(*writer, flow.id));
  assert(repo.InsertData(*writer, MakeData(flow.id, 1, "pending")));

  // a reader does not wait for the writer and sees committed rows only
  auto reader = repo.BeginRead();
  assert(repo.GetFlow(*reader, flow.id).has_value());
  assert(repo.CountData(*reader, flow.id) == 0);
  assert(!repo.FindDataByCommand(*reader, flow.id, "pending").has_value());

  assert(repo.LockFlow(*reader, flow.id).code == ErrorCode::InvalidArgument);
  assert(repo.InsertData(*reader, MakeData(flow.id, 2, "other")).code == ErrorCode::InvalidArgument);
  assert(repo.DeleteFlow(*reader, flow.id).code == ErrorCode::InvalidArgument);
  reader->Commit();

  writer->Commit();

  reader = repo.BeginRead();
  assert(repo.CountData(*reader, flow.id) == 1);
  reader->Commit();
}

} // namespace

int main() {
  TestAppendCostDoesNotGrowWithFlowLength();
  TestCommandIndexFollowsTruncation();
  TestReadTransactions();

  std::cout << "flowlog_unit_memory_repository: pass\n";
  return 0;
}
