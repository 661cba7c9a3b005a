#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/core/flow_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace {

using flowlog::core::BranchSpec;
using flowlog::core::ChildPolicy;
using flowlog::core::FlowSpec;
using flowlog::core::FlowStore;
using flowlog::core::NewRecord;
using flowlog::db::ErrorCode;
using flowlog::db::Repository;
using flowlog::db::memory::MemoryRepository;
using flowlog::db::model::DataRecord;
using flowlog::db::model::FlowRecord;
using flowlog::db::model::SnapshotRecord;
using flowlog::model::Document;
using flowlog::util::NewId;
using flowlog::util::NowMillis;

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

FlowRecord MakeFlow(std::optional<std::string> parent = std::nullopt) {
  FlowRecord flow;
  flow.id            = NewId();
  flow.name          = "parity";
  flow.created_at_ms = NowMillis();
  flow.metadata      = Document::MakeObject({{"suite", "parity"}, {"nested", Document::MakeObject({{"n", 1}})}});
  if (parent) {
    flow.parent_flow_id = parent;
    flow.parent_cursor  = 0;
  }
  return flow;
}

DataRecord MakeData(const std::string& flow_id, int64_t cursor, std::optional<std::string> command_id = std::nullopt) {
  DataRecord data;
  data.id            = NewId();
  data.flow_id       = flow_id;
  data.cursor        = cursor;
  data.key           = "step:" + std::to_string(cursor);
  data.payload       = Document::MakeObject({{"cursor", cursor}, {"ratio", 0.5}, {"tags", Document::MakeArray({"a", true})}});
  data.metadata      = Document::MakeObject({{"origin", "parity"}});
  data.command_id    = std::move(command_id);
  data.version       = cursor;
  data.created_at_ms = NowMillis();
  return data;
}

SnapshotRecord MakeSnapshot(const std::string& flow_id, int64_t cursor, uint64_t created_at_ms) {
  SnapshotRecord snapshot;
  snapshot.id            = NewId();
  snapshot.flow_id       = flow_id;
  snapshot.cursor        = cursor;
  snapshot.state_ptr     = "inline:" + std::to_string(cursor);
  snapshot.metadata      = Document::MakeObject({{"cursor", cursor}});
  snapshot.created_at_ms = created_at_ms;
  return snapshot;
}

void VerifyFlowRows(Repository& repo) {
  auto flow = MakeFlow();

  auto tx = repo.Begin();
  assert(repo.InsertFlow(*tx, flow));
  assert(repo.InsertFlow(*tx, flow).code == ErrorCode::AlreadyExists);
  assert(repo.LockFlow(*tx, flow.id));
  assert(repo.LockFlow(*tx, NewId()).code == ErrorCode::NotFound);

  auto read = repo.GetFlow(*tx, flow.id);
  assert(read.has_value());
  assert(read->name == "parity");
  assert(!read->status.has_value());
  assert(!read->parent_flow_id.has_value());
  assert(read->metadata == flow.metadata);
  assert(read->created_at_ms == flow.created_at_ms);

  read->cursor  = 7;
  read->version = 9;
  read->status  = "running";
  assert(repo.UpdateFlow(*tx, *read));

  auto updated = repo.GetFlow(*tx, flow.id);
  assert(updated->cursor == 7 && updated->version == 9 && updated->status == "running");

  auto missing = MakeFlow();
  assert(repo.UpdateFlow(*tx, missing).code == ErrorCode::NotFound);
  assert(repo.DeleteFlow(*tx, missing.id).code == ErrorCode::NotFound);

  assert(repo.DeleteFlow(*tx, flow.id));
  assert(!repo.GetFlow(*tx, flow.id).has_value());
  tx->Commit();
}

void VerifyDataRows(Repository& repo) {
  auto flow = MakeFlow();

  auto tx = repo.Begin();
  assert(repo.InsertFlow(*tx, flow));
  for (int64_t c = 1; c <= 6; ++c) {
    assert(repo.InsertData(*tx, MakeData(flow.id, c, "cmd-" + std::to_string(c))));
  }

  // cursor and command id are unique per flow
  assert(repo.InsertData(*tx, MakeData(flow.id, 3)).code == ErrorCode::ConstraintViolation);
  assert(repo.InsertData(*tx, MakeData(flow.id, 7, "cmd-2")).code == ErrorCode::ConstraintViolation);

  auto all = repo.ReadData(*tx, flow.id, 0, std::nullopt, std::nullopt);
  assert(all.size() == 6);
  for (std::size_t i = 0; i < all.size(); ++i) {
    assert(all[i].cursor == static_cast<int64_t>(i + 1));
  }
  assert(all[0].payload["tags"].AsArray()[1].AsBool());
  assert(all[0].payload["ratio"].AsDouble() == 0.5);
  assert(all[0].metadata["origin"].AsString() == "parity");
  assert(all[0].command_id == "cmd-1");

  auto window = repo.ReadData(*tx, flow.id, 2, 5, std::nullopt);
  assert(window.size() == 3);
  assert(window.front().cursor == 3 && window.back().cursor == 5);

  auto page = repo.ReadData(*tx, flow.id, 1, std::nullopt, 2);
  assert(page.size() == 2);
  assert(page[0].cursor == 2 && page[1].cursor == 3);

  auto by_command = repo.FindDataByCommand(*tx, flow.id, "cmd-4");
  assert(by_command && by_command->cursor == 4 && by_command->version == 4);
  assert(!repo.FindDataByCommand(*tx, flow.id, "cmd-404").has_value());

  assert(repo.CountData(*tx, flow.id) == 6);
  assert(repo.DeleteDataFrom(*tx, flow.id, 5));
  assert(repo.CountData(*tx, flow.id) == 4);
  assert(!repo.FindDataByCommand(*tx, flow.id, "cmd-5").has_value());

  assert(repo.DeleteDataFrom(*tx, flow.id, 0));
  assert(repo.CountData(*tx, flow.id) == 0);
  assert(repo.DeleteFlow(*tx, flow.id));
  tx->Commit();
}

void VerifySnapshotRows(Repository& repo) {
  auto flow = MakeFlow();
  auto now  = NowMillis();

  auto tx = repo.Begin();
  assert(repo.InsertFlow(*tx, flow));

  auto s2       = MakeSnapshot(flow.id, 2, now);
  auto s4_old   = MakeSnapshot(flow.id, 4, now);
  auto s4_new   = MakeSnapshot(flow.id, 4, now + 10);
  auto s6       = MakeSnapshot(flow.id, 6, now);
  auto orphaned = MakeSnapshot(NewId(), 1, now);
  for (const auto* s : {&s2, &s4_old, &s4_new, &s6}) assert(repo.InsertSnapshot(*tx, *s));
  assert(repo.InsertSnapshot(*tx, s2).code == ErrorCode::AlreadyExists);
  assert(repo.InsertSnapshot(*tx, orphaned).code == ErrorCode::NotFound);

  auto got = repo.GetSnapshot(*tx, s2.id);
  assert(got && got->state_ptr == "inline:2" && got->metadata["cursor"].AsInt() == 2);

  assert(repo.LatestSnapshot(*tx, flow.id, 100)->id == s6.id);
  assert(repo.LatestSnapshot(*tx, flow.id, 5)->id == s4_new.id);
  assert(repo.LatestSnapshot(*tx, flow.id, 3)->id == s2.id);
  assert(!repo.LatestSnapshot(*tx, flow.id, 1).has_value());

  auto listed = repo.ListSnapshots(*tx, flow.id, 4);
  assert(listed.size() == 3);
  assert(listed[0].cursor == 2 && listed[2].cursor == 4);

  assert(repo.DeleteSnapshot(*tx, s2.id));
  assert(repo.DeleteSnapshot(*tx, s2.id).code == ErrorCode::NotFound);
  assert(!repo.GetSnapshot(*tx, s2.id).has_value());

  assert(repo.DeleteSnapshotsFrom(*tx, flow.id, 5));
  assert(repo.ListSnapshots(*tx, flow.id, 100).size() == 2);

  assert(repo.DeleteSnapshotsFrom(*tx, flow.id, 0));
  assert(repo.DeleteFlow(*tx, flow.id));
  tx->Commit();
}

void VerifyChildren(Repository& repo) {
  auto parent = MakeFlow();
  auto first  = MakeFlow(parent.id);
  auto second = MakeFlow(parent.id);
  second.created_at_ms += 5;

  auto tx = repo.Begin();
  assert(repo.InsertFlow(*tx, parent));
  assert(repo.InsertFlow(*tx, second));
  assert(repo.InsertFlow(*tx, first));

  auto children = repo.ListChildren(*tx, parent.id);
  assert(children.size() == 2);
  assert(children[0].id == first.id);
  assert(children[1].id == second.id);
  assert(children[0].parent_cursor == 0);
  assert(repo.ListChildren(*tx, first.id).empty());

  // orphaning clears both parent columns
  first.parent_flow_id.reset();
  first.parent_cursor.reset();
  assert(repo.UpdateFlow(*tx, first));
  assert(repo.ListChildren(*tx, parent.id).size() == 1);
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo) {
  auto flow = MakeFlow();
  {
    auto tx = repo.Begin();
    assert(repo.InsertFlow(*tx, flow));
    assert(repo.InsertData(*tx, MakeData(flow.id, 1)));
    tx->Rollback();
  }
  {
    // destructor rolls back
    auto tx = repo.Begin();
    assert(repo.InsertFlow(*tx, flow));
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetFlow(*check_tx, flow.id).has_value());
  assert(repo.CountData(*check_tx, flow.id) == 0);
  check_tx->Commit();
}

// The record store contract on top of the backend: one winner per expected
// version, branch copies, orphaning on delete.
void VerifyRecordStore(const std::shared_ptr<Repository>& repo) {
  auto store = std::make_shared<FlowStore>(repo);
  auto id    = store->CreateFlow(FlowSpec{.name = "store"});

  constexpr int            kWriters = 4;
  std::atomic<int>         wins{0};
  std::vector<std::thread> writers;
  for (int w = 0; w < kWriters; ++w) {
    writers.emplace_back([&, w] {
      NewRecord record;
      record.flow_id = id;
      record.key     = "writer:" + std::to_string(w);
      if (store->Append(record, 0).ok()) wins.fetch_add(1);
    });
  }
  for (auto& t : writers) t.join();
  assert(wins.load() == 1);

  for (int64_t v = 1; v < 3; ++v) {
    NewRecord record;
    record.flow_id    = id;
    record.key        = "step";
    record.command_id = "cmd-" + std::to_string(v);
    assert(store->Append(record, v).ok());
  }

  NewRecord replay;
  replay.flow_id    = id;
  replay.key        = "step";
  replay.command_id = "cmd-1";
  auto replayed     = store->Append(replay, 0);
  assert(replayed.ok() && replayed.replayed && replayed.version == 2);

  BranchSpec spec;
  spec.parent_flow_id = id;
  spec.parent_cursor  = 2;
  auto branch         = store->Branch(spec);
  assert(store->CountRecords(branch) == 2);
  assert(store->GetFlowMeta(branch).version == 2);

  store->DeleteFlow(id);
  assert(store->CountRecords(id) == -1);
  assert(!store->GetFlowMeta(branch).parent_flow_id.has_value());
  assert(store->ReadRecords(branch, 0).Collect().size() == 2);
  store->DeleteFlow(branch);
}

// Reads run in BeginRead transactions: they see committed rows only and do
// not queue behind an open writer of the same flow.
void VerifyReadsDoNotWaitForWriters(const std::shared_ptr<Repository>& repo) {
  auto store = std::make_shared<FlowStore>(repo);
  auto id    = store->CreateFlow(FlowSpec{.name = "reads"});

  NewRecord committed;
  committed.flow_id = id;
  committed.key     = "committed";
  assert(store->Append(committed, 0).ok());

  auto writer = repo->Begin();
  assert(repo->LockFlow(*writer, id));
  assert(repo->InsertData(*writer, MakeData(id, 2)));

  std::atomic<bool> done{false};
  std::thread       reader([&] {
    assert(store->GetFlowMeta(id).cursor == 1);
    assert(store->CountRecords(id) == 1);
    assert(store->ReadRecords(id, 0).Collect().size() == 1);
    assert(store->ListChildren(id).empty());
    done.store(true);
  });

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (!done.load() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  const bool finished = done.load();
  writer->Rollback();
  reader.join();
  assert(finished);

  auto read_tx = repo->BeginRead();
  assert(repo->LockFlow(*read_tx, id).code == ErrorCode::InvalidArgument);
  read_tx->Rollback();

  store->DeleteFlow(id);
}

// Lineage operations racing each other on the backend: branches copy an
// exact prefix, deletes skip children that vanished, and an append racing
// a delete either lands first or fails with NotFound.
void VerifyConcurrentLineage(const std::shared_ptr<Repository>& repo) {
  auto store = std::make_shared<FlowStore>(repo, ChildPolicy::kOrphan);

  auto append_next = [&](const std::string& id) {
    while (true) {
      auto       meta = store->GetFlowMeta(id);
      NewRecord record;
      record.flow_id = id;
      record.key     = "p" + std::to_string(meta.cursor + 1);
      if (store->Append(record, meta.version).ok()) return;
    }
  };

  // branch racing appends
  auto parent = store->CreateFlow(FlowSpec{.name = "lineage"});
  for (int i = 0; i < 5; ++i) append_next(parent);

  std::vector<std::string> branches;
  {
    std::mutex               mutex;
    std::vector<std::thread> workers;
    workers.emplace_back([&] {
      for (int i = 0; i < 30; ++i) append_next(parent);
    });
    for (int b = 0; b < 2; ++b) {
      workers.emplace_back([&] {
        for (int r = 0; r < 8; ++r) {
          BranchSpec spec;
          spec.parent_flow_id = parent;
          spec.parent_cursor  = store->GetFlowMeta(parent).cursor;
          auto id             = store->Branch(spec);
          std::scoped_lock lock(mutex);
          branches.push_back(id);
        }
      });
    }
    for (auto& t : workers) t.join();
  }

  auto parent_records = store->ReadRecords(parent, 0).Collect();
  assert(parent_records.size() == 35);
  for (const auto& id : branches) {
    auto meta = store->GetFlowMeta(id);
    assert(meta.cursor == *meta.parent_cursor && meta.version == *meta.parent_cursor);
    auto records = store->ReadRecords(id, 0).Collect();
    assert(static_cast<int64_t>(records.size()) == meta.cursor);
    for (std::size_t i = 0; i < records.size(); ++i) assert(records[i].key == parent_records[i].key);
  }

  // parent delete racing child deletes and appends to the parent
  {
    std::vector<std::thread> workers;
    workers.emplace_back([&] {
      for (std::size_t i = 0; i < branches.size(); i += 2) store->DeleteFlow(branches[i]);
    });
    workers.emplace_back([&] {
      try {
        while (true) append_next(parent);
      } catch (const flowlog::util::NotFound&) {
        // deleted underneath
      }
    });
    workers.emplace_back([&] {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
      store->DeleteFlow(parent);
    });
    for (auto& t : workers) t.join();
  }

  assert(!store->FlowExists(parent));
  assert(store->CountRecords(parent) == -1);
  assert(store->ListChildren(parent).empty());

  for (std::size_t i = 0; i < branches.size(); ++i) {
    if (i % 2 == 0) {
      assert(!store->FlowExists(branches[i]));
      continue;
    }
    auto meta = store->GetFlowMeta(branches[i]);
    assert(!meta.parent_flow_id.has_value());
    assert(store->CountRecords(branches[i]) == meta.cursor);
    store->DeleteFlow(branches[i]);
  }
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  auto flow = MakeFlow();
  {
    auto tx = repo->Begin();
    assert(repo->InsertFlow(*tx, flow));
    assert(repo->InsertData(*tx, MakeData(flow.id, 1, "durable")));
    assert(repo->InsertSnapshot(*tx, MakeSnapshot(flow.id, 1, NowMillis())));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto f  = repo->GetFlow(*tx, flow.id);
  assert(f.has_value());
  assert(f->metadata == flow.metadata);
  assert(repo->FindDataByCommand(*tx, flow.id, "durable").has_value());
  assert(repo->LatestSnapshot(*tx, flow.id, 1).has_value());
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if FLOWLOG_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("flowlog_integration_sqlite_" + std::to_string(NowMillis()) + ".db")).string();

  auto make_repo = [db_path]() {
    flowlog::runtime::config::RuntimeConfig config;
    config.mutable_database()->mutable_sqlite()->set_path(db_path);
    return flowlog::factory::BuildRepository(config);
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup =
          [db_path]() {
            for (const auto* suffix : {"", "-wal", "-shm"}) std::filesystem::remove(db_path + suffix);
          },
  };
}
#endif

#if FLOWLOG_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("FLOWLOG_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("FLOWLOG_TEST_POSTGRES_URI is not set");
  }

  auto make_repo = [conninfo = std::string(uri)]() {
    flowlog::runtime::config::RuntimeConfig config;
    config.mutable_database()->mutable_postgres()->set_connection_uri(conninfo);
    config.mutable_database()->mutable_postgres()->set_max_connections(8);
    return flowlog::factory::BuildRepository(config);
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";

  auto repo = backend.make_repository();
  VerifyFlowRows(*repo);
  VerifyDataRows(*repo);
  VerifySnapshotRows(*repo);
  VerifyChildren(*repo);
  VerifyRollbackBehavior(*repo);
  VerifyRecordStore(repo);
  VerifyReadsDoNotWaitForWriters(repo);
  VerifyConcurrentLineage(repo);
  VerifyRestartDurability(backend);
  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
#if FLOWLOG_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif
#if FLOWLOG_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& e) {
    std::cout << "skipping postgres backend: " << e.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "flowlog_integration_repository_parity: pass\n";
  return 0;
}
