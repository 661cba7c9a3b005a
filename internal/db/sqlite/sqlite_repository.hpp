#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace flowlog::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
