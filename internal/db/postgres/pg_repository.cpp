#include "pg_repository.hpp"

#include <limits>
#include <utility>

#include "internal/util/errors.hpp"

namespace flowlog::db::postgres {

namespace {

std::optional<std::string> OptText(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return std::string(f.c_str());
}

std::optional<int64_t> OptI64(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return f.as<int64_t>();
}

flowlog::model::Document Doc(const pqxx::field& f) {
  if (f.is_null()) return {};
  return flowlog::model::FromJson(f.c_str());
}

model::FlowRecord RowToFlow(const pqxx::row& row) {
  model::FlowRecord r;
  r.id             = row[0].c_str();
  r.name           = OptText(row[1]);
  r.status         = OptText(row[2]);
  r.created_by     = OptText(row[3]);
  r.created_at_ms  = row[4].as<uint64_t>();
  r.cursor         = row[5].as<int64_t>();
  r.version        = row[6].as<int64_t>();
  r.parent_flow_id = OptText(row[7]);
  r.parent_cursor  = OptI64(row[8]);
  r.metadata       = Doc(row[9]);
  return r;
}

model::DataRecord RowToData(const pqxx::row& row) {
  model::DataRecord r;
  r.id            = row[0].c_str();
  r.flow_id       = row[1].c_str();
  r.cursor        = row[2].as<int64_t>();
  r.key           = row[3].c_str();
  r.payload       = Doc(row[4]);
  r.metadata      = Doc(row[5]);
  r.command_id    = OptText(row[6]);
  r.version       = row[7].as<int64_t>();
  r.created_at_ms = row[8].as<uint64_t>();
  return r;
}

model::SnapshotRecord RowToSnapshot(const pqxx::row& row) {
  model::SnapshotRecord r;
  r.id            = row[0].c_str();
  r.flow_id       = row[1].c_str();
  r.cursor        = row[2].as<int64_t>();
  r.state_ptr     = row[3].c_str();
  r.metadata      = Doc(row[4]);
  r.created_at_ms = row[5].as<uint64_t>();
  return r;
}

// Reads run driver calls whose failures must not leak pqxx types upward.
template <typename F>
auto Guarded(F&& read) -> decltype(read()) {
  try {
    return read();
  } catch (const pqxx::failure& e) {
    throw util::StorageError(std::string("postgres: ") + e.what());
  } catch (const pqxx::usage_error& e) {
    throw util::StorageError(std::string("postgres: ") + e.what());
  } catch (const pqxx::conversion_error& e) {
    throw util::StorageError(std::string("postgres: ") + e.what());
  }
}

// Inserts that may hit a constraint run under a savepoint: a violation then
// leaves the enclosing transaction usable, as on the other backends.
template <typename... Args>
void InsertUnderSavepoint(pqxx::work& work, const char* statement, Args&&... args) {
  pqxx::subtransaction savepoint(work);
  savepoint.exec_prepared(statement, std::forward<Args>(args)...);
  savepoint.commit();
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return Guarded([&]() -> std::unique_ptr<db::Transaction> { return std::make_unique<PgTransaction>(pool_); });
}

std::unique_ptr<db::Transaction> PgRepository::BeginRead() {
  return Guarded([&]() -> std::unique_ptr<db::Transaction> { return std::make_unique<PgTransaction>(pool_, /*read_only=*/true); });
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::foreign_key_violation*>(&e)) {
    return Result::Err(ErrorCode::NotFound, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// Row lock held until the transaction ends; concurrent writers of the
// same flow block here.
Result PgRepository::LockFlow(Transaction& t, const std::string& flow_id) {
  if (TX(t).ReadOnly()) return Result::Err(ErrorCode::InvalidArgument, "LockFlow in a read-only transaction");
  try {
    auto res = TX(t).Work().exec_prepared("lock_flow", flow_id);
    if (res.empty()) return Result::Err(ErrorCode::NotFound, "flow " + flow_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Flows
// ------------------------------------------------------------------

Result PgRepository::InsertFlow(Transaction& t, const model::FlowRecord& r) {
  try {
    InsertUnderSavepoint(TX(t).Work(), "insert_flow", r.id, r.name, r.status, r.created_by, static_cast<int64_t>(r.created_at_ms), r.cursor,
                               r.version, r.parent_flow_id, r.parent_cursor, flowlog::model::ToJson(r.metadata));
    return Result::Ok();
  } catch (const pqxx::unique_violation& e) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::FlowRecord> PgRepository::GetFlow(Transaction& t, const std::string& flow_id) {
  return Guarded([&]() -> std::optional<model::FlowRecord> {
    auto res = TX(t).Work().exec_prepared("get_flow", flow_id);
    if (res.empty()) return std::nullopt;
    return RowToFlow(res[0]);
  });
}

Result PgRepository::UpdateFlow(Transaction& t, const model::FlowRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_flow", r.id, r.name, r.status, r.created_by, r.cursor, r.version, r.parent_flow_id,
                                          r.parent_cursor, flowlog::model::ToJson(r.metadata));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "flow " + r.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteFlow(Transaction& t, const std::string& flow_id) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_flow", flow_id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "flow " + flow_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::FlowRecord> PgRepository::ListChildren(Transaction& t, const std::string& parent_flow_id) {
  return Guarded([&] {
    auto res = TX(t).Work().exec_prepared("list_children", parent_flow_id);

    std::vector<model::FlowRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      out.push_back(RowToFlow(row));
    }
    return out;
  });
}

// ------------------------------------------------------------------
// Flow data
// ------------------------------------------------------------------

Result PgRepository::InsertData(Transaction& t, const model::DataRecord& r) {
  try {
    InsertUnderSavepoint(TX(t).Work(), "insert_data", r.id, r.flow_id, r.cursor, r.key, flowlog::model::ToJson(r.payload),
                               flowlog::model::ToJson(r.metadata), r.command_id, r.version, static_cast<int64_t>(r.created_at_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::DataRecord> PgRepository::ReadData(Transaction& t, const std::string& flow_id, int64_t after_cursor,
                                                      std::optional<int64_t> until_cursor, std::optional<uint64_t> limit) {
  return Guarded([&] {
    // LIMIT NULL is LIMIT ALL
    std::optional<int64_t> bounded_limit;
    if (limit) bounded_limit = static_cast<int64_t>(*limit);

    auto res = TX(t).Work().exec_prepared("read_data", flow_id, after_cursor, until_cursor.value_or(std::numeric_limits<int64_t>::max()),
                                          bounded_limit);

    std::vector<model::DataRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      out.push_back(RowToData(row));
    }
    return out;
  });
}

std::optional<model::DataRecord> PgRepository::FindDataByCommand(Transaction& t, const std::string& flow_id,
                                                                 const std::string& command_id) {
  return Guarded([&]() -> std::optional<model::DataRecord> {
    auto res = TX(t).Work().exec_prepared("find_data_by_command", flow_id, command_id);
    if (res.empty()) return std::nullopt;
    return RowToData(res[0]);
  });
}

int64_t PgRepository::CountData(Transaction& t, const std::string& flow_id) {
  return Guarded([&] {
    auto res = TX(t).Work().exec_prepared("count_data", flow_id);
    return res[0][0].as<int64_t>();
  });
}

Result PgRepository::DeleteDataFrom(Transaction& t, const std::string& flow_id, int64_t from_cursor) {
  try {
    TX(t).Work().exec_prepared("delete_data_from", flow_id, from_cursor);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Snapshots
// ------------------------------------------------------------------

Result PgRepository::InsertSnapshot(Transaction& t, const model::SnapshotRecord& r) {
  try {
    InsertUnderSavepoint(TX(t).Work(), "insert_snapshot", r.id, r.flow_id, r.cursor, r.state_ptr, flowlog::model::ToJson(r.metadata),
                               static_cast<int64_t>(r.created_at_ms));
    return Result::Ok();
  } catch (const pqxx::unique_violation& e) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::SnapshotRecord> PgRepository::GetSnapshot(Transaction& t, const std::string& snapshot_id) {
  return Guarded([&]() -> std::optional<model::SnapshotRecord> {
    auto res = TX(t).Work().exec_prepared("get_snapshot", snapshot_id);
    if (res.empty()) return std::nullopt;
    return RowToSnapshot(res[0]);
  });
}

std::optional<model::SnapshotRecord> PgRepository::LatestSnapshot(Transaction& t, const std::string& flow_id, int64_t max_cursor) {
  return Guarded([&]() -> std::optional<model::SnapshotRecord> {
    auto res = TX(t).Work().exec_prepared("latest_snapshot", flow_id, max_cursor);
    if (res.empty()) return std::nullopt;
    return RowToSnapshot(res[0]);
  });
}

std::vector<model::SnapshotRecord> PgRepository::ListSnapshots(Transaction& t, const std::string& flow_id, int64_t max_cursor) {
  return Guarded([&] {
    auto res = TX(t).Work().exec_prepared("list_snapshots", flow_id, max_cursor);

    std::vector<model::SnapshotRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      out.push_back(RowToSnapshot(row));
    }
    return out;
  });
}

Result PgRepository::DeleteSnapshot(Transaction& t, const std::string& snapshot_id) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_snapshot", snapshot_id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "snapshot " + snapshot_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteSnapshotsFrom(Transaction& t, const std::string& flow_id, int64_t from_cursor) {
  try {
    TX(t).Work().exec_prepared("delete_snapshots_from", flow_id, from_cursor);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace flowlog::db::postgres
