#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <limits>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"

namespace flowlog::db::sqlite {

using flowlog::db::ErrorCode;
using flowlog::db::Result;

namespace {

using StatementPtr = std::unique_ptr<sqlite3_stmt, int (*)(sqlite3_stmt*)>;

StatementPtr Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    throw util::StorageError(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return StatementPtr(st, &sqlite3_finalize);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindOptI64(sqlite3_stmt* st, int idx, const std::optional<int64_t>& v) {
  if (v) {
    BindI64(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindDocument(sqlite3_stmt* st, int idx, const flowlog::model::Document& doc) {
  BindText(st, idx, flowlog::model::ToJson(doc));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

std::optional<int64_t> ColOptI64(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColI64(st, col);
}

flowlog::model::Document ColDocument(sqlite3_stmt* st, int col) {
  return flowlog::model::FromJson(ColText(st, col));
}

// column order: sql::SELECT_FLOW
model::FlowRecord RowToFlow(sqlite3_stmt* st) {
  model::FlowRecord r;
  r.id             = ColText(st, 0);
  r.name           = ColOptText(st, 1);
  r.status         = ColOptText(st, 2);
  r.created_by     = ColOptText(st, 3);
  r.created_at_ms  = ColU64(st, 4);
  r.cursor         = ColI64(st, 5);
  r.version        = ColI64(st, 6);
  r.parent_flow_id = ColOptText(st, 7);
  r.parent_cursor  = ColOptI64(st, 8);
  r.metadata       = ColDocument(st, 9);
  return r;
}

// column order: sql::SELECT_DATA_RANGE
model::DataRecord RowToData(sqlite3_stmt* st) {
  model::DataRecord r;
  r.id            = ColText(st, 0);
  r.flow_id       = ColText(st, 1);
  r.cursor        = ColI64(st, 2);
  r.key           = ColText(st, 3);
  r.payload       = ColDocument(st, 4);
  r.metadata      = ColDocument(st, 5);
  r.command_id    = ColOptText(st, 6);
  r.version       = ColI64(st, 7);
  r.created_at_ms = ColU64(st, 8);
  return r;
}

// column order: sql::SELECT_SNAPSHOT
model::SnapshotRecord RowToSnapshot(sqlite3_stmt* st) {
  model::SnapshotRecord r;
  r.id            = ColText(st, 0);
  r.flow_id       = ColText(st, 1);
  r.cursor        = ColI64(st, 2);
  r.state_ptr     = ColText(st, 3);
  r.metadata      = ColDocument(st, 4);
  r.created_at_ms = ColU64(st, 5);
  return r;
}

template <typename Row, typename Reader>
std::vector<Row> Collect(sqlite3* db, sqlite3_stmt* st, Reader read) {
  std::vector<Row> out;
  int              rc;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    out.push_back(read(st));
  }
  if (rc != SQLITE_DONE) {
    throw util::StorageError(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
  return out;
}

template <typename Row, typename Reader>
std::optional<Row> First(sqlite3* db, sqlite3_stmt* st, Reader read) {
  int rc = sqlite3_step(st);
  if (rc == SQLITE_ROW) return read(st);
  if (rc != SQLITE_DONE) {
    throw util::StorageError(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
  return std::nullopt;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

std::unique_ptr<db::Transaction> SqliteRepository::BeginRead() {
    return std::make_unique<SqliteTransaction>(db_, SqliteTransaction::Mode::kRead);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// BEGIN IMMEDIATE already holds the database write lock; locking a flow
// only has to confirm it exists.
Result SqliteRepository::LockFlow(Transaction& t, const std::string& flow_id) {
    if (TX(t).ReadOnly()) return Result::Err(ErrorCode::InvalidArgument, "LockFlow in a read-only transaction");
    if (!GetFlow(t, flow_id)) return Result::Err(ErrorCode::NotFound, "flow " + flow_id);
    return Result::Ok();
}

// ------------------------------------------------------------------
// Flows
// ------------------------------------------------------------------

Result SqliteRepository::InsertFlow(Transaction& t, const model::FlowRecord& r) {
    auto* db = TX(t).Handle();
    if (GetFlow(t, r.id)) return Result::Err(ErrorCode::AlreadyExists, "flow " + r.id);

    auto st = Prepare(db, sql::INSERT_FLOW);
    BindText(st.get(), 1, r.id);
    BindOptText(st.get(), 2, r.name);
    BindOptText(st.get(), 3, r.status);
    BindOptText(st.get(), 4, r.created_by);
    BindU64(st.get(), 5, r.created_at_ms);
    BindI64(st.get(), 6, r.cursor);
    BindI64(st.get(), 7, r.version);
    BindOptText(st.get(), 8, r.parent_flow_id);
    BindOptI64(st.get(), 9, r.parent_cursor);
    BindDocument(st.get(), 10, r.metadata);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::FlowRecord>
SqliteRepository::GetFlow(Transaction& t, const std::string& flow_id) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, sql::SELECT_FLOW);
    BindText(st.get(), 1, flow_id);
    return First<model::FlowRecord>(db, st.get(), RowToFlow);
}

Result SqliteRepository::UpdateFlow(Transaction& t, const model::FlowRecord& r) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, sql::UPDATE_FLOW);
    BindOptText(st.get(), 1, r.name);
    BindOptText(st.get(), 2, r.status);
    BindOptText(st.get(), 3, r.created_by);
    BindI64(st.get(), 4, r.cursor);
    BindI64(st.get(), 5, r.version);
    BindOptText(st.get(), 6, r.parent_flow_id);
    BindOptI64(st.get(), 7, r.parent_cursor);
    BindDocument(st.get(), 8, r.metadata);
    BindText(st.get(), 9, r.id);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) {
        return Result::Err(ErrorCode::NotFound, "flow " + r.id);
    }
    return Translate(db, rc);
}

Result SqliteRepository::DeleteFlow(Transaction& t, const std::string& flow_id) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, sql::DELETE_FLOW);
    BindText(st.get(), 1, flow_id);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) {
        return Result::Err(ErrorCode::NotFound, "flow " + flow_id);
    }
    return Translate(db, rc);
}

std::vector<model::FlowRecord>
SqliteRepository::ListChildren(Transaction& t, const std::string& parent_flow_id) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, sql::SELECT_CHILDREN);
    BindText(st.get(), 1, parent_flow_id);
    return Collect<model::FlowRecord>(db, st.get(), RowToFlow);
}

// ------------------------------------------------------------------
// Flow data
// ------------------------------------------------------------------

Result SqliteRepository::InsertData(Transaction& t, const model::DataRecord& r) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, sql::INSERT_DATA);
    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.flow_id);
    BindI64(st.get(), 3, r.cursor);
    BindText(st.get(), 4, r.key);
    BindDocument(st.get(), 5, r.payload);
    BindDocument(st.get(), 6, r.metadata);
    BindOptText(st.get(), 7, r.command_id);
    BindI64(st.get(), 8, r.version);
    BindU64(st.get(), 9, r.created_at_ms);

    return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::DataRecord>
SqliteRepository::ReadData(Transaction& t, const std::string& flow_id, int64_t after_cursor,
                           std::optional<int64_t> until_cursor, std::optional<uint64_t> limit) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, sql::SELECT_DATA_RANGE);
    BindText(st.get(), 1, flow_id);
    BindI64(st.get(), 2, after_cursor);
    BindI64(st.get(), 3, until_cursor.value_or(std::numeric_limits<int64_t>::max()));
    // negative LIMIT means unbounded in sqlite
    BindI64(st.get(), 4, limit ? static_cast<int64_t>(*limit) : -1);
    return Collect<model::DataRecord>(db, st.get(), RowToData);
}

std::optional<model::DataRecord>
SqliteRepository::FindDataByCommand(Transaction& t, const std::string& flow_id, const std::string& command_id) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, sql::SELECT_DATA_BY_COMMAND);
    BindText(st.get(), 1, flow_id);
    BindText(st.get(), 2, command_id);
    return First<model::DataRecord>(db, st.get(), RowToData);
}

int64_t SqliteRepository::CountData(Transaction& t, const std::string& flow_id) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, sql::COUNT_DATA);
    BindText(st.get(), 1, flow_id);
    auto count = First<int64_t>(db, st.get(), [](sqlite3_stmt* s) { return ColI64(s, 0); });
    return count.value_or(0);
}

Result SqliteRepository::DeleteDataFrom(Transaction& t, const std::string& flow_id, int64_t from_cursor) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, sql::DELETE_DATA_FROM);
    BindText(st.get(), 1, flow_id);
    BindI64(st.get(), 2, from_cursor);
    return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Snapshots
// ------------------------------------------------------------------

Result SqliteRepository::InsertSnapshot(Transaction& t, const model::SnapshotRecord& r) {
    auto* db = TX(t).Handle();
    if (GetSnapshot(t, r.id)) return Result::Err(ErrorCode::AlreadyExists, "snapshot " + r.id);

    auto st = Prepare(db, sql::INSERT_SNAPSHOT);
    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.flow_id);
    BindI64(st.get(), 3, r.cursor);
    BindText(st.get(), 4, r.state_ptr);
    BindDocument(st.get(), 5, r.metadata);
    BindU64(st.get(), 6, r.created_at_ms);

    int rc = sqlite3_step(st.get());
    // the flow_id foreign key is the only constraint left at this point
    if ((rc & 0xff) == SQLITE_CONSTRAINT) {
        return Result::Err(ErrorCode::NotFound, "flow " + r.flow_id);
    }
    return Translate(db, rc);
}

std::optional<model::SnapshotRecord>
SqliteRepository::GetSnapshot(Transaction& t, const std::string& snapshot_id) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, sql::SELECT_SNAPSHOT);
    BindText(st.get(), 1, snapshot_id);
    return First<model::SnapshotRecord>(db, st.get(), RowToSnapshot);
}

std::optional<model::SnapshotRecord>
SqliteRepository::LatestSnapshot(Transaction& t, const std::string& flow_id, int64_t max_cursor) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, sql::SELECT_LATEST_SNAPSHOT);
    BindText(st.get(), 1, flow_id);
    BindI64(st.get(), 2, max_cursor);
    return First<model::SnapshotRecord>(db, st.get(), RowToSnapshot);
}

std::vector<model::SnapshotRecord>
SqliteRepository::ListSnapshots(Transaction& t, const std::string& flow_id, int64_t max_cursor) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, sql::SELECT_SNAPSHOTS);
    BindText(st.get(), 1, flow_id);
    BindI64(st.get(), 2, max_cursor);
    return Collect<model::SnapshotRecord>(db, st.get(), RowToSnapshot);
}

Result SqliteRepository::DeleteSnapshot(Transaction& t, const std::string& snapshot_id) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, sql::DELETE_SNAPSHOT);
    BindText(st.get(), 1, snapshot_id);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) {
        return Result::Err(ErrorCode::NotFound, "snapshot " + snapshot_id);
    }
    return Translate(db, rc);
}

Result SqliteRepository::DeleteSnapshotsFrom(Transaction& t, const std::string& flow_id, int64_t from_cursor) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, sql::DELETE_SNAPSHOTS_FROM);
    BindText(st.get(), 1, flow_id);
    BindI64(st.get(), 2, from_cursor);
    return Translate(db, sqlite3_step(st.get()));
}

} // namespace flowlog::db::sqlite
