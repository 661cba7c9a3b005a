#pragma once

namespace flowlog::db::sql {

/*
  Canonical SQL used by the sqlite backend.

  IMPORTANT:
  Column order of every SELECT matches the row readers in the
  repositories. The postgres backend prepares the same statements with
  $n placeholders and jsonb casts (see PgPool::PrepareStatements).
*/

// flows

static constexpr const char* INSERT_FLOW =
    "INSERT INTO flows(id,name,status,created_by,created_at_ms,cursor,version,parent_flow_id,parent_cursor,metadata)"
    " VALUES(?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_FLOW =
    "SELECT id,name,status,created_by,created_at_ms,cursor,version,parent_flow_id,parent_cursor,metadata"
    " FROM flows WHERE id=?;";

static constexpr const char* UPDATE_FLOW =
    "UPDATE flows SET name=?,status=?,created_by=?,cursor=?,version=?,parent_flow_id=?,parent_cursor=?,metadata=?"
    " WHERE id=?;";

static constexpr const char* DELETE_FLOW =
    "DELETE FROM flows WHERE id=?;";

static constexpr const char* SELECT_CHILDREN =
    "SELECT id,name,status,created_by,created_at_ms,cursor,version,parent_flow_id,parent_cursor,metadata"
    " FROM flows WHERE parent_flow_id=? ORDER BY created_at_ms ASC, id ASC;";

// flow data

static constexpr const char* INSERT_DATA =
    "INSERT INTO flow_data(id,flow_id,cursor,record_key,payload,metadata,command_id,version,created_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_DATA_RANGE =
    "SELECT id,flow_id,cursor,record_key,payload,metadata,command_id,version,created_at_ms"
    " FROM flow_data WHERE flow_id=? AND cursor>? AND cursor<=?"
    " ORDER BY cursor ASC LIMIT ?;";

static constexpr const char* SELECT_DATA_BY_COMMAND =
    "SELECT id,flow_id,cursor,record_key,payload,metadata,command_id,version,created_at_ms"
    " FROM flow_data WHERE flow_id=? AND command_id=?;";

static constexpr const char* COUNT_DATA =
    "SELECT COUNT(*) FROM flow_data WHERE flow_id=?;";

static constexpr const char* DELETE_DATA_FROM =
    "DELETE FROM flow_data WHERE flow_id=? AND cursor>=?;";

// snapshots

static constexpr const char* INSERT_SNAPSHOT =
    "INSERT INTO snapshots(id,flow_id,cursor,state_ptr,metadata,created_at_ms)"
    " VALUES(?,?,?,?,?,?);";

static constexpr const char* SELECT_SNAPSHOT =
    "SELECT id,flow_id,cursor,state_ptr,metadata,created_at_ms"
    " FROM snapshots WHERE id=?;";

static constexpr const char* SELECT_LATEST_SNAPSHOT =
    "SELECT id,flow_id,cursor,state_ptr,metadata,created_at_ms"
    " FROM snapshots WHERE flow_id=? AND cursor<=?"
    " ORDER BY cursor DESC, created_at_ms DESC, id DESC LIMIT 1;";

static constexpr const char* SELECT_SNAPSHOTS =
    "SELECT id,flow_id,cursor,state_ptr,metadata,created_at_ms"
    " FROM snapshots WHERE flow_id=? AND cursor<=?"
    " ORDER BY cursor ASC, created_at_ms ASC;";

static constexpr const char* DELETE_SNAPSHOT =
    "DELETE FROM snapshots WHERE id=?;";

static constexpr const char* DELETE_SNAPSHOTS_FROM =
    "DELETE FROM snapshots WHERE flow_id=? AND cursor>=?;";

} // namespace flowlog::db::sql
