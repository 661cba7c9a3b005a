#include "pg_pool.hpp"

namespace flowlog::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn.release());
        } catch (...) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  // flows

  conn.prepare("lock_flow", "SELECT id FROM flows WHERE id=$1 FOR UPDATE");

  conn.prepare("insert_flow",
               "INSERT INTO flows(id,name,status,created_by,created_at_ms,cursor,version,parent_flow_id,parent_cursor,metadata) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10::jsonb)");

  conn.prepare("get_flow",
               "SELECT id,name,status,created_by,created_at_ms,cursor,version,parent_flow_id,parent_cursor,metadata::text "
               "FROM flows WHERE id=$1");

  conn.prepare("update_flow",
               "UPDATE flows SET name=$2,status=$3,created_by=$4,cursor=$5,version=$6,parent_flow_id=$7,parent_cursor=$8,"
               "metadata=$9::jsonb WHERE id=$1");

  conn.prepare("delete_flow", "DELETE FROM flows WHERE id=$1");

  conn.prepare("list_children",
               "SELECT id,name,status,created_by,created_at_ms,cursor,version,parent_flow_id,parent_cursor,metadata::text "
               "FROM flows WHERE parent_flow_id=$1 ORDER BY created_at_ms ASC, id ASC");

  // flow data

  conn.prepare("insert_data",
               "INSERT INTO flow_data(id,flow_id,cursor,record_key,payload,metadata,command_id,version,created_at_ms) "
               "VALUES($1,$2,$3,$4,$5::jsonb,$6::jsonb,$7,$8,$9)");

  conn.prepare("read_data",
               "SELECT id,flow_id,cursor,record_key,payload::text,metadata::text,command_id,version,created_at_ms "
               "FROM flow_data WHERE flow_id=$1 AND cursor>$2 AND cursor<=$3 ORDER BY cursor ASC LIMIT $4");

  conn.prepare("find_data_by_command",
               "SELECT id,flow_id,cursor,record_key,payload::text,metadata::text,command_id,version,created_at_ms "
               "FROM flow_data WHERE flow_id=$1 AND command_id=$2");

  conn.prepare("count_data", "SELECT COUNT(*) FROM flow_data WHERE flow_id=$1");

  conn.prepare("delete_data_from", "DELETE FROM flow_data WHERE flow_id=$1 AND cursor>=$2");

  // snapshots

  conn.prepare("insert_snapshot",
               "INSERT INTO snapshots(id,flow_id,cursor,state_ptr,metadata,created_at_ms) "
               "VALUES($1,$2,$3,$4,$5::jsonb,$6)");

  conn.prepare("get_snapshot",
               "SELECT id,flow_id,cursor,state_ptr,metadata::text,created_at_ms FROM snapshots WHERE id=$1");

  conn.prepare("latest_snapshot",
               "SELECT id,flow_id,cursor,state_ptr,metadata::text,created_at_ms FROM snapshots "
               "WHERE flow_id=$1 AND cursor<=$2 ORDER BY cursor DESC, created_at_ms DESC, id DESC LIMIT 1");

  conn.prepare("list_snapshots",
               "SELECT id,flow_id,cursor,state_ptr,metadata::text,created_at_ms FROM snapshots "
               "WHERE flow_id=$1 AND cursor<=$2 ORDER BY cursor ASC, created_at_ms ASC");

  conn.prepare("delete_snapshot", "DELETE FROM snapshots WHERE id=$1");

  conn.prepare("delete_snapshots_from", "DELETE FROM snapshots WHERE flow_id=$1 AND cursor>=$2");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace flowlog::db::postgres
