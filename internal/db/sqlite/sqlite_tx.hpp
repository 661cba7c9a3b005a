#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace flowlog::db::sqlite {

/*
  SQLite transaction wrapper.

  Write mode uses BEGIN IMMEDIATE on the writer connection:
    - grabs the database write lock up front, so LockFlow needs no extra
      statement
    - avoids SQLITE_BUSY upgrades halfway through an append

  Read mode uses a deferred BEGIN on a pooled reader connection and never
  touches TxMutex(). Private databases fall back to the writer connection.
*/
class SqliteTransaction final : public db::Transaction {
public:
  enum class Mode { kWrite, kRead };

  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db, Mode mode = Mode::kWrite);
  ~SqliteTransaction();

  sqlite3* Handle() const { return handle_; }
  bool ReadOnly() const { return mode_ == Mode::kRead; }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  void Finish();

  std::shared_ptr<SqliteDB>    db_;
  Mode                         mode_;
  sqlite3*                     handle_ = nullptr;
  sqlite3*                     reader_ = nullptr; // checked out from db_
  std::unique_lock<std::mutex> connection_lock_;
  bool                         committed_ = false;
  bool                         finished_  = false;
};

}
