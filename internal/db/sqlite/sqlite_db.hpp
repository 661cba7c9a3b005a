#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace flowlog::db::sqlite {

/*
  Thin RAII wrapper around the sqlite3* connections of one database file.

  The writer connection carries at most one transaction at a time;
  SqliteTransaction holds TxMutex() for its whole lifetime, so in-process
  writers queue here and other processes are kept out by BEGIN IMMEDIATE +
  busy_timeout.

  Read-only transactions run on pooled reader connections instead. WAL
  gives each of them a consistent view of the last commit without waiting
  for the writer.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, int busy_timeout_ms = 5000);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations/transaction control)
  void Exec(const std::string& sql);
  static void ExecOn(sqlite3* handle, const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure(int busy_timeout_ms);

  // False for private databases (":memory:", ""), which a second
  // connection cannot see.
  bool SupportsReaders() const;

  // Idle reader connection, opened on demand.
  sqlite3* CheckoutReader();

  // Back to the pool; a connection still inside a transaction is closed.
  void ReturnReader(sqlite3* reader);

 private:
  sqlite3* OpenReader();

  sqlite3*    db_ = nullptr;
  std::string path_;
  int         busy_timeout_ms_;
  std::mutex  tx_mutex_;

  std::mutex             readers_mutex_;
  std::vector<sqlite3*>  idle_readers_;
};

} // namespace flowlog::db::sqlite
