#include "sqlite_db.hpp"

#include "internal/util/errors.hpp"

namespace flowlog::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw util::StorageError(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path, int busy_timeout_ms)
    : path_(std::move(path)), busy_timeout_ms_(busy_timeout_ms > 0 ? busy_timeout_ms : 5000) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::StorageError("sqlite open " + path_ + ": " + msg);
  }

  try {
    Configure(busy_timeout_ms_);
  } catch (const util::StorageError&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  for (auto* reader : idle_readers_) sqlite3_close(reader);
  if (db_) sqlite3_close(db_);
}

void SqliteDB::ExecOn(sqlite3* handle, const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(handle, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw util::StorageError(msg);
  }
}

void SqliteDB::Exec(const std::string& sql) {
  ExecOn(db_, sql);
}

void SqliteDB::Configure(int busy_timeout_ms) {
  // WAL lets readers proceed while a writer holds the lock
  Exec("PRAGMA journal_mode=WAL;");

  Exec("PRAGMA synchronous=NORMAL;");

  // foreign keys are OFF by default in sqlite
  Exec("PRAGMA foreign_keys=ON;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, busy_timeout_ms), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
  Exec("PRAGMA cache_size=-20000;"); // ~20MB (negative means KB)
}

bool SqliteDB::SupportsReaders() const {
  return !path_.empty() && path_ != ":memory:" && path_.rfind("file::memory:", 0) != 0;
}

sqlite3* SqliteDB::OpenReader() {
  sqlite3* reader = nullptr;
  int      rc     = sqlite3_open_v2(path_.c_str(), &reader, SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = reader ? sqlite3_errmsg(reader) : "sqlite open failed";
    if (reader) sqlite3_close(reader);
    throw util::StorageError("sqlite open reader " + path_ + ": " + msg);
  }

  try {
    ThrowIf(sqlite3_busy_timeout(reader, busy_timeout_ms_), reader, "busy_timeout");
    ExecOn(reader, "PRAGMA query_only=ON;");
    ExecOn(reader, "PRAGMA temp_store=MEMORY;");
  } catch (const util::StorageError&) {
    sqlite3_close(reader);
    throw;
  }
  return reader;
}

sqlite3* SqliteDB::CheckoutReader() {
  {
    std::scoped_lock lock(readers_mutex_);
    if (!idle_readers_.empty()) {
      auto* reader = idle_readers_.back();
      idle_readers_.pop_back();
      return reader;
    }
  }
  return OpenReader();
}

void SqliteDB::ReturnReader(sqlite3* reader) {
  if (!reader) return;
  if (!sqlite3_get_autocommit(reader)) {
    sqlite3_close(reader);
    return;
  }
  std::scoped_lock lock(readers_mutex_);
  idle_readers_.push_back(reader);
}

} // namespace flowlog::db::sqlite
