#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace flowlog::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, Mode mode)
    : db_(std::move(db)), mode_(mode) {
  if (mode_ == Mode::kRead && db_->SupportsReaders()) {
    reader_ = db_->CheckoutReader();
    handle_ = reader_;
    try {
      SqliteDB::ExecOn(handle_, "BEGIN;");
    } catch (const util::StorageError&) {
      db_->ReturnReader(reader_);
      throw;
    }
    return;
  }

  connection_lock_ = std::unique_lock<std::mutex>(db_->TxMutex());
  handle_          = db_->Handle();
  db_->Exec(mode_ == Mode::kRead ? "BEGIN;" : "BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) return;
  try {
    SqliteDB::ExecOn(handle_, "ROLLBACK;");
  } catch (const util::StorageError& e) {
    FLOWLOG_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
  }
  Finish();
}

void SqliteTransaction::Finish() {
  finished_ = true;
  if (reader_) {
    db_->ReturnReader(reader_);
    reader_ = nullptr;
  }
  if (connection_lock_.owns_lock()) connection_lock_.unlock();
}

void SqliteTransaction::Commit() {
  SqliteDB::ExecOn(handle_, "COMMIT;");
  committed_ = true;
  Finish();
}

void SqliteTransaction::Rollback() {
  if (finished_) return;
  SqliteDB::ExecOn(handle_, "ROLLBACK;");
  Finish();
}

} // namespace flowlog::db::sqlite
