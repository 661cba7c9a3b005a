#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace flowlog::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool, bool read_only)
    : read_only_(read_only)
{
  conn_ = pool->Acquire();
  tx_ = std::make_unique<pqxx::work>(*conn_);
  // MVCC readers never wait on row locks; this only forbids writes
  if (read_only_) tx_->exec("SET TRANSACTION READ ONLY");
}

PgTransaction::~PgTransaction() {
  if (finished_) return;
  try {
    tx_->abort();
  } catch (const std::exception& e) {
    FLOWLOG_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
  }
}

void PgTransaction::Commit() {
  tx_->commit();
  committed_ = true;
  finished_  = true;
}

void PgTransaction::Rollback() {
  if (finished_) return;
  tx_->abort();
  finished_ = true;
}

}
