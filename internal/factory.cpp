#include "factory.hpp"

#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/storage_factory.hpp"
#include "internal/util/errors.hpp"
#if FLOWLOG_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if FLOWLOG_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace flowlog::factory {

using observability::IntField;
using observability::StringField;

namespace {

#if FLOWLOG_DB_SQLITE
class SqliteMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(db::sqlite::SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

 private:
  db::sqlite::SqliteDB& db_;
};

void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  SqliteMigrationExecutor executor(*sqlite_db);
  db::sql::RunMigrations(executor, db::sql::SqliteMigrations());
}
#endif

#if FLOWLOG_DB_POSTGRES
class PostgresMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit PostgresMigrationExecutor(pqxx::work& tx) : tx_(tx) {
  }

  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

 private:
  pqxx::work& tx_;
};

void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);

  PostgresMigrationExecutor executor(tx);
  db::sql::RunMigrations(executor, db::sql::PostgresMigrations());
  tx.commit();
}
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const flowlog::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if FLOWLOG_DB_SQLITE
    const auto& sqlite = database.sqlite();
    const auto  path   = sqlite.path().empty() ? std::string("flowlog.db") : sqlite.path();
    auto sqlite_db     = std::make_shared<db::sqlite::SqliteDB>(path, static_cast<int>(sqlite.busy_timeout_ms()));
    BootstrapSqliteSchema(sqlite_db);
    FLOWLOG_LOG_INFO("database ready", {StringField("backend", "sqlite"), StringField("path", path)});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw util::NotImplemented("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if FLOWLOG_DB_POSTGRES
    const auto& postgres = database.postgres();
    auto pool = std::make_shared<db::postgres::PgPool>(postgres.connection_uri(), postgres.max_connections() == 0 ? 16 : postgres.max_connections());
    try {
      BootstrapPostgresSchema(pool);
    } catch (const pqxx::failure& e) {
      throw util::StorageError(std::string("postgres bootstrap: ") + e.what());
    }
    FLOWLOG_LOG_INFO("database ready", {StringField("backend", "postgres"), IntField("max_connections", postgres.max_connections())});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw util::NotImplemented("postgres backend requested but not enabled at build time");
#endif
  }

  FLOWLOG_LOG_INFO("database ready", {StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryRepository>();
}

core::ChildPolicy ToChildPolicy(flowlog::runtime::config::ChildPolicy policy) {
  return policy == flowlog::runtime::config::CHILD_POLICY_CASCADE ? core::ChildPolicy::kCascade : core::ChildPolicy::kOrphan;
}

/*
    Build full application dependency graph
*/
Runtime BuildRuntime(const flowlog::runtime::config::RuntimeConfig& config) {
  Runtime runtime;

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  runtime.repository = BuildRepository(config);
  runtime.artifacts  = storage::StorageFactory::Build(config.artifacts());

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  runtime.flows =
      std::make_shared<core::FlowStore>(runtime.repository, ToChildPolicy(config.branching().child_policy()), runtime.artifacts);

  core::EngineOptions options;
  if (config.artifacts().inline_limit_bytes() > 0) options.inline_limit_bytes = config.artifacts().inline_limit_bytes();
  options.snapshot_interval = config.snapshots().interval();

  runtime.engine = std::make_shared<core::RehydrationEngine>(runtime.flows, runtime.artifacts, options);

  FLOWLOG_LOG_INFO("runtime built", {StringField("artifacts", runtime.artifacts->Kind()),
                                     IntField("snapshot_interval", static_cast<int64_t>(options.snapshot_interval)),
                                     IntField("inline_limit_bytes", static_cast<int64_t>(options.inline_limit_bytes))});
  return runtime;
}

} // namespace flowlog::factory
