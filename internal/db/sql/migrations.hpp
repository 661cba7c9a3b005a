#pragma once

#include <string>
#include <vector>

namespace flowlog::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL().
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

/*
  Runs migrations in order.
  Every statement is idempotent, so re-running on an existing
  database is a no-op.
*/

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

// Ordered schema statements per dialect.
const std::vector<std::string>& SqliteMigrations();
const std::vector<std::string>& PostgresMigrations();

} // namespace flowlog::db::sql
