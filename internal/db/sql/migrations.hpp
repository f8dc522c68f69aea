#pragma once

#include <string>
#include <vector>

namespace repricer::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL(). Statements are idempotent
  (CREATE ... IF NOT EXISTS) and run on every startup.
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

const std::vector<std::string>& SqliteSchema();
const std::vector<std::string>& PostgresSchema();

} // namespace repricer::db::sql
