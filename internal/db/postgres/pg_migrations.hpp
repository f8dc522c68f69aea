#pragma once

#include <pqxx/pqxx>

#include <string>

#include "internal/db/sql/migrations.hpp"

namespace repricer::db::postgres {

/*
  Runs schema statements on a dedicated connection.

  Pool connections prepare statements against the schema on open, so
  the schema must exist before the first Acquire().
*/
class PgMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit PgMigrationExecutor(const std::string& conninfo);

  void ExecuteSQL(const std::string& sql) override;

 private:
  pqxx::connection conn_;
};

void BootstrapSchema(const std::string& conninfo);

} // namespace repricer::db::postgres
