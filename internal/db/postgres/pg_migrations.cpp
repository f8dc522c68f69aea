#include "pg_migrations.hpp"

namespace repricer::db::postgres {

PgMigrationExecutor::PgMigrationExecutor(const std::string& conninfo) : conn_(conninfo) {
}

void PgMigrationExecutor::ExecuteSQL(const std::string& sql) {
  pqxx::work tx(conn_);
  tx.exec(sql);
  tx.commit();
}

void BootstrapSchema(const std::string& conninfo) {
  PgMigrationExecutor executor(conninfo);
  sql::RunMigrations(executor, sql::PostgresSchema());
}

} // namespace repricer::db::postgres
