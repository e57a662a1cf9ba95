#include "pg_migrations.hpp"

#include <pqxx/pqxx>

namespace gemfeed::db::postgres {

PgMigrationExecutor::PgMigrationExecutor(std::string conninfo) : conninfo_(std::move(conninfo)) {
}

void PgMigrationExecutor::EnsureMigrationTable() {
  pqxx::connection conn(conninfo_);
  pqxx::work       tx(conn);
  tx.exec(
      "CREATE TABLE IF NOT EXISTS schema_migrations ("
      "version BIGINT PRIMARY KEY, name TEXT NOT NULL, applied_at_ms BIGINT NOT NULL)");
  tx.commit();
}

std::vector<model::MigrationRecord> PgMigrationExecutor::AppliedMigrations() {
  pqxx::connection conn(conninfo_);
  pqxx::work       tx(conn);
  auto             res = tx.exec("SELECT version,name,applied_at_ms FROM schema_migrations ORDER BY version ASC");

  std::vector<model::MigrationRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::MigrationRecord r;
    r.version       = row[0].as<int64_t>();
    r.name          = row[1].c_str();
    r.applied_at_ms = row[2].as<uint64_t>();
    out.push_back(std::move(r));
  }
  tx.commit();
  return out;
}

void PgMigrationExecutor::Apply(const sql::Migration& migration, uint64_t applied_at_ms) {
  pqxx::connection conn(conninfo_);
  pqxx::work       tx(conn);

  for (const auto& statement : migration.statements) {
    tx.exec(statement);
  }
  tx.exec_params("INSERT INTO schema_migrations(version,name,applied_at_ms) VALUES($1,$2,$3)", migration.version,
                 migration.name, static_cast<int64_t>(applied_at_ms));

  tx.commit();
}

std::size_t MigrateToLatest(const std::string& conninfo) {
  PgMigrationExecutor executor(conninfo);
  return sql::RunMigrations(executor, sql::Migrations(sql::Dialect::kPostgres));
}

} // namespace gemfeed::db::postgres
