#include "sqlite_migrations.hpp"

#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"
#include "sqlite_tx.hpp"

namespace gemfeed::db::sqlite {

SqliteMigrationExecutor::SqliteMigrationExecutor(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

void SqliteMigrationExecutor::EnsureMigrationTable() {
  db_->Exec(sql::CREATE_SCHEMA_MIGRATIONS);
}

std::vector<model::MigrationRecord> SqliteMigrationExecutor::AppliedMigrations() {
  sqlite3_stmt* st = db_->Prepare(sql::SELECT_SCHEMA_MIGRATIONS);

  std::vector<model::MigrationRecord> out;
  int                                 rc = SQLITE_OK;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    model::MigrationRecord r;
    r.version              = sqlite3_column_int64(st, 0);
    const unsigned char* n = sqlite3_column_text(st, 1);
    r.name                 = n ? reinterpret_cast<const char*>(n) : "";
    r.applied_at_ms        = static_cast<uint64_t>(sqlite3_column_int64(st, 2));
    out.push_back(std::move(r));
  }
  sqlite3_finalize(st);

  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("read schema_migrations: ") + sqlite3_errmsg(db_->Handle()));
  }
  return out;
}

void SqliteMigrationExecutor::Apply(const sql::Migration& migration, uint64_t applied_at_ms) {
  SqliteTransaction tx(db_);

  for (const auto& statement : migration.statements) {
    db_->Exec(statement);
  }

  sqlite3_stmt* st = db_->Prepare(sql::INSERT_SCHEMA_MIGRATION);
  sqlite3_bind_int64(st, 1, migration.version);
  sqlite3_bind_text(st, 2, migration.name.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(st, 3, static_cast<sqlite3_int64>(applied_at_ms));
  const int rc = sqlite3_step(st);
  sqlite3_finalize(st);
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("record migration: ") + sqlite3_errmsg(db_->Handle()));
  }

  tx.Commit();
}

std::size_t MigrateToLatest(const std::shared_ptr<SqliteDB>& db) {
  SqliteMigrationExecutor executor(db);
  return sql::RunMigrations(executor, sql::Migrations(sql::Dialect::kSqlite));
}

} // namespace gemfeed::db::sqlite
