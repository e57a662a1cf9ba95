#pragma once

#include <memory>

#include "internal/db/sql/migrations.hpp"
#include "sqlite_db.hpp"

namespace gemfeed::db::sqlite {

class SqliteMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(std::shared_ptr<SqliteDB> db);

  void EnsureMigrationTable() override;
  std::vector<model::MigrationRecord> AppliedMigrations() override;
  void Apply(const sql::Migration& migration, uint64_t applied_at_ms) override;

 private:
  std::shared_ptr<SqliteDB> db_;
};

// Brings the database behind db up to the latest schema. Returns the number of migrations applied.
std::size_t MigrateToLatest(const std::shared_ptr<SqliteDB>& db);

} // namespace gemfeed::db::sqlite
