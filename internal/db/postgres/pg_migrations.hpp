#pragma once

#include <memory>
#include <string>

#include "internal/db/sql/migrations.hpp"

namespace gemfeed::db::postgres {

// Runs each migration in its own pqxx::work on a dedicated connection.
class PgMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit PgMigrationExecutor(std::string conninfo);

  void EnsureMigrationTable() override;
  std::vector<model::MigrationRecord> AppliedMigrations() override;
  void Apply(const sql::Migration& migration, uint64_t applied_at_ms) override;

 private:
  std::string conninfo_;
};

std::size_t MigrateToLatest(const std::string& conninfo);

} // namespace gemfeed::db::postgres
