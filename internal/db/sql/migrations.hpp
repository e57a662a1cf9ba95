#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "internal/db/model/migration_record.hpp"

namespace gemfeed::db::sql {

/*
  Versioned schema migrations.

  Versions are the creation timestamps (YYYYMMDDhhmmss) and are applied
  in ascending order. A migration never changes once shipped; schema
  fixes are new migrations.
*/

enum class Dialect {
  kSqlite,
  kPostgres,
};

struct Migration {
  int64_t                  version = 0;
  std::string              name;
  std::vector<std::string> statements;
};

// Ordered, complete history for one dialect.
const std::vector<Migration>& Migrations(Dialect dialect);

/*
  Backend-agnostic migration execution.

  Each backend implements the three primitives; Apply() must run the
  statements and record the version in one transaction.
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void EnsureMigrationTable() = 0;
  virtual std::vector<model::MigrationRecord> AppliedMigrations() = 0;
  virtual void Apply(const Migration& migration, uint64_t applied_at_ms) = 0;
};

/*
  Applies every migration whose version is not yet recorded.
  Returns the number applied. Throws on the first failing migration;
  earlier migrations stay committed.
*/

std::size_t RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered);

} // namespace gemfeed::db::sql
