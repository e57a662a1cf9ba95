#include "factory.hpp"

#include <stdexcept>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_migrations.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#if GEMFEED_DB_POSTGRES
#include "internal/db/postgres/pg_migrations.hpp"
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace gemfeed::factory {

Application::Application(std::shared_ptr<db::Repository> repo)
    : repository(std::move(repo)),
      feeds(*repository),
      entries(*repository),
      users(*repository),
      subscriptions(*repository),
      views(*repository) {
}

std::shared_ptr<db::Repository> BuildRepository(const gemfeed::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();

  if (database.has_sqlite()) {
    const auto& sqlite = database.sqlite();
    if (sqlite.path().empty()) {
      throw std::runtime_error("database.sqlite.path must be set");
    }

    db::sqlite::SqliteOptions options;
    options.wal_mode = sqlite.wal_mode();
    if (sqlite.busy_timeout_ms() != 0) {
      options.busy_timeout_ms = sqlite.busy_timeout_ms();
    }

    auto       sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), options);
    const auto applied   = db::sqlite::MigrateToLatest(sqlite_db);
    GEMFEED_LOG_INFO("Opened sqlite database", {observability::StringField("path", sqlite.path()),
                                                observability::BoolField("wal", options.wal_mode),
                                                observability::IntField("migrations_applied", static_cast<int64_t>(applied))});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  if (database.has_postgres()) {
#if GEMFEED_DB_POSTGRES
    const auto& postgres        = database.postgres();
    const auto  max_connections = postgres.max_connections() == 0 ? 16u : postgres.max_connections();

    const auto applied = db::postgres::MigrateToLatest(postgres.connection_uri());
    GEMFEED_LOG_INFO("Opened postgres database", {observability::IntField("max_connections", max_connections),
                                                  observability::IntField("migrations_applied", static_cast<int64_t>(applied))});
    auto pool = std::make_shared<db::postgres::PgPool>(postgres.connection_uri(), max_connections);
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  if (database.has_memory()) {
    GEMFEED_LOG_INFO("Using in-memory database");
    return std::make_shared<db::memory::MemoryRepository>();
  }

  throw util::InvalidArgument(
      "no database configured: pass --config or set GEMFEED_DATABASE_URL (memory:// for a throwaway store)");
}

std::unique_ptr<Application> Build(const gemfeed::runtime::config::RuntimeConfig& config) {
  return std::make_unique<Application>(BuildRepository(config));
}

} // namespace gemfeed::factory
