#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <string>

namespace gemfeed::db::sqlite {

struct SqliteOptions {
  bool     wal_mode        = true;
  uint32_t busy_timeout_ms = 5000;
};

/*
  Thin RAII wrapper around one sqlite3* connection.

  A connection runs one transaction at a time; concurrent writers
  each open their own SqliteDB on the same file.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, SqliteOptions options = {});
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

 private:
  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

  sqlite3*      db_ = nullptr;
  std::string   path_;
  SqliteOptions options_;
};

} // namespace gemfeed::db::sqlite
