#pragma once

namespace gemfeed::db {

/*
  Abstract transaction.

  Every backend guarantees:

  - Writes are invisible to other transactions until Commit()
  - Cascading deletes run inside the transaction that issued the delete
  - Rollback() discards all writes, cascades included
  - Destructor rolls back if neither Commit() nor Rollback() ran

  SQLite:   BEGIN IMMEDIATE on the repository connection
  Postgres: pqxx::work on a pooled connection
  Memory:   snapshot copy, swapped in on commit
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;
  virtual void Rollback() = 0;

  // true once Commit() or Rollback() finished
  virtual bool IsCommitted() const = 0;
};

} // namespace gemfeed::db
