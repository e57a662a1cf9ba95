#pragma once

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace gemfeed::db::memory {

/*
  Transaction = snapshot + write set

  Commit of a transaction that wrote fails if another transaction
  committed after the snapshot was taken (first committer wins).
  Read-only transactions always commit.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_ || rolled_back_;
  }

  MemoryRepository::State& Mutable() {
    dirty_ = true;
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  uint64_t                snapshot_version_ = 0;
  bool                    committed_        = false;
  bool                    rolled_back_      = false;
  bool                    dirty_            = false;
};

} // namespace gemfeed::db::memory
