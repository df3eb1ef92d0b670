#pragma once

#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace jobq::db::memory {

/*
  Transaction = snapshot + write set

  Write transactions hold the repository's writer lock until they end, so
  writers are serialized like SQLite BEGIN IMMEDIATE. Commit still checks the
  snapshot version and fails with TransactionConflict if it went stale.
  Read-only transactions never conflict.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  MemoryTransaction(MemoryRepository& repo, bool read_only);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable();
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&            repo_;
  std::unique_lock<std::mutex> writer_lock_;
  MemoryRepository::State      working_;
  uint64_t                     snapshot_version_ = 0;
  bool                         read_only_        = false;
  bool                         committed_        = false;
  bool                         rolled_back_      = false;
};

} // namespace jobq::db::memory
