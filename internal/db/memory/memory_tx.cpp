#include "memory_tx.hpp"

#include <stdexcept>

namespace jobq::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo, bool read_only) : repo_(repo), read_only_(read_only) {
  if (!read_only_) {
    writer_lock_ = std::unique_lock<std::mutex>(repo_.writer_mutex_);
  }
  std::scoped_lock lock(repo_.mutex_);
  working_          = repo_.committed_; // snapshot copy
  snapshot_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  if (read_only_) {
    throw std::logic_error("write attempted in a read-only memory transaction");
  }
  return working_;
}

void MemoryTransaction::Commit() {
  if (read_only_) {
    committed_ = true;
    return;
  }

  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != snapshot_version_) {
    throw TransactionConflict("transaction conflict: state was modified by a concurrent transaction");
  }
  repo_.committed_ = std::move(working_);
  repo_.committed_version_++;
  committed_ = true;
  if (writer_lock_.owns_lock()) writer_lock_.unlock();
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
  if (writer_lock_.owns_lock()) writer_lock_.unlock();
}

} // namespace jobq::db::memory
