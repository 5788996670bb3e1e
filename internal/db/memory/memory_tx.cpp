#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace fleet::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_      = repo_.committed_;
  base_version_ = repo_.committed_version_;
}

void MemoryTransaction::Commit() {
  if (phase_ != Phase::Open) {
    throw util::InvalidState("memory transaction already finished");
  }
  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != base_version_) {
    phase_ = Phase::RolledBack;
    throw util::InvalidState("memory transaction conflict: another transaction committed first");
  }
  repo_.committed_ = std::move(working_);
  ++repo_.committed_version_;
  phase_ = Phase::Committed;
}

void MemoryTransaction::Rollback() {
  if (phase_ == Phase::Open) phase_ = Phase::RolledBack;
}

} // namespace fleet::db::memory
