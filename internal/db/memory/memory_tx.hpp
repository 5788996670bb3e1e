#pragma once

#include <cstdint>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace fleet::db::memory {

// Optimistic: writes go to a private copy of the committed state, and
// Commit throws util::InvalidState if another transaction committed since
// Begin.
class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override = default;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return phase_ != Phase::Open;
  }

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  enum class Phase { Open, Committed, RolledBack };

  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  uint64_t                base_version_ = 0;
  Phase                   phase_        = Phase::Open;
};

} // namespace fleet::db::memory
