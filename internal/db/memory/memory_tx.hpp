#pragma once

#include <cstdint>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace shopstack::db::memory {

/*
  Transaction = snapshot + write set

  Commit fails if another transaction committed after this snapshot was
  taken.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable() {
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
};

} // namespace shopstack::db::memory
