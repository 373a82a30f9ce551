#pragma once

#include <cstdint>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace medsync::db::memory {

/*
  Transaction = snapshot + write set
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryTransferRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryTransferRepository::State& Mutable() {
    return working_;
  }
  const MemoryTransferRepository::State& View() const {
    return working_;
  }

 private:
  MemoryTransferRepository&       repo_;
  MemoryTransferRepository::State working_;
  uint64_t                        snapshot_version_ = 0;
  bool                            committed_        = false;
  bool                            rolled_back_      = false;
};

} // namespace medsync::db::memory
