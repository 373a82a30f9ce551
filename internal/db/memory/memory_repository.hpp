#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/db/api/transfer_repository.hpp"

namespace medsync::db::memory {

class MemoryTransaction;

/*
  Process-local repository. Nothing survives the process; used by tests and
  by `queue.memory` configurations.
*/
class MemoryTransferRepository final : public db::TransferRepository {
public:
  MemoryTransferRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertTransfer(Transaction&, const model::TransferRow&) override;
  Result UpdateTransfer(Transaction&, const model::TransferRow&) override;
  Result DeleteTransfer(Transaction&, const std::string&) override;
  std::optional<model::TransferRow> GetTransfer(Transaction&, const std::string&) override;
  std::vector<model::TransferRow> ListTransfers(Transaction&) override;
  uint64_t MaxSequence(Transaction&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::TransferRow> transfers;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

}
