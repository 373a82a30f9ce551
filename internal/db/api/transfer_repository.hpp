#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/transfer_row.hpp"

namespace medsync::db {

/*
  Repository abstraction for the transfer queue.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - A committed write survives process termination (backend permitting)

  The repository is the source of truth for the resume offset of every
  queued transfer.
*/

class TransferRepository {
 public:
  virtual ~TransferRepository() = default;

  virtual std::unique_ptr<Transaction> Begin() = 0;

  virtual Result InsertTransfer(Transaction&, const model::TransferRow&) = 0;

  virtual Result UpdateTransfer(Transaction&, const model::TransferRow&) = 0;

  virtual Result DeleteTransfer(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::TransferRow> GetTransfer(Transaction&, const std::string& id) = 0;

  // ordered by (priority DESC, sequence ASC)
  virtual std::vector<model::TransferRow> ListTransfers(Transaction&) = 0;

  virtual uint64_t MaxSequence(Transaction&) = 0;
};

} // namespace medsync::db
