#pragma once

#include <memory>

#include "internal/db/api/transfer_repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace medsync::db::sqlite {

class SqliteTransferRepository final : public db::TransferRepository {
public:
  explicit SqliteTransferRepository(std::shared_ptr<SqliteDB> db);

  // Creates the transfer table when missing.
  static void BootstrapSchema(SqliteDB& db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertTransfer(Transaction&, const model::TransferRow&) override;
  Result UpdateTransfer(Transaction&, const model::TransferRow&) override;
  Result DeleteTransfer(Transaction&, const std::string&) override;
  std::optional<model::TransferRow> GetTransfer(Transaction&, const std::string&) override;
  std::vector<model::TransferRow> ListTransfers(Transaction&) override;
  uint64_t MaxSequence(Transaction&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
