#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace medsync::db::memory {

MemoryTransferRepository::MemoryTransferRepository() = default;

std::unique_ptr<db::Transaction> MemoryTransferRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryTransferRepository::InsertTransfer(Transaction& t, const model::TransferRow& r) {
  auto& s = TX(t).Mutable();
  if (s.transfers.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "transfer already queued: " + r.id);
  s.transfers[r.id] = r;
  return Result::Ok();
}

Result MemoryTransferRepository::UpdateTransfer(Transaction& t, const model::TransferRow& r) {
  auto& s = TX(t).Mutable();
  if (!s.transfers.contains(r.id)) return Result::Err(ErrorCode::NotFound, "transfer not queued: " + r.id);
  s.transfers[r.id] = r;
  return Result::Ok();
}

Result MemoryTransferRepository::DeleteTransfer(Transaction& t, const std::string& id) {
  TX(t).Mutable().transfers.erase(id);
  return Result::Ok();
}

std::optional<model::TransferRow> MemoryTransferRepository::GetTransfer(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.transfers.find(id);
  if (it == s.transfers.end()) return std::nullopt;
  return it->second;
}

std::vector<model::TransferRow> MemoryTransferRepository::ListTransfers(Transaction& t) {
  const auto&                     s = TX(t).View();
  std::vector<model::TransferRow> rows;
  rows.reserve(s.transfers.size());
  for (const auto& [_, row] : s.transfers) {
    rows.push_back(row);
  }
  std::sort(rows.begin(), rows.end(), [](const model::TransferRow& a, const model::TransferRow& b) {
    if (a.priority != b.priority) return a.priority > b.priority;
    return a.sequence < b.sequence;
  });
  return rows;
}

uint64_t MemoryTransferRepository::MaxSequence(Transaction& t) {
  uint64_t max_sequence = 0;
  for (const auto& [_, row] : TX(t).View().transfers) {
    max_sequence = std::max(max_sequence, row.sequence);
  }
  return max_sequence;
}

} // namespace medsync::db::memory
