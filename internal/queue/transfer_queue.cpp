#include "internal/queue/transfer_queue.hpp"

#include <algorithm>
#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/queue/record_codec.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace medsync::queue {

namespace v1 = medsync::upload::v1;

using model::TransferDescriptor;
using model::TransferStatus;

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::Conflict:
      throw util::InvalidState(message);
    default:
      throw util::StorageError(message);
  }
}

// priority DESC, sequence ASC
bool DispatchesBefore(const TransferDescriptor& a, const TransferDescriptor& b) {
  if (a.priority != b.priority) {
    return a.priority > b.priority;
  }
  return a.sequence < b.sequence;
}

std::vector<TransferDescriptor> Sorted(std::vector<TransferDescriptor> items) {
  std::sort(items.begin(), items.end(), DispatchesBefore);
  return items;
}

} // namespace

TransferQueue::TransferQueue(std::shared_ptr<db::TransferRepository> repository) : repository_(std::move(repository)) {
}

LoadReport TransferQueue::Load(LoadMode mode) {
  std::lock_guard lock(mutex_);

  const bool inspect = mode == LoadMode::kInspect;
  LoadReport report;
  entries_.clear();
  read_only_ = inspect;

  auto tx   = repository_->Begin();
  auto rows = repository_->ListTransfers(*tx);
  next_sequence_ = repository_->MaxSequence(*tx) + 1;

  for (const auto& row : rows) {
    Entry entry;
    if (!entry.record.ParseFromString(row.record)) {
      ++report.skipped;
      MEDSYNC_LOG_WARN("skipping corrupted transfer record",
                       {observability::StringField("transfer_id", row.id),
                        observability::StringField("error_kind", model::ToString(model::ErrorKind::kStorageCorruption))});
      continue;
    }

    std::string why;
    auto        descriptor = FromRecord(entry.record, &why);
    if (!descriptor || descriptor->id != row.id) {
      ++report.skipped;
      MEDSYNC_LOG_WARN("skipping invalid transfer record",
                       {observability::StringField("transfer_id", row.id),
                        observability::StringField("reason", descriptor ? "id mismatch" : why),
                        observability::StringField("error_kind", model::ToString(model::ErrorKind::kStorageCorruption))});
      continue;
    }

    if (descriptor->status == TransferStatus::kSucceeded) {
      if (inspect) {
        continue;
      }
      ThrowIfDbError(repository_->DeleteTransfer(*tx, row.id), "purge succeeded transfer");
      ++report.purged;
      continue;
    }

    if (descriptor->status == TransferStatus::kUploading && !inspect) {
      descriptor->status = TransferStatus::kPending;
      FillRecord(*descriptor, &entry.record);
      ThrowIfDbError(repository_->UpdateTransfer(*tx, ToRow(entry.record)), "recover interrupted transfer");
      ++report.recovered;
      MEDSYNC_LOG_INFO("recovered interrupted transfer", {observability::StringField("transfer_id", descriptor->id),
                                                          observability::UintField("offset", descriptor->offset)});
    }

    entry.descriptor = std::move(*descriptor);
    entries_.emplace(row.id, std::move(entry));
    ++report.loaded;
  }

  if (inspect) {
    tx->Rollback();
  } else {
    tx->Commit();
  }

  MEDSYNC_LOG_INFO("transfer queue loaded", {observability::BoolField("read_only", inspect),
                                             observability::UintField("loaded", report.loaded),
                                             observability::UintField("recovered", report.recovered),
                                             observability::UintField("skipped", report.skipped),
                                             observability::UintField("purged", report.purged)});
  return report;
}

void TransferQueue::Persist() {
  std::lock_guard lock(mutex_);
  EnsureWritableLocked();

  auto tx = repository_->Begin();
  for (auto& [id, entry] : entries_) {
    FillRecord(entry.descriptor, &entry.record);
    ThrowIfDbError(repository_->UpdateTransfer(*tx, ToRow(entry.record)), "persist transfer " + id);
  }
  tx->Commit();
}

TransferDescriptor TransferQueue::Enqueue(TransferDescriptor descriptor) {
  std::lock_guard lock(mutex_);
  EnsureWritableLocked();

  if (descriptor.id.empty()) {
    descriptor.id = util::NewTransferId();
  }
  if (entries_.count(descriptor.id) != 0) {
    throw util::AlreadyExists("transfer already queued: " + descriptor.id);
  }
  if (descriptor.payload.total_size == 0) {
    throw util::InvalidPayload("empty payload for transfer " + descriptor.id);
  }
  if (descriptor.status != TransferStatus::kPending && descriptor.status != TransferStatus::kPendingOffline) {
    throw util::InvalidState("new transfers must be pending");
  }

  descriptor.sequence = next_sequence_;
  if (descriptor.created_at == util::TimePoint{}) {
    descriptor.created_at = util::Now();
  }

  Entry entry;
  entry.descriptor = descriptor;
  FillRecord(entry.descriptor, &entry.record);

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->InsertTransfer(*tx, ToRow(entry.record)), "enqueue transfer");
  tx->Commit();

  ++next_sequence_;
  entries_.emplace(descriptor.id, std::move(entry));

  MEDSYNC_LOG_INFO("transfer enqueued", {observability::StringField("transfer_id", descriptor.id),
                                         observability::UintField("size_bytes", descriptor.payload.total_size),
                                         observability::IntField("priority", descriptor.priority)});
  return descriptor;
}

std::optional<TransferDescriptor> TransferQueue::DequeueNext(util::TimePoint now) {
  std::lock_guard lock(mutex_);

  Entry* best = nullptr;
  for (auto& [id, entry] : entries_) {
    const auto& d = entry.descriptor;
    if (d.status != TransferStatus::kPending || d.next_eligible_at > now) {
      continue;
    }
    if (best == nullptr || DispatchesBefore(d, best->descriptor)) {
      best = &entry;
    }
  }
  if (best == nullptr) {
    return std::nullopt;
  }

  auto updated = best->descriptor;
  ChangeStatusLocked(*best, updated, TransferStatus::kUploading);
  updated.last_attempt_at = now;
  WriteLocked(*best, std::move(updated));
  return best->descriptor;
}

std::optional<TransferDescriptor> TransferQueue::Get(const std::string& id) const {
  std::lock_guard lock(mutex_);
  auto            it = entries_.find(id);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second.descriptor;
}

std::vector<TransferDescriptor> TransferQueue::ListPending() const {
  std::lock_guard                 lock(mutex_);
  std::vector<TransferDescriptor> out;
  for (const auto& [id, entry] : entries_) {
    if (!model::IsTerminal(entry.descriptor.status)) {
      out.push_back(entry.descriptor);
    }
  }
  return Sorted(std::move(out));
}

std::vector<TransferDescriptor> TransferQueue::ListAll() const {
  std::lock_guard                 lock(mutex_);
  std::vector<TransferDescriptor> out;
  out.reserve(entries_.size());
  for (const auto& [id, entry] : entries_) {
    out.push_back(entry.descriptor);
  }
  return Sorted(std::move(out));
}

TransferCounts TransferQueue::Counts() const {
  std::lock_guard lock(mutex_);
  TransferCounts  counts;
  for (const auto& [id, entry] : entries_) {
    switch (entry.descriptor.status) {
      case TransferStatus::kPending:
        ++counts.pending;
        break;
      case TransferStatus::kUploading:
        ++counts.uploading;
        break;
      case TransferStatus::kPendingOffline:
        ++counts.pending_offline;
        break;
      case TransferStatus::kFailedPermanently:
        ++counts.failed_permanently;
        break;
      default:
        break;
    }
  }
  return counts;
}

std::optional<util::TimePoint> TransferQueue::NextEligibleAt() const {
  std::lock_guard                lock(mutex_);
  std::optional<util::TimePoint> earliest;
  for (const auto& [id, entry] : entries_) {
    if (entry.descriptor.status != TransferStatus::kPending) {
      continue;
    }
    if (!earliest || entry.descriptor.next_eligible_at < *earliest) {
      earliest = entry.descriptor.next_eligible_at;
    }
  }
  return earliest;
}

std::optional<TransferDescriptor> TransferQueue::Remove(const std::string& id) {
  std::lock_guard lock(mutex_);
  auto            it = entries_.find(id);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  EnsureWritableLocked();

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->DeleteTransfer(*tx, id), "remove transfer");
  tx->Commit();

  auto removed = std::move(it->second.descriptor);
  entries_.erase(it);
  return removed;
}

std::vector<TransferDescriptor> TransferQueue::RemoveFailed() {
  std::lock_guard lock(mutex_);
  EnsureWritableLocked();

  std::vector<TransferDescriptor> removed;
  auto                            tx = repository_->Begin();
  for (const auto& [id, entry] : entries_) {
    if (entry.descriptor.status == TransferStatus::kFailedPermanently) {
      ThrowIfDbError(repository_->DeleteTransfer(*tx, id), "clear failed transfer");
      removed.push_back(entry.descriptor);
    }
  }
  tx->Commit();

  for (const auto& d : removed) {
    entries_.erase(d.id);
  }
  return removed;
}

TransferDescriptor TransferQueue::Transition(const std::string& id, TransferStatus to) {
  std::lock_guard lock(mutex_);
  auto&           entry   = MustGetLocked(id);
  auto            updated = entry.descriptor;
  ChangeStatusLocked(entry, updated, to);
  WriteLocked(entry, std::move(updated));
  return entry.descriptor;
}

TransferDescriptor TransferQueue::CompleteSuccess(const std::string& id, const std::string& result_id) {
  std::lock_guard lock(mutex_);
  auto&           entry   = MustGetLocked(id);
  auto            updated = entry.descriptor;
  ChangeStatusLocked(entry, updated, TransferStatus::kSucceeded);
  updated.offset          = updated.payload.total_size;
  updated.result_id       = result_id;
  updated.last_error      = {};
  updated.last_error_kind = model::ErrorKind::kNone;

  // Succeeded is written first so a crash before the delete still reads back
  // as done (purged on the next Load) instead of being uploaded again.
  WriteLocked(entry, std::move(updated));

  auto done = std::move(entry.descriptor);
  entries_.erase(id);

  try {
    auto tx = repository_->Begin();
    ThrowIfDbError(repository_->DeleteTransfer(*tx, id), "remove succeeded transfer");
    tx->Commit();
  } catch (const std::exception& e) {
    MEDSYNC_LOG_WARN("succeeded transfer left for the next load to purge",
                     {observability::StringField("transfer_id", id), observability::StringField("error", e.what())});
  }
  return done;
}

TransferDescriptor TransferQueue::ReleaseClaim(const std::string& id, util::TimePoint next_eligible_at) {
  std::lock_guard lock(mutex_);
  auto&           entry   = MustGetLocked(id);
  auto            updated = entry.descriptor;
  ChangeStatusLocked(entry, updated, TransferStatus::kPending);
  updated.next_eligible_at = next_eligible_at;
  WriteLocked(entry, std::move(updated));
  return entry.descriptor;
}

TransferDescriptor TransferQueue::ApplyFailure(const std::string& id, const FailureUpdate& update) {
  std::lock_guard lock(mutex_);
  auto&           entry   = MustGetLocked(id);
  auto            updated = entry.descriptor;

  ChangeStatusLocked(entry, updated, TransferStatus::kPending);
  updated.attempt_count    = update.attempt_count;
  updated.last_error       = update.error.message;
  updated.last_error_kind  = update.error.kind;
  updated.next_eligible_at = update.next_eligible_at;

  if (update.max_attempts > 0 && updated.attempt_count >= update.max_attempts) {
    ChangeStatusLocked(entry, updated, TransferStatus::kFailedPermanently);
  } else if (update.offline) {
    ChangeStatusLocked(entry, updated, TransferStatus::kPendingOffline);
  }

  WriteLocked(entry, std::move(updated));
  return entry.descriptor;
}

TransferDescriptor TransferQueue::ResetFailed(const std::string& id, util::TimePoint now) {
  std::lock_guard lock(mutex_);
  auto&           entry = MustGetLocked(id);
  if (!model::CanReset(entry.descriptor.status)) {
    throw util::InvalidState("transfer " + id + " is " + model::ToString(entry.descriptor.status) +
                             ", only failed transfers can be retried");
  }

  auto updated             = entry.descriptor;
  updated.status           = TransferStatus::kPending;
  updated.attempt_count    = 0;
  updated.next_eligible_at = now;
  updated.priority         = TopPriorityLocked() + 1;
  WriteLocked(entry, std::move(updated));
  return entry.descriptor;
}

TransferDescriptor TransferQueue::Prioritize(const std::string& id, util::TimePoint now) {
  std::lock_guard lock(mutex_);
  auto&           entry = MustGetLocked(id);
  const auto      status = entry.descriptor.status;
  if (status != TransferStatus::kPending && status != TransferStatus::kPendingOffline) {
    throw util::InvalidState("transfer " + id + " is " + model::ToString(status) + ", only waiting transfers can be prioritized");
  }

  auto updated             = entry.descriptor;
  updated.priority         = TopPriorityLocked() + 1;
  updated.next_eligible_at = now;
  WriteLocked(entry, std::move(updated));
  return entry.descriptor;
}

std::size_t TransferQueue::MarkAllOffline() {
  std::lock_guard lock(mutex_);
  std::size_t     moved = 0;
  for (auto& [id, entry] : entries_) {
    if (entry.descriptor.status != TransferStatus::kPending) {
      continue;
    }
    auto updated = entry.descriptor;
    ChangeStatusLocked(entry, updated, TransferStatus::kPendingOffline);
    WriteLocked(entry, std::move(updated));
    ++moved;
  }
  return moved;
}

std::size_t TransferQueue::RestoreOffline(util::TimePoint now) {
  std::lock_guard lock(mutex_);
  std::size_t     moved = 0;
  for (auto& [id, entry] : entries_) {
    if (entry.descriptor.status != TransferStatus::kPendingOffline) {
      continue;
    }
    auto updated = entry.descriptor;
    ChangeStatusLocked(entry, updated, TransferStatus::kPending);
    updated.next_eligible_at = now;
    WriteLocked(entry, std::move(updated));
    ++moved;
  }
  return moved;
}

void TransferQueue::Checkpoint(const std::string& id, uint64_t offset, const std::string& session_id) {
  std::lock_guard lock(mutex_);
  auto&           entry = MustGetLocked(id);
  const auto&     d     = entry.descriptor;

  if (d.status != TransferStatus::kUploading) {
    throw util::InvalidState("checkpoint for transfer " + id + " in state " + model::ToString(d.status));
  }
  if (offset < d.offset) {
    throw util::InvalidState("checkpoint would move transfer " + id + " backwards from " + std::to_string(d.offset) +
                             " to " + std::to_string(offset));
  }
  if (offset > d.payload.total_size) {
    throw util::InvalidState("checkpoint offset " + std::to_string(offset) + " beyond payload size");
  }

  auto updated       = d;
  updated.offset     = offset;
  updated.session_id = session_id;
  WriteLocked(entry, std::move(updated));
}

void TransferQueue::RestartFromZero(const std::string& id) {
  std::lock_guard lock(mutex_);
  auto&           entry   = MustGetLocked(id);
  auto            updated = entry.descriptor;
  updated.offset          = 0;
  updated.session_id.clear();
  WriteLocked(entry, std::move(updated));

  MEDSYNC_LOG_WARN("transfer restarted from offset 0", {observability::StringField("transfer_id", id)});
}

void TransferQueue::EnsureWritableLocked() const {
  if (read_only_) {
    throw util::InvalidState("transfer queue was loaded read-only");
  }
}

TransferQueue::Entry& TransferQueue::MustGetLocked(const std::string& id) {
  auto it = entries_.find(id);
  if (it == entries_.end()) {
    throw util::NotFound("transfer not found: " + id);
  }
  return it->second;
}

void TransferQueue::WriteLocked(Entry& entry, TransferDescriptor updated) {
  EnsureWritableLocked();
  auto record = entry.record;
  FillRecord(updated, &record);

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->UpdateTransfer(*tx, ToRow(record)), "update transfer " + updated.id);
  tx->Commit();

  entry.descriptor = std::move(updated);
  entry.record     = std::move(record);
}

void TransferQueue::ChangeStatusLocked(Entry& entry, TransferDescriptor& updated, TransferStatus to) const {
  if (!model::CanTransition(updated.status, to)) {
    throw util::InvalidState("invalid transition for transfer " + entry.descriptor.id + ": " +
                             model::ToString(updated.status) + " -> " + model::ToString(to));
  }
  updated.status = to;
}

int32_t TransferQueue::TopPriorityLocked() const {
  int32_t top = 0;
  for (const auto& [id, entry] : entries_) {
    top = std::max(top, entry.descriptor.priority);
  }
  return top;
}

} // namespace medsync::queue
