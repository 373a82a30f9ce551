#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/transfer_repository.hpp"
#include "internal/model/transfer_descriptor.hpp"
#include "internal/queue/checkpoint_store.hpp"
#include "medsync/upload/v1.hpp"

namespace medsync::queue {

struct LoadReport {
  std::size_t loaded    = 0;
  std::size_t recovered = 0; // were Uploading when the process died
  std::size_t skipped   = 0; // corrupted or invalid rows, left in the table
  std::size_t purged    = 0; // Succeeded rows whose removal never committed
};

enum class LoadMode {
  kRecover, // owner: Uploading -> Pending, Succeeded rows purged
  kInspect, // read-only view of a queue another process may own; no writes
};

struct TransferCounts {
  std::size_t pending            = 0;
  std::size_t uploading          = 0;
  std::size_t pending_offline    = 0;
  std::size_t failed_permanently = 0;

  std::size_t total() const {
    return pending + uploading + pending_offline + failed_permanently;
  }
};

struct FailureUpdate {
  model::TransferError error;
  uint32_t             attempt_count = 0;
  util::TimePoint      next_eligible_at{};
  bool                 offline      = false;
  uint32_t             max_attempts = 0; // 0 = unlimited
};

/*
  Durable, ordered collection of transfer descriptors.

  Every mutation is written through to the repository inside one transaction
  before the in-memory copy changes, so a crash at any point leaves the
  table describing a state the queue actually passed through.

  Ordering for dispatch: priority DESC, then submission sequence ASC.

  Each entry keeps the protobuf record it was loaded from; rewrites only
  replace known fields, so fields written by a newer build survive.

  Thread-safe.
*/
class TransferQueue final : public CheckpointStore {
 public:
  explicit TransferQueue(std::shared_ptr<db::TransferRepository> repository);

  // Replaces the in-memory view with the repository contents. After a
  // kInspect load every mutation throws util::InvalidState.
  LoadReport Load(LoadMode mode = LoadMode::kRecover);

  // Rewrites every entry in one transaction.
  void Persist();

  // Assigns sequence and created_at (and an id when empty). Throws
  // util::AlreadyExists on duplicate ids.
  model::TransferDescriptor Enqueue(model::TransferDescriptor descriptor);

  // Claims the first eligible Pending entry and moves it to Uploading.
  std::optional<model::TransferDescriptor> DequeueNext(util::TimePoint now);

  std::optional<model::TransferDescriptor> Get(const std::string& id) const;
  std::vector<model::TransferDescriptor>   ListPending() const;
  std::vector<model::TransferDescriptor>   ListAll() const;
  TransferCounts                           Counts() const;

  // Earliest next_eligible_at among Pending entries.
  std::optional<util::TimePoint> NextEligibleAt() const;

  // Removes the entry; returns it if it existed.
  std::optional<model::TransferDescriptor> Remove(const std::string& id);
  std::vector<model::TransferDescriptor>   RemoveFailed();

  // Throws util::InvalidState on an edge CanTransition rejects.
  model::TransferDescriptor Transition(const std::string& id, model::TransferStatus to);

  // Uploading -> Succeeded, then the entry leaves the queue. A failed row
  // delete is only logged: the Succeeded row is purged by the next Load.
  model::TransferDescriptor CompleteSuccess(const std::string& id, const std::string& result_id);

  // Uploading -> Pending without touching the attempt count.
  model::TransferDescriptor ReleaseClaim(const std::string& id, util::TimePoint next_eligible_at);

  // Uploading -> Pending, then PendingOffline or FailedPermanently as the
  // update dictates.
  model::TransferDescriptor ApplyFailure(const std::string& id, const FailureUpdate& update);

  // FailedPermanently -> Pending with a fresh attempt budget, ahead of every
  // other queued entry.
  model::TransferDescriptor ResetFailed(const std::string& id, util::TimePoint now);

  // Moves a waiting entry ahead of every other queued entry and makes it
  // eligible now.
  model::TransferDescriptor Prioritize(const std::string& id, util::TimePoint now);

  std::size_t MarkAllOffline();
  std::size_t RestoreOffline(util::TimePoint now);

  void Checkpoint(const std::string& id, uint64_t offset, const std::string& session_id) override;
  void RestartFromZero(const std::string& id) override;

 private:
  struct Entry {
    model::TransferDescriptor           descriptor;
    medsync::upload::v1::TransferRecord record;
  };

  void     EnsureWritableLocked() const;
  Entry&   MustGetLocked(const std::string& id);
  void     WriteLocked(Entry& entry, model::TransferDescriptor updated);
  void     ChangeStatusLocked(Entry& entry, model::TransferDescriptor& updated, model::TransferStatus to) const;
  int32_t  TopPriorityLocked() const;

  std::shared_ptr<db::TransferRepository> repository_;

  mutable std::mutex           mutex_;
  std::map<std::string, Entry> entries_;
  uint64_t                     next_sequence_ = 1;
  bool                         read_only_     = false;
};

} // namespace medsync::queue
