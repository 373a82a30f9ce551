#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

#include "internal/events/transfer_event.hpp"

namespace medsync::events {

/*
  Bounded multi-producer queue of transfer events.

  When full, a new Progress event replaces the oldest queued Progress event
  (or is dropped if there is none). Every other event type is always
  accepted, even past capacity.
*/
class TransferEventChannel {
 public:
  explicit TransferEventChannel(std::size_t capacity);

  // false if the event was dropped
  bool Publish(TransferEvent event);

  std::optional<TransferEvent> TryPop();

  // nullopt on timeout or once closed and drained
  std::optional<TransferEvent> WaitPop(std::chrono::milliseconds timeout);

  void Close();

  std::size_t Size() const;
  uint64_t    DroppedProgress() const;

 private:
  const std::size_t capacity_;

  mutable std::mutex        mutex_;
  std::condition_variable   cv_;
  std::deque<TransferEvent> events_;
  uint64_t                  dropped_progress_ = 0;
  bool                      closed_           = false;
};

} // namespace medsync::events
