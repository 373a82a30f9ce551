#include "internal/events/transfer_event_channel.hpp"

#include <algorithm>

namespace medsync::events {

const char* ToString(TransferEventType type) {
  switch (type) {
    case TransferEventType::kProgress:
      return "progress";
    case TransferEventType::kRetryScheduled:
      return "retry_scheduled";
    case TransferEventType::kCompleted:
      return "completed";
    case TransferEventType::kFailed:
      return "failed";
    case TransferEventType::kCancelled:
      return "cancelled";
    case TransferEventType::kAuthRequired:
      return "auth_required";
    case TransferEventType::kQueuePaused:
      return "queue_paused";
  }
  return "unknown";
}

TransferEventChannel::TransferEventChannel(std::size_t capacity) : capacity_(std::max<std::size_t>(capacity, 1)) {
}

bool TransferEventChannel::Publish(TransferEvent event) {
  {
    std::lock_guard lock(mutex_);
    if (closed_) {
      return false;
    }

    if (event.type == TransferEventType::kProgress && events_.size() >= capacity_) {
      auto oldest = std::find_if(events_.begin(), events_.end(),
                                 [](const TransferEvent& e) { return e.type == TransferEventType::kProgress; });
      ++dropped_progress_;
      if (oldest == events_.end()) {
        return false;
      }
      events_.erase(oldest);
    }
    events_.push_back(std::move(event));
  }
  cv_.notify_one();
  return true;
}

std::optional<TransferEvent> TransferEventChannel::TryPop() {
  std::lock_guard lock(mutex_);
  if (events_.empty()) {
    return std::nullopt;
  }
  auto event = std::move(events_.front());
  events_.pop_front();
  return event;
}

std::optional<TransferEvent> TransferEventChannel::WaitPop(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  cv_.wait_for(lock, timeout, [&] { return closed_ || !events_.empty(); });
  if (events_.empty()) {
    return std::nullopt;
  }
  auto event = std::move(events_.front());
  events_.pop_front();
  return event;
}

void TransferEventChannel::Close() {
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

std::size_t TransferEventChannel::Size() const {
  std::lock_guard lock(mutex_);
  return events_.size();
}

uint64_t TransferEventChannel::DroppedProgress() const {
  std::lock_guard lock(mutex_);
  return dropped_progress_;
}

} // namespace medsync::events
