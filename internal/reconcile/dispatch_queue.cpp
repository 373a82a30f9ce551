#include "internal/reconcile/dispatch_queue.hpp"

namespace medsync::reconcile {

void DispatchQueue::Enqueue(DispatchTask task) {
  {
    std::lock_guard lock(mutex_);
    queue_.push(std::move(task));
  }
  cv_.notify_one();
}

std::optional<DispatchTask> DispatchQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  DispatchTask task = std::move(queue_.front());
  queue_.pop();
  return task;
}

void DispatchQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

} // namespace medsync::reconcile
