#pragma once

#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>

#include "internal/model/transfer_descriptor.hpp"
#include "internal/util/cancellation.hpp"

namespace medsync::reconcile {

// A claimed (Uploading) descriptor handed from the coordinator to a worker.
struct DispatchTask {
  model::TransferDescriptor                descriptor;
  std::shared_ptr<util::CancellationToken> cancel;
};

/*
  Thread-safe blocking queue between the coordinator and the workers.

  After Shutdown(), Dequeue() keeps returning queued tasks until the queue is
  empty so that no claimed descriptor is lost.
*/
class DispatchQueue {
 public:
  void Enqueue(DispatchTask task);

  // blocking wait
  std::optional<DispatchTask> Dequeue();

  void Shutdown();

 private:
  std::mutex               mutex_;
  std::condition_variable  cv_;
  std::queue<DispatchTask> queue_;
  bool                     shutdown_ = false;
};

} // namespace medsync::reconcile
