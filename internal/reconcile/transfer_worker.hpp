#pragma once

#include <functional>
#include <memory>
#include <thread>

#include "internal/reconcile/dispatch_queue.hpp"

namespace medsync::reconcile {

/*
  Background worker that runs one transfer at a time.

  Runs until the dispatch queue is shut down and drained.
*/
class TransferWorker {
 public:
  using Executor = std::function<void(DispatchTask&)>;

  TransferWorker(std::shared_ptr<DispatchQueue> queue, Executor executor);
  ~TransferWorker();

  void Start();
  // Expects the dispatch queue to have been shut down.
  void Join();

 private:
  void Run();

  std::shared_ptr<DispatchQueue> queue_;
  Executor                       executor_;

  std::thread thread_;
};

} // namespace medsync::reconcile
