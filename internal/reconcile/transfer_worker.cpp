#include "internal/reconcile/transfer_worker.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace medsync::reconcile {

TransferWorker::TransferWorker(std::shared_ptr<DispatchQueue> queue, Executor executor)
    : queue_(std::move(queue)), executor_(std::move(executor)) {
}

TransferWorker::~TransferWorker() {
  Join();
}

void TransferWorker::Start() {
  thread_ = std::thread(&TransferWorker::Run, this);
}

void TransferWorker::Join() {
  if (thread_.joinable()) {
    thread_.join();
  }
}

void TransferWorker::Run() {
  while (auto task = queue_->Dequeue()) {
    try {
      executor_(*task);
    } catch (const std::exception& e) {
      MEDSYNC_LOG_ERROR("transfer worker task failed", {observability::StringField("transfer_id", task->descriptor.id),
                                                        observability::StringField("error", e.what())});
    }
  }
}

} // namespace medsync::reconcile
