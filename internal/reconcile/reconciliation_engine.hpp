#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/upload_options.hpp"
#include "internal/connection/connection_monitor.hpp"
#include "internal/events/transfer_event_channel.hpp"
#include "internal/payload/payload_spool.hpp"
#include "internal/queue/transfer_queue.hpp"
#include "internal/reconcile/dispatch_queue.hpp"
#include "internal/reconcile/transfer_worker.hpp"
#include "internal/retry/retry_scheduler.hpp"
#include "internal/transfer/chunked_transfer_client.hpp"
#include "internal/transport/upload_transport.hpp"

namespace medsync::reconcile {

enum class CancelOutcome {
  kNotFound,
  kRemoved,   // was waiting; removed from the queue
  kSignalled, // in flight; the worker removes it when the transfer stops
};

/*
  Drains the transfer queue under a concurrency cap.

  One coordinator thread claims eligible descriptors (Pending -> Uploading)
  while the monitor reports online and the queue is not paused, and hands
  them to a fixed pool of workers. Outcomes:

    success            Succeeded, removed, Completed event
    NetworkTransient   Pending with backoff (PendingOffline when offline),
                       FailedPermanently once max_attempts is reached
    ProtocolDesync     Pending, offset 0, eligible immediately
    AuthExpired        Pending, queue paused, AuthRequired event
    EndpointInvalid    Pending, queue paused, QueuePaused event
    PayloadInvalid     removed, Failed event
    Cancelled          removed (user) or Pending (shutdown)

  A user cancel wins over whatever error the interrupted request returned.

  Offline -> online transitions restore PendingOffline descriptors through
  the retry scheduler's reconnect handler and wake the coordinator.
*/
class ReconciliationEngine {
 public:
  ReconciliationEngine(config::ReconcileOptions options, uint32_t max_attempts,
                       std::shared_ptr<queue::TransferQueue>             queue,
                       std::shared_ptr<transfer::ChunkedTransferClient>  client,
                       std::shared_ptr<retry::RetryScheduler>            retry,
                       std::shared_ptr<connection::ConnectionMonitor>    monitor,
                       std::shared_ptr<events::TransferEventChannel>     events,
                       std::shared_ptr<transport::UploadTransport>       transport,
                       std::shared_ptr<payload::PayloadSpool>            spool);
  ~ReconciliationEngine();

  ReconciliationEngine(const ReconciliationEngine&)            = delete;
  ReconciliationEngine& operator=(const ReconciliationEngine&) = delete;

  void Start();

  // In-flight transfers are interrupted and return to Pending with their
  // offset intact.
  void Stop();

  // Wakes the coordinator to dispatch whatever is eligible now.
  void Drain();

  // Called after a new descriptor was enqueued.
  void OnSubmitted(const std::string& id);

  CancelOutcome Cancel(const std::string& id);

  void Pause();
  void ResumeAfterReauth();
  bool IsPaused() const;

  std::size_t InFlight() const;
  // Highest number of simultaneously Uploading descriptors seen.
  std::size_t PeakInFlight() const;

 private:
  void CoordinatorLoop();
  void DispatchLocked();

  void Execute(DispatchTask& task);
  void ApplyOutcome(model::TransferDescriptor& descriptor, const transfer::UploadResult& result,
                    const util::CancellationToken& cancel);
  void ApplyRetry(const model::TransferDescriptor& descriptor, const model::TransferError& error, bool immediate);
  void HoldAndPause(const model::TransferDescriptor& descriptor, const model::TransferError& error,
                    events::TransferEventType notice);
  // Outcome could not be written: hand the claim back with a backoff, or
  // report it Failed when even that write fails.
  void RecoverClaim(const model::TransferDescriptor& descriptor, const std::string& reason);
  void Finish(const std::string& id, const util::CancellationToken& cancel);

  void OnConnectionChange(const model::ConnectionState& previous, const model::ConnectionState& current);
  void OnReconnect();

  void DiscardRemoved(const model::TransferDescriptor& descriptor);
  void Emit(events::TransferEvent event);

  config::ReconcileOptions options_;
  uint32_t                 max_attempts_;

  std::shared_ptr<queue::TransferQueue>            queue_;
  std::shared_ptr<transfer::ChunkedTransferClient> client_;
  std::shared_ptr<retry::RetryScheduler>           retry_;
  std::shared_ptr<connection::ConnectionMonitor>   monitor_;
  std::shared_ptr<events::TransferEventChannel>    events_;
  std::shared_ptr<transport::UploadTransport>      transport_;
  std::shared_ptr<payload::PayloadSpool>           spool_;

  std::shared_ptr<DispatchQueue>               dispatch_;
  std::vector<std::unique_ptr<TransferWorker>> workers_;
  std::thread                                  coordinator_;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  bool                    running_ = false;
  bool                    wake_    = false;
  bool                    paused_  = false;
  std::size_t             in_flight_      = 0;
  std::size_t             peak_in_flight_ = 0;

  std::map<std::string, std::shared_ptr<util::CancellationToken>> tokens_;

  uint64_t monitor_subscription_ = 0;
};

} // namespace medsync::reconcile
