#include "internal/reconcile/reconciliation_engine.hpp"

#include <algorithm>
#include <chrono>
#include <exception>

#include "internal/observability/logging.hpp"

namespace medsync::reconcile {

using events::TransferEvent;
using events::TransferEventType;
using model::ErrorKind;
using model::TransferStatus;

namespace {

// Upper bound on how long the coordinator sleeps without a wake-up.
constexpr std::chrono::milliseconds kIdlePoll{1000};
constexpr std::chrono::milliseconds kCancelSessionTimeout{5000};

} // namespace

ReconciliationEngine::ReconciliationEngine(config::ReconcileOptions options, uint32_t max_attempts,
                                           std::shared_ptr<queue::TransferQueue>            queue,
                                           std::shared_ptr<transfer::ChunkedTransferClient> client,
                                           std::shared_ptr<retry::RetryScheduler>           retry,
                                           std::shared_ptr<connection::ConnectionMonitor>   monitor,
                                           std::shared_ptr<events::TransferEventChannel>    events,
                                           std::shared_ptr<transport::UploadTransport>      transport,
                                           std::shared_ptr<payload::PayloadSpool>           spool)
    : options_(options),
      max_attempts_(max_attempts),
      queue_(std::move(queue)),
      client_(std::move(client)),
      retry_(std::move(retry)),
      monitor_(std::move(monitor)),
      events_(std::move(events)),
      transport_(std::move(transport)),
      spool_(std::move(spool)) {
  if (options_.concurrency == 0) {
    options_.concurrency = 1;
  }
}

ReconciliationEngine::~ReconciliationEngine() {
  Stop();
}

void ReconciliationEngine::Start() {
  {
    std::lock_guard lock(mutex_);
    if (running_) {
      return;
    }
    running_ = true;
    wake_    = true;
  }

  dispatch_ = std::make_shared<DispatchQueue>();
  for (uint32_t i = 0; i < options_.concurrency; ++i) {
    auto worker = std::make_unique<TransferWorker>(dispatch_, [this](DispatchTask& task) { Execute(task); });
    worker->Start();
    workers_.push_back(std::move(worker));
  }

  retry_->SetReconnectHandler([this] { OnReconnect(); });
  monitor_subscription_ = monitor_->Subscribe(
      [this](const model::ConnectionState& previous, const model::ConnectionState& current) {
        OnConnectionChange(previous, current);
      });

  coordinator_ = std::thread(&ReconciliationEngine::CoordinatorLoop, this);

  MEDSYNC_LOG_INFO("reconciliation engine started", {observability::UintField("concurrency", options_.concurrency),
                                                     observability::UintField("max_attempts", max_attempts_)});
}

void ReconciliationEngine::Stop() {
  std::vector<std::shared_ptr<util::CancellationToken>> in_flight;
  {
    std::lock_guard lock(mutex_);
    if (!running_) {
      return;
    }
    running_ = false;
    for (const auto& [id, token] : tokens_) {
      in_flight.push_back(token);
    }
  }
  for (const auto& token : in_flight) {
    token->Cancel(util::CancelReason::kShutdown);
  }
  cv_.notify_all();

  if (coordinator_.joinable()) {
    coordinator_.join();
  }
  monitor_->Unsubscribe(monitor_subscription_);
  retry_->SetReconnectHandler(nullptr);

  dispatch_->Shutdown();
  for (auto& worker : workers_) {
    worker->Join();
  }
  workers_.clear();

  MEDSYNC_LOG_INFO("reconciliation engine stopped", {observability::UintField("interrupted", in_flight.size())});
}

void ReconciliationEngine::Drain() {
  {
    std::lock_guard lock(mutex_);
    wake_ = true;
  }
  cv_.notify_all();
}

void ReconciliationEngine::OnSubmitted(const std::string& id) {
  MEDSYNC_LOG_DEBUG("transfer submitted", {observability::StringField("transfer_id", id)});
  Drain();
}

CancelOutcome ReconciliationEngine::Cancel(const std::string& id) {
  std::optional<model::TransferDescriptor> removed;
  {
    std::lock_guard lock(mutex_);
    if (auto it = tokens_.find(id); it != tokens_.end()) {
      it->second->Cancel(util::CancelReason::kUser);
      MEDSYNC_LOG_INFO("cancelling in-flight transfer", {observability::StringField("transfer_id", id)});
      return CancelOutcome::kSignalled;
    }
    // under the engine lock so the coordinator cannot claim it meanwhile
    removed = queue_->Remove(id);
  }

  if (!removed) {
    return CancelOutcome::kNotFound;
  }
  DiscardRemoved(*removed);
  return CancelOutcome::kRemoved;
}

void ReconciliationEngine::Pause() {
  std::lock_guard lock(mutex_);
  if (!paused_) {
    paused_ = true;
    MEDSYNC_LOG_WARN("transfer queue paused until re-authentication");
  }
}

void ReconciliationEngine::ResumeAfterReauth() {
  {
    std::lock_guard lock(mutex_);
    paused_ = false;
    wake_   = true;
  }
  cv_.notify_all();
  MEDSYNC_LOG_INFO("transfer queue resumed after re-authentication");
}

bool ReconciliationEngine::IsPaused() const {
  std::lock_guard lock(mutex_);
  return paused_;
}

std::size_t ReconciliationEngine::InFlight() const {
  std::lock_guard lock(mutex_);
  return in_flight_;
}

std::size_t ReconciliationEngine::PeakInFlight() const {
  std::lock_guard lock(mutex_);
  return peak_in_flight_;
}

void ReconciliationEngine::CoordinatorLoop() {
  std::unique_lock lock(mutex_);
  while (running_) {
    auto deadline = util::Now() + kIdlePoll;
    if (!paused_ && in_flight_ < options_.concurrency) {
      if (auto next = queue_->NextEligibleAt()) {
        deadline = std::min(deadline, *next);
      }
    }

    cv_.wait_until(lock, deadline, [&] { return !running_ || wake_; });
    if (!running_) {
      break;
    }
    wake_ = false;

    try {
      DispatchLocked();
    } catch (const std::exception& e) {
      MEDSYNC_LOG_ERROR("dispatch failed", {observability::StringField("error", e.what())});
    }
  }
}

void ReconciliationEngine::DispatchLocked() {
  if (paused_) {
    return;
  }

  const auto state = monitor_->CurrentState();
  if (!state.is_online) {
    queue_->MarkAllOffline();
    return;
  }
  queue_->RestoreOffline(util::Now());

  while (in_flight_ < options_.concurrency) {
    auto descriptor = queue_->DequeueNext(util::Now());
    if (!descriptor) {
      break;
    }

    auto token              = std::make_shared<util::CancellationToken>();
    tokens_[descriptor->id] = token;
    ++in_flight_;
    peak_in_flight_ = std::max(peak_in_flight_, in_flight_);

    dispatch_->Enqueue({std::move(*descriptor), std::move(token)});
  }
}

void ReconciliationEngine::Execute(DispatchTask& task) {
  auto&             descriptor = task.descriptor;
  const std::string id         = descriptor.id;

  MEDSYNC_LOG_INFO("transfer started", {observability::StringField("transfer_id", id),
                                        observability::UintField("offset", descriptor.offset),
                                        observability::UintField("size_bytes", descriptor.payload.total_size),
                                        observability::UintField("attempt", descriptor.attempt_count + 1)});

  const auto result = client_->Upload(descriptor, *task.cancel, [this, &id](uint64_t sent, uint64_t total) {
    TransferEvent event;
    event.type        = TransferEventType::kProgress;
    event.transfer_id = id;
    event.bytes_sent  = sent;
    event.total_bytes = total;
    events_->Publish(std::move(event));
  });

  try {
    ApplyOutcome(descriptor, result, *task.cancel);
  } catch (const std::exception& e) {
    MEDSYNC_LOG_ERROR("failed to record transfer outcome", {observability::StringField("transfer_id", id),
                                                            observability::StringField("error", e.what())});
    RecoverClaim(descriptor, e.what());
  }
  Finish(id, *task.cancel);
}

void ReconciliationEngine::ApplyOutcome(model::TransferDescriptor& descriptor, const transfer::UploadResult& result,
                                        const util::CancellationToken& cancel) {
  if (result) {
    auto done = queue_->CompleteSuccess(descriptor.id, result.value.result_id);
    spool_->Discard(done.payload);

    TransferEvent event;
    event.type        = TransferEventType::kCompleted;
    event.transfer_id = done.id;
    event.bytes_sent  = done.payload.total_size;
    event.total_bytes = done.payload.total_size;
    event.result_id   = result.value.result_id;
    event.attempt     = done.attempt_count + 1;
    Emit(std::move(event));
    return;
  }

  const auto& error = result.error;

  // a cancel that raced with a failing request still drops the transfer
  if (cancel.Reason() == util::CancelReason::kUser) {
    if (auto removed = queue_->Remove(descriptor.id)) {
      DiscardRemoved(*removed);
    }
    return;
  }

  switch (error.kind) {
    case ErrorKind::kCancelled:
      if (cancel.Reason() == util::CancelReason::kShutdown) {
        queue_->ReleaseClaim(descriptor.id, util::Now());
        MEDSYNC_LOG_INFO("transfer interrupted by shutdown", {observability::StringField("transfer_id", descriptor.id),
                                                              observability::UintField("offset", descriptor.offset)});
        return;
      }
      ApplyRetry(descriptor, error, false);
      return;

    case ErrorKind::kAuthExpired:
      HoldAndPause(descriptor, error, TransferEventType::kAuthRequired);
      return;

    case ErrorKind::kEndpointInvalid:
      // every transfer would fail the same way; keep them all queued
      HoldAndPause(descriptor, error, TransferEventType::kQueuePaused);
      return;

    case ErrorKind::kPayloadInvalid: {
      if (auto removed = queue_->Remove(descriptor.id)) {
        spool_->Discard(removed->payload);
      }
      MEDSYNC_LOG_ERROR("transfer rejected", {observability::StringField("transfer_id", descriptor.id),
                                              observability::StringField("error_kind", model::ToString(error.kind)),
                                              observability::StringField("error", error.message)});

      TransferEvent event;
      event.type        = TransferEventType::kFailed;
      event.transfer_id = descriptor.id;
      event.error_kind  = error.kind;
      event.message     = error.message;
      event.attempt     = descriptor.attempt_count + 1;
      Emit(std::move(event));
      return;
    }

    case ErrorKind::kProtocolDesync:
      ApplyRetry(descriptor, error, true);
      return;

    default:
      ApplyRetry(descriptor, error, false);
      return;
  }
}

void ReconciliationEngine::ApplyRetry(const model::TransferDescriptor& descriptor, const model::TransferError& error,
                                      bool immediate) {
  const bool online = monitor_->CurrentState().is_online;
  const auto now    = util::Now();

  auto attempted          = descriptor;
  attempted.attempt_count = descriptor.attempt_count + 1;

  const auto next = immediate ? now
                              : retry_->ScheduleRetry(attempted, now,
                                                      online ? retry::RetryClass::kApplicationFailure
                                                             : retry::RetryClass::kReconnect);

  queue::FailureUpdate update;
  update.error            = error;
  update.attempt_count    = attempted.attempt_count;
  update.next_eligible_at = next;
  update.offline          = !online;
  update.max_attempts     = max_attempts_;
  const auto updated      = queue_->ApplyFailure(descriptor.id, update);

  TransferEvent event;
  event.transfer_id = descriptor.id;
  event.error_kind  = error.kind;
  event.message     = error.message;
  event.attempt     = updated.attempt_count;

  if (updated.status == TransferStatus::kFailedPermanently) {
    MEDSYNC_LOG_ERROR("transfer failed permanently", {observability::StringField("transfer_id", descriptor.id),
                                                      observability::UintField("attempts", updated.attempt_count),
                                                      observability::StringField("error_kind", model::ToString(error.kind)),
                                                      observability::StringField("error", error.message)});
    event.type = TransferEventType::kFailed;
    Emit(std::move(event));
    return;
  }

  event.type        = TransferEventType::kRetryScheduled;
  event.retry_delay = std::chrono::duration_cast<std::chrono::milliseconds>(next - now);
  MEDSYNC_LOG_WARN("transfer attempt failed", {observability::StringField("transfer_id", descriptor.id),
                                               observability::UintField("attempt", updated.attempt_count),
                                               observability::StringField("error_kind", model::ToString(error.kind)),
                                               observability::StringField("status", model::ToString(updated.status)),
                                               observability::IntField("retry_in_ms", event.retry_delay.count()),
                                               observability::StringField("error", error.message)});
  Emit(std::move(event));
}

void ReconciliationEngine::HoldAndPause(const model::TransferDescriptor& descriptor, const model::TransferError& error,
                                        TransferEventType notice) {
  queue_->ReleaseClaim(descriptor.id, util::Now());
  Pause();

  TransferEvent event;
  event.type        = notice;
  event.transfer_id = descriptor.id;
  event.error_kind  = error.kind;
  event.message     = error.message;
  Emit(std::move(event));
}

void ReconciliationEngine::RecoverClaim(const model::TransferDescriptor& descriptor, const std::string& reason) {
  std::string failure = reason;
  try {
    const auto current = queue_->Get(descriptor.id);
    if (!current || current->status != TransferStatus::kUploading) {
      return;
    }
    const auto next = retry_->ScheduleRetry(*current, util::Now(), retry::RetryClass::kApplicationFailure);
    queue_->ReleaseClaim(descriptor.id, next);
    MEDSYNC_LOG_WARN("transfer released for another attempt", {observability::StringField("transfer_id", descriptor.id),
                                                               observability::UintField("offset", current->offset)});
    return;
  } catch (const std::exception& e) {
    failure = e.what();
  }

  // Still Uploading in memory; the next Load recovers it to Pending.
  MEDSYNC_LOG_ERROR("transfer held until restart", {observability::StringField("transfer_id", descriptor.id),
                                                    observability::StringField("error", failure)});

  TransferEvent event;
  event.type        = TransferEventType::kFailed;
  event.transfer_id = descriptor.id;
  event.error_kind  = ErrorKind::kStorageCorruption;
  event.message     = "transfer state could not be recorded: " + failure;
  event.bytes_sent  = descriptor.offset;
  event.total_bytes = descriptor.payload.total_size;
  event.attempt     = descriptor.attempt_count + 1;
  Emit(std::move(event));
}

void ReconciliationEngine::Finish(const std::string& id, const util::CancellationToken& cancel) {
  std::optional<model::TransferDescriptor> removed;
  {
    std::lock_guard lock(mutex_);
    tokens_.erase(id);
    if (in_flight_ > 0) {
      --in_flight_;
    }
    wake_ = true;

    // Cancel() found the token after the outcome was recorded. It is gone now,
    // so nobody else drops the transfer.
    if (cancel.Reason() == util::CancelReason::kUser) {
      try {
        removed = queue_->Remove(id);
      } catch (const std::exception& e) {
        MEDSYNC_LOG_ERROR("failed to remove cancelled transfer", {observability::StringField("transfer_id", id),
                                                                  observability::StringField("error", e.what())});
      }
    }
  }
  cv_.notify_all();

  if (removed) {
    DiscardRemoved(*removed);
  }
}

void ReconciliationEngine::OnConnectionChange(const model::ConnectionState& previous,
                                              const model::ConnectionState& current) {
  retry_->OnConnectionChange(current);

  if (previous.is_online && !current.is_online) {
    try {
      const auto moved = queue_->MarkAllOffline();
      MEDSYNC_LOG_INFO("connectivity lost; transfers held", {observability::UintField("held", moved)});
    } catch (const std::exception& e) {
      MEDSYNC_LOG_ERROR("failed to hold transfers offline", {observability::StringField("error", e.what())});
    }
  }
  Drain();
}

void ReconciliationEngine::OnReconnect() {
  try {
    const auto restored = queue_->RestoreOffline(util::Now());
    MEDSYNC_LOG_INFO("offline transfers restored", {observability::UintField("restored", restored)});
  } catch (const std::exception& e) {
    MEDSYNC_LOG_ERROR("failed to restore offline transfers", {observability::StringField("error", e.what())});
  }
  Drain();
}

void ReconciliationEngine::DiscardRemoved(const model::TransferDescriptor& descriptor) {
  spool_->Discard(descriptor.payload);

  if (!descriptor.session_id.empty()) {
    transport::RequestOptions options;
    options.timeout = kCancelSessionTimeout;
    if (auto error = transport_->CancelSession(descriptor.session_id, options); !error.ok()) {
      MEDSYNC_LOG_WARN("server session cancel failed", {observability::StringField("transfer_id", descriptor.id),
                                                        observability::StringField("session_id", descriptor.session_id),
                                                        observability::StringField("error", error.message)});
    }
  }

  MEDSYNC_LOG_INFO("transfer cancelled", {observability::StringField("transfer_id", descriptor.id),
                                          observability::UintField("offset", descriptor.offset)});

  TransferEvent event;
  event.type        = TransferEventType::kCancelled;
  event.transfer_id = descriptor.id;
  event.bytes_sent  = descriptor.offset;
  event.total_bytes = descriptor.payload.total_size;
  event.error_kind  = ErrorKind::kCancelled;
  Emit(std::move(event));
}

void ReconciliationEngine::Emit(TransferEvent event) {
  const auto type = event.type;
  const auto id   = event.transfer_id;
  if (!events_->Publish(std::move(event))) {
    MEDSYNC_LOG_WARN("transfer event not delivered", {observability::StringField("transfer_id", id),
                                                      observability::StringField("event", events::ToString(type))});
  }
}

} // namespace medsync::reconcile
