#include "internal/retry/retry_scheduler.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"

namespace medsync::retry {

namespace {

// 2^30 seconds is far past any cap.
constexpr uint32_t kMaxExponent = 30;

} // namespace

RetryScheduler::RetryScheduler(config::RetryOptions options) : RetryScheduler(options, std::random_device{}()) {
}

RetryScheduler::RetryScheduler(config::RetryOptions options, uint64_t seed) : options_(options), rng_(seed) {
}

std::chrono::milliseconds RetryScheduler::ComputeDelay(uint32_t attempt_count, RetryClass retry_class) {
  const auto exponent = std::min(attempt_count, kMaxExponent);
  const auto base_ms  = static_cast<double>(options_.base_delay.count());
  double     delay_ms = base_ms * static_cast<double>(uint64_t{1} << exponent);

  if (options_.jitter_ratio > 0.0) {
    std::uniform_real_distribution<double> jitter(0.0, options_.jitter_ratio);
    std::lock_guard                        lock(mutex_);
    delay_ms += delay_ms * jitter(rng_);
  }

  const auto cap = retry_class == RetryClass::kReconnect ? options_.reconnect_max_delay : options_.failure_max_delay;
  delay_ms       = std::min(delay_ms, static_cast<double>(cap.count()));
  return std::chrono::milliseconds(static_cast<int64_t>(delay_ms));
}

util::TimePoint RetryScheduler::ScheduleRetry(const model::TransferDescriptor& descriptor, util::TimePoint now,
                                              RetryClass retry_class) {
  const auto delay = ComputeDelay(descriptor.attempt_count, retry_class);
  MEDSYNC_LOG_DEBUG("retry scheduled",
                    {observability::StringField("transfer_id", descriptor.id),
                     observability::UintField("attempt", descriptor.attempt_count),
                     observability::IntField("delay_ms", delay.count()),
                     observability::StringField("class", retry_class == RetryClass::kReconnect ? "reconnect" : "failure")});
  return now + delay;
}

std::chrono::milliseconds RetryScheduler::ChunkRetryDelay(uint32_t attempt) const {
  const auto exponent = std::min(attempt > 0 ? attempt - 1 : 0, kMaxExponent);
  const auto delay    = options_.chunk_retry_base * static_cast<int64_t>(uint64_t{1} << exponent);
  return std::min<std::chrono::milliseconds>(delay, options_.reconnect_max_delay);
}

void RetryScheduler::SetReconnectHandler(ReconnectHandler handler) {
  std::lock_guard lock(mutex_);
  reconnect_handler_ = std::move(handler);
}

void RetryScheduler::OnConnectionChange(const model::ConnectionState& state) {
  ReconnectHandler handler;
  {
    std::lock_guard lock(mutex_);
    const bool reconnected = last_online_.has_value() && !*last_online_ && state.is_online;
    last_online_           = state.is_online;
    if (!reconnected) {
      return;
    }
    handler = reconnect_handler_;
  }

  MEDSYNC_LOG_INFO("connectivity restored; re-evaluating offline transfers");
  if (handler) {
    handler();
  }
}

} // namespace medsync::retry
