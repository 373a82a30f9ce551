#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <random>

#include "internal/config/upload_options.hpp"
#include "internal/model/connection_state.hpp"
#include "internal/model/transfer_descriptor.hpp"

namespace medsync::retry {

enum class RetryClass {
  kReconnect,          // failure while the monitor reported offline
  kApplicationFailure, // failure with connectivity available
};

/*
  Backoff policy and reconnect trigger.

    delay = base * 2^attempt_count
    delay += delay * U[0, jitter_ratio)
    delay  = min(delay, cap(class))

  OnConnectionChange fires the reconnect handler on every offline -> online
  edge.
*/
class RetryScheduler {
 public:
  using ReconnectHandler = std::function<void()>;

  explicit RetryScheduler(config::RetryOptions options);
  RetryScheduler(config::RetryOptions options, uint64_t seed);

  std::chrono::milliseconds ComputeDelay(uint32_t attempt_count, RetryClass retry_class);

  util::TimePoint ScheduleRetry(const model::TransferDescriptor& descriptor, util::TimePoint now,
                                RetryClass retry_class = RetryClass::kApplicationFailure);

  // Short backoff between attempts of the same chunk (attempt starts at 1).
  std::chrono::milliseconds ChunkRetryDelay(uint32_t attempt) const;

  void SetReconnectHandler(ReconnectHandler handler);
  void OnConnectionChange(const model::ConnectionState& state);

 private:
  config::RetryOptions options_;

  std::mutex          mutex_;
  std::mt19937_64     rng_;
  ReconnectHandler    reconnect_handler_;
  std::optional<bool> last_online_;
};

} // namespace medsync::retry
