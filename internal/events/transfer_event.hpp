#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "internal/model/transfer_error.hpp"

namespace medsync::events {

enum class TransferEventType : std::uint8_t {
  kProgress       = 0, // advisory, may be dropped
  kRetryScheduled = 1,
  kCompleted      = 2,
  kFailed         = 3,
  kCancelled      = 4,
  kAuthRequired   = 5,
  kQueuePaused    = 6, // error_kind says why
};

const char* ToString(TransferEventType type);

struct TransferEvent {
  TransferEventType type = TransferEventType::kProgress;
  std::string       transfer_id;

  uint64_t bytes_sent  = 0;
  uint64_t total_bytes = 0;

  model::ErrorKind          error_kind = model::ErrorKind::kNone;
  std::string               message;
  uint32_t                  attempt = 0;
  std::chrono::milliseconds retry_delay{0};

  std::string result_id;
};

} // namespace medsync::events
