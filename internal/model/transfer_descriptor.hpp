#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "internal/model/transfer_error.hpp"
#include "internal/model/transfer_status.hpp"
#include "internal/util/time.hpp"

namespace medsync::model {

// Numeric values match medsync.upload.v1.Modality.
enum class Modality : std::uint8_t {
  kUnspecified = 0,
  kXray        = 1,
  kMri         = 2,
  kCt          = 3,
  kReport      = 4,
};

const char*             ToString(Modality modality);
std::optional<Modality> ParseModality(std::string_view value);

/*
  Where the bytes live.

  In-memory submissions are spooled to a file first, so every queued payload
  is addressable by path and survives a restart.
*/
struct PayloadRef {
  std::string path;
  uint64_t    total_size = 0;
  std::string file_name;
  std::string content_type;
  bool        spooled = false;
};

struct Destination {
  Modality                           modality = Modality::kUnspecified;
  std::string                        model_id;
  std::map<std::string, std::string> metadata;
};

/*
  Durable record of one pending or in-progress upload.

  IMPORTANT:
  - 0 <= offset <= payload.total_size
  - offset only decreases on an explicit protocol restart (back to 0)
  - status changes follow CanTransition()
*/
struct TransferDescriptor {
  std::string id;
  PayloadRef  payload;
  Destination destination;

  uint64_t       offset = 0;
  TransferStatus status = TransferStatus::kPending;

  uint32_t        attempt_count = 0;
  util::TimePoint last_attempt_at{};
  util::TimePoint created_at{};
  std::string     last_error;
  ErrorKind       last_error_kind = ErrorKind::kNone;

  std::string     session_id;
  util::TimePoint next_eligible_at{};
  int32_t         priority = 0;
  uint64_t        sequence = 0;
  std::string     result_id;
};

} // namespace medsync::model
