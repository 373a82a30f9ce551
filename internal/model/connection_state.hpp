#pragma once

#include <cstdint>

namespace medsync::model {

enum class ConnectionQuality : std::uint8_t {
  kGood    = 0,
  kFair    = 1,
  kPoor    = 2,
  kOffline = 3,
};

const char* ToString(ConnectionQuality quality);

struct ConnectionState {
  bool              is_online            = false;
  ConnectionQuality quality              = ConnectionQuality::kOffline;
  uint32_t          consecutive_failures = 0;
  uint32_t          consecutive_successes = 0;

  // Last coarse platform signal, corrected by successful probes.
  bool   platform_online      = false;
  double window_success_ratio = 1.0;

  bool operator==(const ConnectionState&) const = default;
};

} // namespace medsync::model
