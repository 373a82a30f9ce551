#pragma once

#include <chrono>

namespace medsync::connection {

// One reachability check against the upload service.
class HealthProbe {
 public:
  virtual ~HealthProbe() = default;

  virtual bool Probe(std::chrono::milliseconds timeout) = 0;
};

} // namespace medsync::connection
