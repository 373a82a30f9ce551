#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include "internal/config/upload_options.hpp"
#include "internal/connection/health_probe.hpp"
#include "internal/connection/platform_signal.hpp"
#include "internal/model/connection_state.hpp"

namespace medsync::connection {

/*
  Classifies connectivity from platform signals and active health probes.

  - quality comes from a sliding window of probe outcomes
    (> 0.9 good, > 0.7 fair, otherwise poor)
  - platform offline forces offline; so does a run of consecutive probe
    failures at or above the configured threshold
  - a successful probe while the platform says offline corrects the
    platform state (synthetic online)

  Probing cadence: every online_probe_interval while online, and
  offline_probe_initial * 1.5^n (capped) while offline.

  Listeners run on the thread that caused the change, outside the lock.
*/
class ConnectionMonitor {
 public:
  using Listener = std::function<void(const model::ConnectionState& previous, const model::ConnectionState& current)>;

  ConnectionMonitor(config::MonitorOptions options, std::shared_ptr<HealthProbe> probe,
                    std::shared_ptr<PlatformSignal> platform);
  ~ConnectionMonitor();

  ConnectionMonitor(const ConnectionMonitor&)            = delete;
  ConnectionMonitor& operator=(const ConnectionMonitor&) = delete;

  void Start();
  void Stop();

  model::ConnectionState CurrentState() const;

  uint64_t Subscribe(Listener listener);
  void     Unsubscribe(uint64_t id);

  void OnPlatformSignal(bool online);
  void RecordProbeResult(bool ok);

  // Wakes the probe thread for an immediate probe.
  void ProbeNow();

  // Delay until the next scheduled probe given the current state.
  std::chrono::milliseconds NextProbeDelay() const;

 private:
  void Run();
  void Publish(const model::ConnectionState& previous, const model::ConnectionState& current);

  model::ConnectionState    ComputeLocked() const;
  std::chrono::milliseconds NextProbeDelayLocked() const;

  config::MonitorOptions          options_;
  std::shared_ptr<HealthProbe>    probe_;
  std::shared_ptr<PlatformSignal> platform_;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;

  model::ConnectionState state_;
  std::deque<bool>       window_;
  uint32_t               offline_backoff_step_ = 0;
  bool                   probe_now_            = false;
  bool                   running_              = false;

  std::map<uint64_t, Listener> listeners_;
  uint64_t                     next_listener_id_ = 1;

  // Last raw platform reading; only touched by the monitor thread.
  std::optional<bool> last_platform_reading_;

  std::thread thread_;
};

} // namespace medsync::connection
