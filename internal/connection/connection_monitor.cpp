#include "internal/connection/connection_monitor.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <vector>

#include "internal/observability/logging.hpp"

namespace medsync::connection {

using model::ConnectionQuality;
using model::ConnectionState;
using SteadyClock = std::chrono::steady_clock;

namespace {

constexpr double kGoodRatio     = 0.9;
constexpr double kFairRatio     = 0.7;
constexpr double kOfflineGrowth = 1.5;

bool Changed(const ConnectionState& a, const ConnectionState& b) {
  return a.is_online != b.is_online || a.quality != b.quality;
}

} // namespace

ConnectionMonitor::ConnectionMonitor(config::MonitorOptions options, std::shared_ptr<HealthProbe> probe,
                                     std::shared_ptr<PlatformSignal> platform)
    : options_(options), probe_(std::move(probe)), platform_(std::move(platform)) {
  if (options_.window_size == 0) {
    options_.window_size = 1;
  }
  // Optimistic until a probe or the platform says otherwise.
  state_.platform_online = true;
  state_                 = ComputeLocked();
}

ConnectionMonitor::~ConnectionMonitor() {
  Stop();
}

void ConnectionMonitor::Start() {
  {
    std::lock_guard lock(mutex_);
    if (running_) {
      return;
    }
    running_   = true;
    probe_now_ = true;
  }
  thread_ = std::thread(&ConnectionMonitor::Run, this);
  MEDSYNC_LOG_INFO("connection monitor started",
                   {observability::BoolField("platform_signal", platform_ != nullptr),
                    observability::UintField("window_size", options_.window_size)});
}

void ConnectionMonitor::Stop() {
  {
    std::lock_guard lock(mutex_);
    if (!running_) {
      return;
    }
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
  MEDSYNC_LOG_INFO("connection monitor stopped");
}

ConnectionState ConnectionMonitor::CurrentState() const {
  std::lock_guard lock(mutex_);
  return state_;
}

uint64_t ConnectionMonitor::Subscribe(Listener listener) {
  std::lock_guard lock(mutex_);
  const auto      id = next_listener_id_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

void ConnectionMonitor::Unsubscribe(uint64_t id) {
  std::lock_guard lock(mutex_);
  listeners_.erase(id);
}

void ConnectionMonitor::OnPlatformSignal(bool online) {
  ConnectionState previous;
  ConnectionState current;
  {
    std::lock_guard lock(mutex_);
    if (state_.platform_online == online) {
      return;
    }
    previous               = state_;
    state_.platform_online = online;
    if (online) {
      // confirm with a probe instead of waiting out the backoff
      probe_now_ = true;
    } else {
      offline_backoff_step_ = 0;
    }
    state_  = ComputeLocked();
    current = state_;
  }
  cv_.notify_all();

  MEDSYNC_LOG_INFO("platform connectivity signal", {observability::BoolField("online", online)});
  if (Changed(previous, current)) {
    Publish(previous, current);
  }
}

void ConnectionMonitor::RecordProbeResult(bool ok) {
  ConnectionState previous;
  ConnectionState current;
  bool            corrected = false;
  {
    std::lock_guard lock(mutex_);
    previous = state_;

    window_.push_back(ok);
    while (window_.size() > options_.window_size) {
      window_.pop_front();
    }

    if (ok) {
      ++state_.consecutive_successes;
      state_.consecutive_failures = 0;
      if (!state_.platform_online) {
        state_.platform_online = true;
        corrected              = true;
      }
    } else {
      ++state_.consecutive_failures;
      state_.consecutive_successes = 0;
    }

    state_ = ComputeLocked();
    if (state_.is_online) {
      offline_backoff_step_ = 0;
    } else if (!ok && !previous.is_online) {
      ++offline_backoff_step_;
    }
    current = state_;
  }

  if (corrected) {
    MEDSYNC_LOG_INFO("probe succeeded while platform reported offline; treating as online");
  }
  if (Changed(previous, current)) {
    Publish(previous, current);
  }
}

void ConnectionMonitor::ProbeNow() {
  {
    std::lock_guard lock(mutex_);
    probe_now_ = true;
  }
  cv_.notify_all();
}

std::chrono::milliseconds ConnectionMonitor::NextProbeDelay() const {
  std::lock_guard lock(mutex_);
  return NextProbeDelayLocked();
}

void ConnectionMonitor::Run() {
  auto next_probe = SteadyClock::now();
  auto next_poll  = SteadyClock::now();

  std::unique_lock lock(mutex_);
  while (running_) {
    auto wake = next_probe;
    if (platform_) {
      wake = std::min(wake, next_poll);
    }
    cv_.wait_until(lock, wake, [&] { return !running_ || probe_now_; });
    if (!running_) {
      break;
    }

    if (platform_ && SteadyClock::now() >= next_poll) {
      lock.unlock();
      const auto reading = platform_->IsOnline();
      if (reading && reading != last_platform_reading_) {
        last_platform_reading_ = reading;
        OnPlatformSignal(*reading);
      }
      lock.lock();
      next_poll = SteadyClock::now() + options_.platform_poll_interval;
    }

    if (probe_now_ || SteadyClock::now() >= next_probe) {
      probe_now_ = false;
      lock.unlock();

      bool ok = false;
      try {
        ok = probe_ && probe_->Probe(options_.probe_timeout);
      } catch (const std::exception& e) {
        MEDSYNC_LOG_WARN("health probe threw", {observability::StringField("error", e.what())});
      }
      RecordProbeResult(ok);

      lock.lock();
      next_probe = SteadyClock::now() + NextProbeDelayLocked();
    }
  }
}

void ConnectionMonitor::Publish(const ConnectionState& previous, const ConnectionState& current) {
  MEDSYNC_LOG_INFO("connection state changed",
                   {observability::BoolField("online", current.is_online),
                    observability::StringField("quality", model::ToString(current.quality)),
                    observability::StringField("previous_quality", model::ToString(previous.quality)),
                    observability::UintField("consecutive_failures", current.consecutive_failures)});

  std::vector<Listener> listeners;
  {
    std::lock_guard lock(mutex_);
    listeners.reserve(listeners_.size());
    for (const auto& [id, listener] : listeners_) {
      listeners.push_back(listener);
    }
  }
  for (const auto& listener : listeners) {
    listener(previous, current);
  }
}

ConnectionState ConnectionMonitor::ComputeLocked() const {
  ConnectionState next = state_;

  std::size_t successes = 0;
  for (bool ok : window_) {
    successes += ok ? 1 : 0;
  }
  next.window_success_ratio =
      window_.empty() ? 1.0 : static_cast<double>(successes) / static_cast<double>(window_.size());

  if (!next.platform_online || next.consecutive_failures >= options_.offline_failure_threshold) {
    next.is_online = false;
    next.quality   = ConnectionQuality::kOffline;
    return next;
  }

  next.is_online = true;
  if (next.window_success_ratio > kGoodRatio) {
    next.quality = ConnectionQuality::kGood;
  } else if (next.window_success_ratio > kFairRatio) {
    next.quality = ConnectionQuality::kFair;
  } else {
    next.quality = ConnectionQuality::kPoor;
  }
  return next;
}

std::chrono::milliseconds ConnectionMonitor::NextProbeDelayLocked() const {
  if (state_.is_online) {
    return options_.online_probe_interval;
  }
  const double scaled = static_cast<double>(options_.offline_probe_initial.count()) *
                        std::pow(kOfflineGrowth, static_cast<double>(offline_backoff_step_));
  const double capped = std::min(scaled, static_cast<double>(options_.offline_probe_max.count()));
  return std::chrono::milliseconds(static_cast<int64_t>(capped));
}

} // namespace medsync::connection
