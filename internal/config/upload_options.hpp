#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace medsync::config {

using std::chrono::milliseconds;

struct ServerOptions {
  // Scheme + host (+ optional prefix); request paths are appended verbatim.
  std::string  base_url;
  std::string  health_path = "/api/health";
  milliseconds connect_timeout{10'000};
  bool         verify_tls = true;
};

struct AuthOptions {
  std::string token;
  // Re-read on every request so an external re-login takes effect immediately.
  std::string token_file;
};

struct QueueOptions {
  enum class Backend { kSqlite, kMemory };

  Backend     backend     = Backend::kSqlite;
  std::string sqlite_path = "medsync-queue.db";
  std::string synchronous = "FULL";
  // In-memory submissions are written here before they are queued.
  std::string spool_dir = "medsync-spool";
};

struct TransferOptions {
  // Final chunk may be shorter.
  uint64_t chunk_size_bytes = 5ull * 1024 * 1024;
  // K: sends of one chunk before NetworkTransient is surfaced to the engine.
  uint32_t chunk_retry_attempts = 3;
  // Transfer attempts before a descriptor is demoted to FailedPermanently.
  uint32_t max_attempts = 8;
  // Per-chunk request timeout at `good` quality; x2 at `fair`, x4 at `poor`.
  milliseconds chunk_timeout{60'000};
  milliseconds session_timeout{15'000};
  milliseconds completion_timeout{30'000};
};

struct RetryOptions {
  milliseconds base_delay{1'000};
  // Cap for retries caused by lost connectivity.
  milliseconds reconnect_max_delay{30'000};
  // Cap for repeated failures while the link looked healthy.
  milliseconds failure_max_delay{600'000};
  // Added jitter is uniform in [0, delay * jitter_ratio).
  double jitter_ratio = 0.2;
  // Base delay between sends of the same chunk.
  milliseconds chunk_retry_base{1'000};
};

struct ReconcileOptions {
  // Maximum descriptors in Uploading at once.
  uint32_t concurrency = 3;
  // Progress events beyond this are dropped; terminal events never are.
  std::size_t event_capacity = 256;
};

struct MonitorOptions {
  milliseconds online_probe_interval{30'000};
  milliseconds offline_probe_initial{1'000};
  milliseconds offline_probe_max{30'000};
  milliseconds probe_timeout{5'000};
  milliseconds platform_poll_interval{2'000};
  // Sliding window of probe outcomes used for quality.
  uint32_t window_size = 20;
  // Consecutive probe failures that force `offline` regardless of the platform.
  uint32_t offline_failure_threshold = 5;
  bool     platform_signal_enabled   = true;
};

/*
  Every option the upload engine recognizes, with its default.
*/
struct UploadOptions {
  ServerOptions    server;
  AuthOptions      auth;
  QueueOptions     queue;
  TransferOptions  transfer;
  RetryOptions     retry;
  ReconcileOptions reconcile;
  MonitorOptions   monitor;
};

} // namespace medsync::config
