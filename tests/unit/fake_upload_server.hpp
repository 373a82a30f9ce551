#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/connection/health_probe.hpp"
#include "internal/transport/upload_transport.hpp"

namespace medsync::testing {

/*
  In-process upload server. Reassembles chunks per session so tests can
  compare checksums, records every call, and fails calls on demand.
*/
class FakeUploadServer final : public transport::UploadTransport, public connection::HealthProbe {
 public:
  struct ChunkCall {
    std::string session_id;
    uint64_t    offset = 0;
    std::size_t size   = 0;
  };

  struct Session {
    std::string transfer_id;
    uint64_t    total_size = 0;
    std::string bytes;
    bool        completed = false;
    bool        cancelled = false;
  };

  transport::Response<transport::SessionInfo> CreateSession(const model::TransferDescriptor& descriptor, uint64_t,
                                                            const transport::RequestOptions&) override {
    std::lock_guard lock(mutex_);
    ++create_calls_;
    if (auto error = TakeFailure(create_failures_); !error.ok()) {
      return transport::Response<transport::SessionInfo>::Err(error);
    }
    const auto id = "session-" + std::to_string(++next_session_);
    sessions_[id].transfer_id = descriptor.id;
    sessions_[id].total_size  = descriptor.payload.total_size;
    return transport::Response<transport::SessionInfo>::Ok({id, 0});
  }

  transport::Response<transport::ChunkAck> SendChunk(const transport::ChunkRequest& chunk,
                                                     const transport::RequestOptions& options) override {
    std::chrono::milliseconds delay{0};
    bool                      honour_cancel = true;
    {
      std::lock_guard lock(mutex_);
      chunk_calls_.push_back({chunk.session_id, chunk.offset, chunk.size});
      ++active_;
      max_active_ = std::max(max_active_, active_);
      delay         = chunk_delay_;
      honour_cancel = !ignore_cancel_;
    }
    if (delay.count() > 0 && options.cancel != nullptr && honour_cancel) {
      options.cancel->WaitFor(delay);
    } else if (delay.count() > 0) {
      std::this_thread::sleep_for(delay);
    }

    std::lock_guard lock(mutex_);
    --active_;
    if (honour_cancel && options.cancel != nullptr && options.cancel->IsCancelled()) {
      return transport::Response<transport::ChunkAck>::Err(
          model::TransferError::Make(model::ErrorKind::kCancelled, "aborted"));
    }
    if (auto error = TakeFailure(chunk_failures_); !error.ok()) {
      return transport::Response<transport::ChunkAck>::Err(error);
    }

    auto it = sessions_.find(chunk.session_id);
    if (it == sessions_.end()) {
      return transport::Response<transport::ChunkAck>::Err(
          model::TransferError::Make(model::ErrorKind::kProtocolDesync, "HTTP 404 unknown session", 404));
    }
    auto& session = it->second;
    if (session.completed) {
      transport::ChunkAck ack;
      ack.offset            = session.total_size;
      ack.session_completed = true;
      return transport::Response<transport::ChunkAck>::Ok(ack);
    }
    if (chunk.offset != session.bytes.size()) {
      return transport::Response<transport::ChunkAck>::Err(
          model::TransferError::Make(model::ErrorKind::kProtocolDesync, "HTTP 409 offset_mismatch", 409));
    }
    session.bytes.append(reinterpret_cast<const char*>(chunk.data), chunk.size);

    transport::ChunkAck ack;
    ack.offset = session.bytes.size() + ack_skew_;
    return transport::Response<transport::ChunkAck>::Ok(ack);
  }

  transport::Response<transport::CompletionInfo> Complete(const std::string& session_id,
                                                          const transport::RequestOptions&) override {
    std::lock_guard lock(mutex_);
    ++complete_calls_;
    if (auto error = TakeFailure(complete_failures_); !error.ok()) {
      return transport::Response<transport::CompletionInfo>::Err(error);
    }
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
      return transport::Response<transport::CompletionInfo>::Err(
          model::TransferError::Make(model::ErrorKind::kProtocolDesync, "HTTP 404 unknown session", 404));
    }
    transport::CompletionInfo info;
    info.result_id = "result-" + session_id;
    if (it->second.completed) {
      info.already_completed = true;
      return transport::Response<transport::CompletionInfo>::Ok(info);
    }
    if (it->second.bytes.size() != it->second.total_size) {
      return transport::Response<transport::CompletionInfo>::Err(
          model::TransferError::Make(model::ErrorKind::kProtocolDesync, "HTTP 409 incomplete", 409));
    }
    it->second.completed = true;
    ++completed_;
    return transport::Response<transport::CompletionInfo>::Ok(info);
  }

  transport::Response<transport::SessionStatus> QueryStatus(const std::string& session_id,
                                                            const transport::RequestOptions&) override {
    std::lock_guard lock(mutex_);
    auto            it = sessions_.find(session_id);
    if (it == sessions_.end()) {
      return transport::Response<transport::SessionStatus>::Err(
          model::TransferError::Make(model::ErrorKind::kProtocolDesync, "HTTP 404 unknown session", 404));
    }
    transport::SessionStatus status;
    status.session_id = session_id;
    status.offset     = it->second.bytes.size();
    status.total_size = it->second.total_size;
    status.state      = it->second.completed ? "completed" : "uploading";
    return transport::Response<transport::SessionStatus>::Ok(status);
  }

  model::TransferError CancelSession(const std::string& session_id, const transport::RequestOptions&) override {
    std::lock_guard lock(mutex_);
    ++cancel_calls_;
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
      return model::TransferError::Make(model::ErrorKind::kProtocolDesync, "HTTP 404 unknown session", 404);
    }
    it->second.cancelled = true;
    return {};
  }

  bool Probe(std::chrono::milliseconds) override {
    std::lock_guard lock(mutex_);
    return reachable_;
  }

  // ------------------------------------------------------------
  // Scripting
  // ------------------------------------------------------------

  void FailNextChunks(int count, model::ErrorKind kind, int http_status = 0) {
    std::lock_guard lock(mutex_);
    for (int i = 0; i < count; ++i) {
      chunk_failures_.push_back(model::TransferError::Make(kind, "scripted chunk failure", http_status));
    }
  }

  void FailNextCompletes(int count, model::ErrorKind kind, int http_status = 0) {
    std::lock_guard lock(mutex_);
    for (int i = 0; i < count; ++i) {
      complete_failures_.push_back(model::TransferError::Make(kind, "scripted completion failure", http_status));
    }
  }

  void FailNextCreates(int count, model::ErrorKind kind, int http_status = 0) {
    std::lock_guard lock(mutex_);
    for (int i = 0; i < count; ++i) {
      create_failures_.push_back(model::TransferError::Make(kind, "scripted create failure", http_status));
    }
  }

  void SetChunkDelay(std::chrono::milliseconds delay) {
    std::lock_guard lock(mutex_);
    chunk_delay_ = delay;
  }

  // Chunks run their full delay and return their scripted result even when cancelled.
  void SetIgnoreCancel(bool ignore) {
    std::lock_guard lock(mutex_);
    ignore_cancel_ = ignore;
  }

  // Acknowledge more bytes than were received.
  void SetAckSkew(uint64_t skew) {
    std::lock_guard lock(mutex_);
    ack_skew_ = skew;
  }

  void SetReachable(bool reachable) {
    std::lock_guard lock(mutex_);
    reachable_ = reachable;
  }

  // Marks the session complete as if another client had finished it.
  void CompleteOutOfBand(const std::string& session_id) {
    std::lock_guard lock(mutex_);
    auto& session     = sessions_.at(session_id);
    session.completed = true;
    ++completed_;
  }

  // ------------------------------------------------------------
  // Inspection
  // ------------------------------------------------------------

  std::vector<ChunkCall> ChunkCalls() const {
    std::lock_guard lock(mutex_);
    return chunk_calls_;
  }

  std::map<std::string, Session> Sessions() const {
    std::lock_guard lock(mutex_);
    return sessions_;
  }

  int CreateCalls() const {
    std::lock_guard lock(mutex_);
    return create_calls_;
  }

  int CompleteCalls() const {
    std::lock_guard lock(mutex_);
    return complete_calls_;
  }

  int CancelCalls() const {
    std::lock_guard lock(mutex_);
    return cancel_calls_;
  }

  int Completed() const {
    std::lock_guard lock(mutex_);
    return completed_;
  }

  int MaxConcurrentChunks() const {
    std::lock_guard lock(mutex_);
    return max_active_;
  }

 private:
  static model::TransferError TakeFailure(std::deque<model::TransferError>& failures) {
    if (failures.empty()) {
      return {};
    }
    auto error = failures.front();
    failures.pop_front();
    return error;
  }

  mutable std::mutex mutex_;

  std::map<std::string, Session> sessions_;
  std::vector<ChunkCall>         chunk_calls_;
  std::deque<model::TransferError> chunk_failures_;
  std::deque<model::TransferError> complete_failures_;
  std::deque<model::TransferError> create_failures_;

  std::chrono::milliseconds chunk_delay_{0};
  uint64_t                  ack_skew_  = 0;
  bool                      reachable_     = true;
  bool                      ignore_cancel_ = false;

  int next_session_   = 0;
  int create_calls_   = 0;
  int complete_calls_ = 0;
  int cancel_calls_   = 0;
  int completed_      = 0;
  int active_         = 0;
  int max_active_     = 0;
};

// ------------------------------------------------------------
// File helpers
// ------------------------------------------------------------

inline std::filesystem::path TempDir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "medsync_tests" / name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

inline std::string PatternBytes(std::size_t size, uint32_t seed = 7) {
  std::string bytes(size, '\0');
  uint32_t    state = seed;
  for (std::size_t i = 0; i < size; ++i) {
    state    = state * 1664525u + 1013904223u;
    bytes[i] = static_cast<char>(state >> 24);
  }
  return bytes;
}

inline std::string WriteFile(const std::filesystem::path& path, const std::string& bytes) {
  std::ofstream out(path, std::ios::binary);
  out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  out.close();
  return path.string();
}

// FNV-1a
inline uint64_t Checksum(const std::string& bytes) {
  uint64_t hash = 1469598103934665603ull;
  for (unsigned char c : bytes) {
    hash ^= c;
    hash *= 1099511628211ull;
  }
  return hash;
}

inline bool WaitUntil(const std::function<bool()>& predicate,
                      std::chrono::milliseconds timeout = std::chrono::milliseconds(10000)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return predicate();
}

} // namespace medsync::testing
