#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "internal/model/transfer_descriptor.hpp"
#include "internal/model/transfer_error.hpp"
#include "internal/util/cancellation.hpp"

namespace medsync::transport {

struct RequestOptions {
  std::chrono::milliseconds      timeout{60000};
  const util::CancellationToken* cancel = nullptr;
};

template <typename T>
struct Response {
  T                    value{};
  model::TransferError error;

  static Response Ok(T value) {
    Response r;
    r.value = std::move(value);
    return r;
  }

  static Response Err(model::TransferError error) {
    Response r;
    r.error = std::move(error);
    return r;
  }

  explicit operator bool() const {
    return error.ok();
  }
};

struct SessionInfo {
  std::string session_id;
  uint64_t    offset = 0;
};

struct ChunkRequest {
  std::string    session_id;
  uint64_t       offset     = 0;
  uint64_t       total_size = 0;
  const uint8_t* data       = nullptr;
  std::size_t    size       = 0;
};

struct ChunkAck {
  uint64_t offset = 0;
  // Server already finalized this session; nothing more to send.
  bool session_completed = false;
};

struct CompletionInfo {
  std::string result_id;
  bool        already_completed = false;
};

struct SessionStatus {
  std::string session_id;
  uint64_t    offset     = 0;
  uint64_t    total_size = 0;
  std::string state;
};

/*
  Resumable upload protocol.

  Every call returns a classified TransferError instead of throwing: the
  chunked client and the engine route on ErrorKind.
*/
class UploadTransport {
 public:
  virtual ~UploadTransport() = default;

  virtual Response<SessionInfo> CreateSession(const model::TransferDescriptor& descriptor, uint64_t chunk_size,
                                              const RequestOptions& options) = 0;

  virtual Response<ChunkAck> SendChunk(const ChunkRequest& chunk, const RequestOptions& options) = 0;

  virtual Response<CompletionInfo> Complete(const std::string& session_id, const RequestOptions& options) = 0;

  virtual Response<SessionStatus> QueryStatus(const std::string& session_id, const RequestOptions& options) = 0;

  virtual model::TransferError CancelSession(const std::string& session_id, const RequestOptions& options) = 0;
};

} // namespace medsync::transport
