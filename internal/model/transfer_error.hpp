#pragma once

#include <cstdint>
#include <string>

namespace medsync::model {

// Numeric values match medsync.upload.v1.ErrorKind.
enum class ErrorKind : std::uint8_t {
  kNone              = 0,
  kNetworkTransient  = 1, // retry the same chunk, then the transfer
  kProtocolDesync    = 2, // restart the transfer from offset 0
  kAuthExpired       = 3, // pause the whole queue until re-authentication
  kPayloadInvalid    = 4, // fatal, descriptor is dropped
  kStorageCorruption = 5, // persisted entry skipped
  kCancelled         = 6,
  kEndpointInvalid   = 7, // server URL unusable as configured; pause the whole queue
};

const char* ToString(ErrorKind kind);

struct TransferError {
  ErrorKind   kind = ErrorKind::kNone;
  std::string message;
  int         http_status = 0;

  static TransferError Make(ErrorKind kind, std::string message, int http_status = 0) {
    return {kind, std::move(message), http_status};
  }

  bool ok() const {
    return kind == ErrorKind::kNone;
  }
};

} // namespace medsync::model
