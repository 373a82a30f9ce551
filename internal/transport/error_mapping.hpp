#pragma once

#include <string_view>

#include "internal/model/transfer_error.hpp"

namespace medsync::transport {

enum class RequestKind {
  kCreateSession,
  kChunk,
  kComplete,
  kStatus,
  kCancel,
};

// `error_code` is ErrorResponse.error from the body when the server sent one.
model::TransferError ClassifyHttpStatus(long status, RequestKind kind, std::string_view error_code,
                                        std::string_view detail);

// `curl_code` is a CURLcode.
model::TransferError ClassifyCurlResult(int curl_code, std::string_view detail);

} // namespace medsync::transport
