#include "internal/transport/error_mapping.hpp"

#include <curl/curl.h>

#include <string>

namespace medsync::transport {

using model::ErrorKind;
using model::TransferError;

namespace {

std::string Describe(long status, std::string_view error_code, std::string_view detail) {
  std::string out = "HTTP " + std::to_string(status);
  if (!error_code.empty()) {
    out.append(" ").append(error_code);
  }
  if (!detail.empty()) {
    out.append(": ").append(detail);
  }
  return out;
}

} // namespace

TransferError ClassifyHttpStatus(long status, RequestKind kind, std::string_view error_code, std::string_view detail) {
  if (status >= 200 && status < 300) {
    return {};
  }

  const int  http    = static_cast<int>(status);
  const auto message = Describe(status, error_code, detail);

  if (status == 401 || status == 403) {
    return TransferError::Make(ErrorKind::kAuthExpired, message, http);
  }
  if (status == 408 || status == 425 || status == 429 || status >= 500) {
    return TransferError::Make(ErrorKind::kNetworkTransient, message, http);
  }
  if (status == 404 || status == 410) {
    // unknown destination on create, unknown session everywhere else
    if (kind == RequestKind::kCreateSession) {
      return TransferError::Make(ErrorKind::kPayloadInvalid, message, http);
    }
    return TransferError::Make(ErrorKind::kProtocolDesync, message, http);
  }
  if (status == 409) {
    return TransferError::Make(ErrorKind::kProtocolDesync, message, http);
  }
  if (status >= 400) {
    return TransferError::Make(ErrorKind::kPayloadInvalid, message, http);
  }
  // 1xx / 3xx after redirects were followed
  return TransferError::Make(ErrorKind::kNetworkTransient, message, http);
}

TransferError ClassifyCurlResult(int curl_code, std::string_view detail) {
  const auto code = static_cast<CURLcode>(curl_code);
  if (code == CURLE_OK) {
    return {};
  }

  std::string message = curl_easy_strerror(code);
  if (!detail.empty()) {
    message.append(": ").append(detail);
  }

  switch (code) {
    case CURLE_ABORTED_BY_CALLBACK:
      return TransferError::Make(ErrorKind::kCancelled, message);
    case CURLE_URL_MALFORMAT:
    case CURLE_UNSUPPORTED_PROTOCOL:
      return TransferError::Make(ErrorKind::kEndpointInvalid, "misconfigured endpoint: " + message);
    default:
      return TransferError::Make(ErrorKind::kNetworkTransient, message);
  }
}

} // namespace medsync::transport
