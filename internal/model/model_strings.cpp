#include <algorithm>
#include <cctype>
#include <string>

#include "internal/model/connection_state.hpp"
#include "internal/model/transfer_descriptor.hpp"
#include "internal/model/transfer_error.hpp"
#include "internal/model/transfer_status.hpp"

namespace medsync::model {

const char* ToString(TransferStatus status) {
  switch (status) {
    case TransferStatus::kPending:
      return "pending";
    case TransferStatus::kUploading:
      return "uploading";
    case TransferStatus::kPendingOffline:
      return "pending_offline";
    case TransferStatus::kSucceeded:
      return "succeeded";
    case TransferStatus::kFailedPermanently:
      return "failed_permanently";
    case TransferStatus::kUnspecified:
      break;
  }
  return "unspecified";
}

const char* ToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNone:
      return "none";
    case ErrorKind::kNetworkTransient:
      return "network_transient";
    case ErrorKind::kProtocolDesync:
      return "protocol_desync";
    case ErrorKind::kAuthExpired:
      return "auth_expired";
    case ErrorKind::kPayloadInvalid:
      return "payload_invalid";
    case ErrorKind::kStorageCorruption:
      return "storage_corruption";
    case ErrorKind::kCancelled:
      return "cancelled";
    case ErrorKind::kEndpointInvalid:
      return "endpoint_invalid";
  }
  return "unknown";
}

const char* ToString(ConnectionQuality quality) {
  switch (quality) {
    case ConnectionQuality::kGood:
      return "good";
    case ConnectionQuality::kFair:
      return "fair";
    case ConnectionQuality::kPoor:
      return "poor";
    case ConnectionQuality::kOffline:
      return "offline";
  }
  return "unknown";
}

const char* ToString(Modality modality) {
  switch (modality) {
    case Modality::kXray:
      return "xray";
    case Modality::kMri:
      return "mri";
    case Modality::kCt:
      return "ct";
    case Modality::kReport:
      return "report";
    case Modality::kUnspecified:
      break;
  }
  return "unspecified";
}

std::optional<Modality> ParseModality(std::string_view value) {
  std::string lowered(value);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lowered == "xray" || lowered == "x-ray") return Modality::kXray;
  if (lowered == "mri") return Modality::kMri;
  if (lowered == "ct") return Modality::kCt;
  if (lowered == "report") return Modality::kReport;
  return std::nullopt;
}

} // namespace medsync::model
