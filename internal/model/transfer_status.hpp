#pragma once

#include <cstdint>

namespace medsync::model {

// Numeric values match medsync.upload.v1.TransferStatus.
enum class TransferStatus : std::uint8_t {
  kUnspecified       = 0,
  kPending           = 1,
  kUploading         = 2,
  kPendingOffline    = 3,
  kSucceeded         = 4,
  kFailedPermanently = 5,
};

constexpr bool IsTerminal(TransferStatus status) {
  return status == TransferStatus::kSucceeded || status == TransferStatus::kFailedPermanently;
}

/*
  Allowed edges:

    Pending        -> Uploading | PendingOffline | FailedPermanently
    Uploading      -> Succeeded | Pending
    PendingOffline -> Pending

  FailedPermanently only leaves through an explicit caller reset (CanReset).
*/
constexpr bool CanTransition(TransferStatus from, TransferStatus to) {
  if (from == to) {
    return !IsTerminal(from) && from != TransferStatus::kUnspecified;
  }

  switch (from) {
    case TransferStatus::kPending:
      return to == TransferStatus::kUploading || to == TransferStatus::kPendingOffline ||
             to == TransferStatus::kFailedPermanently;
    case TransferStatus::kUploading:
      return to == TransferStatus::kSucceeded || to == TransferStatus::kPending;
    case TransferStatus::kPendingOffline:
      return to == TransferStatus::kPending;
    default:
      return false;
  }
}

constexpr bool CanReset(TransferStatus from) {
  return from == TransferStatus::kFailedPermanently;
}

const char* ToString(TransferStatus status);

} // namespace medsync::model
