#pragma once

#include <arrow/buffer.h>
#include <arrow/result.h>

#include <memory>
#include <string>

#include "internal/model/transfer_descriptor.hpp"

namespace medsync::payload {

/*
  On-disk home for in-memory submissions.

  A buffer handed to SubmitUpload is written to <dir>/<transfer id>.bin before
  the descriptor is queued; the file is deleted once the transfer leaves the
  queue (success, cancellation, clear).
*/
class PayloadSpool {
 public:
  explicit PayloadSpool(std::string directory);

  arrow::Result<std::string> Write(const std::string& transfer_id, const std::shared_ptr<arrow::Buffer>& buffer);

  // No-op for caller-owned files.
  void Discard(const model::PayloadRef& payload) const;

  const std::string& Directory() const {
    return directory_;
  }

 private:
  std::string directory_;
};

} // namespace medsync::payload
