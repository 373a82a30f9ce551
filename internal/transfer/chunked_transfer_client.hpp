#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "internal/config/upload_options.hpp"
#include "internal/model/connection_state.hpp"
#include "internal/model/transfer_descriptor.hpp"
#include "internal/queue/checkpoint_store.hpp"
#include "internal/retry/retry_scheduler.hpp"
#include "internal/transport/upload_transport.hpp"
#include "internal/util/cancellation.hpp"

namespace medsync::transfer {

using ProgressFn = std::function<void(uint64_t bytes_sent, uint64_t total_bytes)>;
using QualityFn  = std::function<model::ConnectionQuality()>;

struct Completion {
  std::string result_id;
  bool        already_completed = false;
  // Payload bytes sent during this call (0 on a pure completion resume).
  uint64_t bytes_sent = 0;
};

using UploadResult = transport::Response<Completion>;

// good x1, fair x2, poor/offline x4
std::chrono::milliseconds ChunkTimeoutFor(std::chrono::milliseconds base, model::ConnectionQuality quality);

/*
  Runs the resumable chunked protocol for one descriptor.

  - creates a server session when the descriptor has none
  - sends chunks from descriptor.offset, checkpointing after every ack
  - retries a chunk up to chunk_retry_attempts on NetworkTransient
  - on desync resets the durable offset to 0 and drops the session
  - finishes with the completion handshake; "already completed" is success

  `descriptor` is updated in place (offset, session_id) alongside the
  checkpoints. The caller owns the descriptor's status.
*/
class ChunkedTransferClient {
 public:
  ChunkedTransferClient(config::TransferOptions options, std::shared_ptr<transport::UploadTransport> transport,
                        std::shared_ptr<queue::CheckpointStore> checkpoints, std::shared_ptr<retry::RetryScheduler> retry,
                        QualityFn quality);

  UploadResult Upload(model::TransferDescriptor& descriptor, const util::CancellationToken& cancel,
                      const ProgressFn& on_progress);

 private:
  UploadResult Restart(model::TransferDescriptor& descriptor, model::TransferError error);
  UploadResult Finish(model::TransferDescriptor& descriptor, const util::CancellationToken& cancel, uint64_t bytes_sent);

  model::TransferError Checkpoint(const model::TransferDescriptor& descriptor);

  transport::RequestOptions Request(std::chrono::milliseconds timeout, const util::CancellationToken& cancel) const;

  config::TransferOptions                    options_;
  std::shared_ptr<transport::UploadTransport> transport_;
  std::shared_ptr<queue::CheckpointStore>     checkpoints_;
  std::shared_ptr<retry::RetryScheduler>      retry_;
  QualityFn                                   quality_;
};

} // namespace medsync::transfer
