#include "internal/transfer/chunked_transfer_client.hpp"

#include <algorithm>
#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/payload/payload_source.hpp"

namespace medsync::transfer {

using model::ErrorKind;
using model::TransferError;

namespace {

UploadResult Failed(ErrorKind kind, std::string message) {
  return UploadResult::Err(TransferError::Make(kind, std::move(message)));
}

UploadResult Cancelled() {
  return Failed(ErrorKind::kCancelled, "transfer cancelled");
}

} // namespace

std::chrono::milliseconds ChunkTimeoutFor(std::chrono::milliseconds base, model::ConnectionQuality quality) {
  switch (quality) {
    case model::ConnectionQuality::kGood:
      return base;
    case model::ConnectionQuality::kFair:
      return base * 2;
    case model::ConnectionQuality::kPoor:
    case model::ConnectionQuality::kOffline:
      return base * 4;
  }
  return base;
}

ChunkedTransferClient::ChunkedTransferClient(config::TransferOptions options,
                                             std::shared_ptr<transport::UploadTransport> transport,
                                             std::shared_ptr<queue::CheckpointStore>     checkpoints,
                                             std::shared_ptr<retry::RetryScheduler> retry, QualityFn quality)
    : options_(options),
      transport_(std::move(transport)),
      checkpoints_(std::move(checkpoints)),
      retry_(std::move(retry)),
      quality_(std::move(quality)) {
  if (options_.chunk_size_bytes == 0) {
    options_.chunk_size_bytes = config::TransferOptions{}.chunk_size_bytes;
  }
  if (options_.chunk_retry_attempts == 0) {
    options_.chunk_retry_attempts = 1;
  }
}

UploadResult ChunkedTransferClient::Upload(model::TransferDescriptor& descriptor, const util::CancellationToken& cancel,
                                           const ProgressFn& on_progress) {
  const uint64_t total = descriptor.payload.total_size;
  if (total == 0) {
    return Failed(ErrorKind::kPayloadInvalid, "payload is empty");
  }
  if (cancel.IsCancelled()) {
    return Cancelled();
  }

  auto opened = payload::PayloadSource::OpenFile(descriptor.payload.path);
  if (!opened.ok()) {
    return Failed(ErrorKind::kPayloadInvalid, "payload unreadable: " + opened.status().ToString());
  }
  auto source = opened.ValueOrDie();
  if (source->size() != total) {
    return Failed(ErrorKind::kPayloadInvalid, "payload size changed from " + std::to_string(total) + " to " +
                                                  std::to_string(source->size()) + " bytes");
  }

  if (descriptor.session_id.empty()) {
    if (descriptor.offset != 0) {
      // an offset without a session cannot be resumed
      auto restarted =
          Restart(descriptor, TransferError::Make(ErrorKind::kProtocolDesync, "offset recorded without a session"));
      if (restarted.error.kind == ErrorKind::kStorageCorruption) {
        return restarted;
      }
    }

    auto created =
        transport_->CreateSession(descriptor, options_.chunk_size_bytes, Request(options_.session_timeout, cancel));
    if (!created) {
      return UploadResult::Err(created.error);
    }
    descriptor.session_id = created.value.session_id;
    descriptor.offset     = 0;
    if (auto error = Checkpoint(descriptor); !error.ok()) {
      return UploadResult::Err(error);
    }
    MEDSYNC_LOG_INFO("upload session created", {observability::StringField("transfer_id", descriptor.id),
                                                observability::StringField("session_id", descriptor.session_id)});
  }

  uint64_t bytes_sent = 0;
  while (descriptor.offset < total) {
    if (cancel.IsCancelled()) {
      return Cancelled();
    }

    const uint64_t offset = descriptor.offset;
    const uint64_t length = std::min<uint64_t>(options_.chunk_size_bytes, total - offset);

    auto chunk = source->ReadAt(offset, length);
    if (!chunk.ok()) {
      return Failed(ErrorKind::kPayloadInvalid, "payload read failed: " + chunk.status().ToString());
    }
    const auto& bytes = *chunk;

    transport::ChunkRequest request;
    request.session_id = descriptor.session_id;
    request.offset     = offset;
    request.total_size = total;
    request.data       = bytes->data();
    request.size       = static_cast<std::size_t>(bytes->size());

    transport::Response<transport::ChunkAck> ack;
    for (uint32_t attempt = 1;; ++attempt) {
      const auto quality = quality_ ? quality_() : model::ConnectionQuality::kGood;
      ack                = transport_->SendChunk(request, Request(ChunkTimeoutFor(options_.chunk_timeout, quality), cancel));
      if (ack || ack.error.kind != ErrorKind::kNetworkTransient || attempt >= options_.chunk_retry_attempts) {
        break;
      }

      const auto delay = retry_->ChunkRetryDelay(attempt);
      MEDSYNC_LOG_WARN("chunk send failed; retrying", {observability::StringField("transfer_id", descriptor.id),
                                                       observability::UintField("offset", offset),
                                                       observability::UintField("attempt", attempt),
                                                       observability::IntField("delay_ms", delay.count()),
                                                       observability::StringField("error", ack.error.message)});
      if (!cancel.WaitFor(delay)) {
        return Cancelled();
      }
    }

    if (!ack) {
      if (ack.error.kind == ErrorKind::kProtocolDesync) {
        return Restart(descriptor, ack.error);
      }
      return UploadResult::Err(ack.error);
    }

    if (ack.value.session_completed) {
      MEDSYNC_LOG_INFO("server reports session already completed", {observability::StringField("transfer_id", descriptor.id)});
      break;
    }

    if (ack.value.offset != offset + length) {
      return Restart(descriptor, TransferError::Make(ErrorKind::kProtocolDesync,
                                                     "server acknowledged offset " + std::to_string(ack.value.offset) +
                                                         ", expected " + std::to_string(offset + length)));
    }

    descriptor.offset = ack.value.offset;
    if (auto error = Checkpoint(descriptor); !error.ok()) {
      return UploadResult::Err(error);
    }
    bytes_sent += length;

    if (on_progress) {
      on_progress(descriptor.offset, total);
    }
  }

  if (auto status = source->Close(); !status.ok()) {
    MEDSYNC_LOG_WARN("payload close failed", {observability::StringField("transfer_id", descriptor.id),
                                              observability::StringField("error", status.ToString())});
  }
  return Finish(descriptor, cancel, bytes_sent);
}

UploadResult ChunkedTransferClient::Finish(model::TransferDescriptor& descriptor, const util::CancellationToken& cancel,
                                           uint64_t bytes_sent) {
  transport::Response<transport::CompletionInfo> done;
  for (uint32_t attempt = 1;; ++attempt) {
    if (cancel.IsCancelled()) {
      return Cancelled();
    }
    done = transport_->Complete(descriptor.session_id, Request(options_.completion_timeout, cancel));
    if (done || done.error.kind != ErrorKind::kNetworkTransient || attempt >= options_.chunk_retry_attempts) {
      break;
    }
    if (!cancel.WaitFor(retry_->ChunkRetryDelay(attempt))) {
      return Cancelled();
    }
  }

  if (!done) {
    if (done.error.kind == ErrorKind::kProtocolDesync) {
      return Restart(descriptor, done.error);
    }
    return UploadResult::Err(done.error);
  }

  Completion completion;
  completion.result_id         = done.value.result_id;
  completion.already_completed = done.value.already_completed;
  completion.bytes_sent        = bytes_sent;

  MEDSYNC_LOG_INFO("upload completed", {observability::StringField("transfer_id", descriptor.id),
                                        observability::StringField("result_id", completion.result_id),
                                        observability::BoolField("already_completed", completion.already_completed),
                                        observability::UintField("bytes_sent", bytes_sent)});
  return UploadResult::Ok(std::move(completion));
}

UploadResult ChunkedTransferClient::Restart(model::TransferDescriptor& descriptor, TransferError error) {
  MEDSYNC_LOG_WARN("protocol desync; restarting from offset 0",
                   {observability::StringField("transfer_id", descriptor.id),
                    observability::UintField("offset", descriptor.offset),
                    observability::StringField("error", error.message)});
  try {
    checkpoints_->RestartFromZero(descriptor.id);
  } catch (const std::exception& e) {
    return Failed(ErrorKind::kStorageCorruption, std::string("restart checkpoint failed: ") + e.what());
  }
  descriptor.offset = 0;
  descriptor.session_id.clear();
  return UploadResult::Err(std::move(error));
}

TransferError ChunkedTransferClient::Checkpoint(const model::TransferDescriptor& descriptor) {
  try {
    checkpoints_->Checkpoint(descriptor.id, descriptor.offset, descriptor.session_id);
  } catch (const std::exception& e) {
    return TransferError::Make(ErrorKind::kStorageCorruption, std::string("checkpoint failed: ") + e.what());
  }
  return {};
}

transport::RequestOptions ChunkedTransferClient::Request(std::chrono::milliseconds timeout,
                                                         const util::CancellationToken& cancel) const {
  transport::RequestOptions options;
  options.timeout = timeout;
  options.cancel  = &cancel;
  return options;
}

} // namespace medsync::transfer
