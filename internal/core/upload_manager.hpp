#pragma once

#include <arrow/buffer.h>

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/upload_options.hpp"
#include "internal/connection/connection_monitor.hpp"
#include "internal/events/transfer_event_channel.hpp"
#include "internal/model/transfer_descriptor.hpp"
#include "internal/payload/payload_spool.hpp"
#include "internal/queue/transfer_queue.hpp"
#include "internal/reconcile/reconciliation_engine.hpp"
#include "internal/transport/upload_transport.hpp"

namespace medsync::core {

struct SubmitOptions {
  // Defaults to the file's name (or "<id>.bin" for buffers).
  std::string file_name;
  // Guessed from the file extension when empty.
  std::string content_type;
  int32_t     priority = 0;
};

/*
  Entry point for callers.

  Validates and persists new transfers, then leaves them to the
  reconciliation engine. Every operation is safe to call from any thread.

  Throws:
    util::InvalidPayload  missing, unreadable or empty payload
    util::NotFound        unknown transfer id
    util::InvalidState    operation not allowed in the transfer's state
    util::StorageError    the queue could not be written
*/
class UploadManager {
 public:
  UploadManager(config::TransferOptions                           options,
                std::shared_ptr<queue::TransferQueue>             queue,
                std::shared_ptr<reconcile::ReconciliationEngine>  engine,
                std::shared_ptr<connection::ConnectionMonitor>    monitor,
                std::shared_ptr<payload::PayloadSpool>            spool,
                std::shared_ptr<events::TransferEventChannel>     events,
                std::shared_ptr<transport::UploadTransport>       transport);

  std::string SubmitUpload(const std::string& path, const model::Destination& destination,
                           const SubmitOptions& options = {});

  std::string SubmitUpload(const std::shared_ptr<arrow::Buffer>& buffer, const model::Destination& destination,
                           const SubmitOptions& options = {});

  void Cancel(const std::string& id);

  // FailedPermanently -> Pending, ahead of the rest of the queue.
  void Retry(const std::string& id);

  // Drops one FailedPermanently transfer.
  void Clear(const std::string& id);
  std::size_t ClearFailed();

  queue::TransferCounts                    Counts() const;
  std::vector<model::TransferDescriptor>   List() const;
  std::optional<model::TransferDescriptor> Get(const std::string& id) const;

  // Server-side view of the transfer's session.
  transport::Response<transport::SessionStatus> QueryServerStatus(const std::string& id);

  void ResumeAfterReauth();

  model::ConnectionState Connection() const;

  std::shared_ptr<events::TransferEventChannel> Events() const {
    return events_;
  }

 private:
  std::string Enqueue(model::TransferDescriptor descriptor);

  config::TransferOptions                          options_;
  std::shared_ptr<queue::TransferQueue>            queue_;
  std::shared_ptr<reconcile::ReconciliationEngine> engine_;
  std::shared_ptr<connection::ConnectionMonitor>   monitor_;
  std::shared_ptr<payload::PayloadSpool>           spool_;
  std::shared_ptr<events::TransferEventChannel>    events_;
  std::shared_ptr<transport::UploadTransport>      transport_;
};

// "application/dicom" for .dcm, image types for common extensions,
// "application/octet-stream" otherwise.
std::string GuessContentType(const std::string& file_name);

} // namespace medsync::core
