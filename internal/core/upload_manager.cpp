#include "internal/core/upload_manager.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace medsync::core {

namespace fs = std::filesystem;

using model::TransferDescriptor;
using model::TransferStatus;

std::string GuessContentType(const std::string& file_name) {
  auto extension = fs::path(file_name).extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (extension == ".dcm" || extension == ".dicom") return "application/dicom";
  if (extension == ".png") return "image/png";
  if (extension == ".jpg" || extension == ".jpeg") return "image/jpeg";
  if (extension == ".tif" || extension == ".tiff") return "image/tiff";
  if (extension == ".pdf") return "application/pdf";
  if (extension == ".json") return "application/json";
  return "application/octet-stream";
}

UploadManager::UploadManager(config::TransferOptions                          options,
                             std::shared_ptr<queue::TransferQueue>            queue,
                             std::shared_ptr<reconcile::ReconciliationEngine> engine,
                             std::shared_ptr<connection::ConnectionMonitor>   monitor,
                             std::shared_ptr<payload::PayloadSpool>           spool,
                             std::shared_ptr<events::TransferEventChannel>    events,
                             std::shared_ptr<transport::UploadTransport>      transport)
    : options_(options),
      queue_(std::move(queue)),
      engine_(std::move(engine)),
      monitor_(std::move(monitor)),
      spool_(std::move(spool)),
      events_(std::move(events)),
      transport_(std::move(transport)) {
}

std::string UploadManager::SubmitUpload(const std::string& path, const model::Destination& destination,
                                        const SubmitOptions& options) {
  std::error_code ec;
  const auto      status = fs::status(path, ec);
  if (ec || !fs::is_regular_file(status)) {
    throw util::InvalidPayload("payload is not a readable file: " + path);
  }
  const auto size = fs::file_size(path, ec);
  if (ec) {
    throw util::InvalidPayload("cannot stat payload " + path + ": " + ec.message());
  }
  if (size == 0) {
    throw util::InvalidPayload("payload is empty: " + path);
  }

  const auto absolute = fs::absolute(path, ec);

  TransferDescriptor descriptor;
  descriptor.id                   = util::NewTransferId();
  descriptor.payload.path         = ec ? path : absolute.string();
  descriptor.payload.total_size   = size;
  descriptor.payload.file_name    = options.file_name.empty() ? fs::path(path).filename().string() : options.file_name;
  descriptor.payload.content_type =
      options.content_type.empty() ? GuessContentType(descriptor.payload.file_name) : options.content_type;
  descriptor.destination = destination;
  descriptor.priority    = options.priority;
  return Enqueue(std::move(descriptor));
}

std::string UploadManager::SubmitUpload(const std::shared_ptr<arrow::Buffer>& buffer,
                                        const model::Destination& destination, const SubmitOptions& options) {
  if (!buffer || buffer->size() == 0) {
    throw util::InvalidPayload("payload buffer is empty");
  }

  TransferDescriptor descriptor;
  descriptor.id = util::NewTransferId();

  auto spooled = spool_->Write(descriptor.id, buffer);
  if (!spooled.ok()) {
    throw util::StorageError("cannot spool payload: " + spooled.status().ToString());
  }

  descriptor.payload.path         = *spooled;
  descriptor.payload.total_size   = static_cast<uint64_t>(buffer->size());
  descriptor.payload.spooled      = true;
  descriptor.payload.file_name    = options.file_name.empty() ? descriptor.id + ".bin" : options.file_name;
  descriptor.payload.content_type =
      options.content_type.empty() ? GuessContentType(descriptor.payload.file_name) : options.content_type;
  descriptor.destination = destination;
  descriptor.priority    = options.priority;

  try {
    return Enqueue(descriptor);
  } catch (const std::exception&) {
    spool_->Discard(descriptor.payload);
    throw;
  }
}

std::string UploadManager::Enqueue(TransferDescriptor descriptor) {
  descriptor.status = monitor_->CurrentState().is_online ? TransferStatus::kPending : TransferStatus::kPendingOffline;
  descriptor.next_eligible_at = util::Now();

  const auto queued = queue_->Enqueue(std::move(descriptor));
  MEDSYNC_LOG_INFO("upload submitted", {observability::StringField("transfer_id", queued.id),
                                        observability::StringField("modality", model::ToString(queued.destination.modality)),
                                        observability::StringField("status", model::ToString(queued.status)),
                                        observability::UintField("size_bytes", queued.payload.total_size)});
  engine_->OnSubmitted(queued.id);
  return queued.id;
}

void UploadManager::Cancel(const std::string& id) {
  if (engine_->Cancel(id) == reconcile::CancelOutcome::kNotFound) {
    throw util::NotFound("transfer not found: " + id);
  }
}

void UploadManager::Retry(const std::string& id) {
  const auto reset = queue_->ResetFailed(id, util::Now());
  MEDSYNC_LOG_INFO("failed transfer re-queued", {observability::StringField("transfer_id", id),
                                                 observability::IntField("priority", reset.priority)});
  engine_->Drain();
}

void UploadManager::Clear(const std::string& id) {
  const auto current = queue_->Get(id);
  if (!current) {
    throw util::NotFound("transfer not found: " + id);
  }
  if (current->status != TransferStatus::kFailedPermanently) {
    throw util::InvalidState("transfer " + id + " is " + model::ToString(current->status) +
                             "; cancel it instead of clearing");
  }
  if (auto removed = queue_->Remove(id)) {
    spool_->Discard(removed->payload);
  }
}

std::size_t UploadManager::ClearFailed() {
  const auto removed = queue_->RemoveFailed();
  for (const auto& descriptor : removed) {
    spool_->Discard(descriptor.payload);
  }
  MEDSYNC_LOG_INFO("failed transfers cleared", {observability::UintField("count", removed.size())});
  return removed.size();
}

queue::TransferCounts UploadManager::Counts() const {
  return queue_->Counts();
}

std::vector<TransferDescriptor> UploadManager::List() const {
  return queue_->ListAll();
}

std::optional<TransferDescriptor> UploadManager::Get(const std::string& id) const {
  return queue_->Get(id);
}

transport::Response<transport::SessionStatus> UploadManager::QueryServerStatus(const std::string& id) {
  const auto descriptor = queue_->Get(id);
  if (!descriptor) {
    throw util::NotFound("transfer not found: " + id);
  }
  if (descriptor->session_id.empty()) {
    throw util::InvalidState("transfer " + id + " has no server session yet");
  }

  transport::RequestOptions options;
  options.timeout = options_.session_timeout;
  return transport_->QueryStatus(descriptor->session_id, options);
}

void UploadManager::ResumeAfterReauth() {
  engine_->ResumeAfterReauth();
}

model::ConnectionState UploadManager::Connection() const {
  return monitor_->CurrentState();
}

} // namespace medsync::core
