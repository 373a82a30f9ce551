#include "internal/queue/record_codec.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace medsync::queue {

namespace v1 = medsync::upload::v1;

namespace {

bool ValidStatus(int value) {
  return value >= static_cast<int>(model::TransferStatus::kPending) &&
         value <= static_cast<int>(model::TransferStatus::kFailedPermanently);
}

model::ErrorKind ToErrorKind(int value) {
  if (value < 0 || value > static_cast<int>(model::ErrorKind::kEndpointInvalid)) {
    return model::ErrorKind::kNone;
  }
  return static_cast<model::ErrorKind>(value);
}

} // namespace

void FillRecord(const model::TransferDescriptor& descriptor, v1::TransferRecord* record) {
  record->set_id(descriptor.id);

  auto* payload = record->mutable_payload();
  payload->set_path(descriptor.payload.path);
  payload->set_total_size(descriptor.payload.total_size);
  payload->set_file_name(descriptor.payload.file_name);
  payload->set_content_type(descriptor.payload.content_type);
  payload->set_spooled(descriptor.payload.spooled);

  auto* destination = record->mutable_destination();
  destination->set_modality(static_cast<v1::Modality>(descriptor.destination.modality));
  destination->set_model_id(descriptor.destination.model_id);
  destination->mutable_metadata()->clear();
  for (const auto& [key, value] : descriptor.destination.metadata) {
    (*destination->mutable_metadata())[key] = value;
  }

  record->set_offset(descriptor.offset);
  record->set_status(static_cast<v1::TransferStatus>(descriptor.status));
  record->set_attempt_count(descriptor.attempt_count);
  record->set_last_attempt_at_ms(util::ToUnixMillis(descriptor.last_attempt_at));
  record->set_created_at_ms(util::ToUnixMillis(descriptor.created_at));
  record->set_last_error(descriptor.last_error);
  record->set_last_error_kind(static_cast<v1::ErrorKind>(descriptor.last_error_kind));
  record->set_session_id(descriptor.session_id);
  record->set_next_eligible_at_ms(util::ToUnixMillis(descriptor.next_eligible_at));
  record->set_priority(descriptor.priority);
  record->set_sequence(descriptor.sequence);
  record->set_result_id(descriptor.result_id);
}

std::optional<model::TransferDescriptor> FromRecord(const v1::TransferRecord& record, std::string* why) {
  if (record.id().empty()) {
    *why = "record has no id";
    return std::nullopt;
  }
  if (!ValidStatus(record.status())) {
    *why = "unknown status " + std::to_string(record.status());
    return std::nullopt;
  }
  if (record.payload().total_size() == 0) {
    *why = "payload size is zero";
    return std::nullopt;
  }
  if (record.offset() > record.payload().total_size()) {
    *why = "offset " + std::to_string(record.offset()) + " beyond payload size " +
           std::to_string(record.payload().total_size());
    return std::nullopt;
  }

  model::TransferDescriptor descriptor;
  descriptor.id = record.id();

  descriptor.payload.path         = record.payload().path();
  descriptor.payload.total_size   = record.payload().total_size();
  descriptor.payload.file_name    = record.payload().file_name();
  descriptor.payload.content_type = record.payload().content_type();
  descriptor.payload.spooled      = record.payload().spooled();

  const int modality = record.destination().modality();
  descriptor.destination.modality = modality >= 0 && modality <= static_cast<int>(model::Modality::kReport)
                                        ? static_cast<model::Modality>(modality)
                                        : model::Modality::kUnspecified;
  descriptor.destination.model_id = record.destination().model_id();
  for (const auto& [key, value] : record.destination().metadata()) {
    descriptor.destination.metadata.emplace(key, value);
  }

  descriptor.offset           = record.offset();
  descriptor.status           = static_cast<model::TransferStatus>(record.status());
  descriptor.attempt_count    = record.attempt_count();
  descriptor.last_attempt_at  = util::FromUnixMillis(record.last_attempt_at_ms());
  descriptor.created_at       = util::FromUnixMillis(record.created_at_ms());
  descriptor.last_error       = record.last_error();
  descriptor.last_error_kind  = ToErrorKind(record.last_error_kind());
  descriptor.session_id       = record.session_id();
  descriptor.next_eligible_at = util::FromUnixMillis(record.next_eligible_at_ms());
  descriptor.priority         = record.priority();
  descriptor.sequence         = record.sequence();
  descriptor.result_id        = record.result_id();
  return descriptor;
}

db::model::TransferRow ToRow(const v1::TransferRecord& record) {
  db::model::TransferRow row;
  row.id            = record.id();
  row.sequence      = record.sequence();
  row.priority      = record.priority();
  row.status        = record.status();
  row.offset        = record.offset();
  row.updated_at_ms = util::ToUnixMillis(util::Now());
  if (!record.SerializeToString(&row.record)) {
    throw util::StorageError("failed to serialize transfer record " + record.id());
  }
  return row;
}

} // namespace medsync::queue
