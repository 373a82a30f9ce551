#pragma once

#include <optional>
#include <string>

#include "internal/db/model/transfer_row.hpp"
#include "internal/model/transfer_descriptor.hpp"
#include "medsync/upload/v1.hpp"

namespace medsync::queue {

// Writes the known fields of `descriptor` into `record`. Unknown fields
// already present on `record` are left untouched.
void FillRecord(const model::TransferDescriptor& descriptor, medsync::upload::v1::TransferRecord* record);

// Returns nullopt and sets `why` when the record violates a queue invariant.
std::optional<model::TransferDescriptor> FromRecord(const medsync::upload::v1::TransferRecord& record, std::string* why);

db::model::TransferRow ToRow(const medsync::upload::v1::TransferRecord& record);

} // namespace medsync::queue
