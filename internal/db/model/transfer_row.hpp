#pragma once

#include <cstdint>
#include <string>

namespace medsync::db::model {

/*
  Persistent transfer row.

  IMPORTANT:
  - `record` is a serialized medsync.upload.v1.TransferRecord and is the
    authoritative copy; the scalar columns are denormalized for ordering and
    inspection only.
  - Rows are returned ordered by (priority DESC, sequence ASC).
*/

struct TransferRow {
  std::string id;

  uint64_t sequence = 0;
  int32_t  priority = 0;
  int32_t  status   = 0;
  uint64_t offset   = 0;

  std::string record;

  uint64_t updated_at_ms = 0;
};

}
