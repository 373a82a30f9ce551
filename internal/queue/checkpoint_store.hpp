#pragma once

#include <cstdint>
#include <string>

namespace medsync::queue {

/*
  Durable resume point of an in-flight transfer.

  Implementations must have persisted the offset before returning; the
  transfer client only sends the next chunk afterwards.
*/
class CheckpointStore {
 public:
  virtual ~CheckpointStore() = default;

  virtual void Checkpoint(const std::string& id, uint64_t offset, const std::string& session_id) = 0;

  // Offset back to 0 and session forgotten. The only way an offset decreases.
  virtual void RestartFromZero(const std::string& id) = 0;
};

} // namespace medsync::queue
