#pragma once

#include <string>

namespace medsync::queue {

/*
  Exclusive advisory lock on "<queue db>.lock", held by the process that owns
  the queue for writing (the uploader, or medsyncctl while it edits).

  flock() semantics: released when the descriptor closes, including on
  crash, so a stale file never blocks a restart.
*/
class QueueLock {
 public:
  // Throws util::InvalidState when another holder has the lock and
  // util::StorageError when the lock file cannot be opened.
  explicit QueueLock(const std::string& db_path);
  ~QueueLock();

  QueueLock(const QueueLock&)            = delete;
  QueueLock& operator=(const QueueLock&) = delete;

  const std::string& path() const {
    return path_;
  }

  static std::string PathFor(const std::string& db_path);

 private:
  std::string path_;
  int         fd_ = -1;
};

} // namespace medsync::queue
