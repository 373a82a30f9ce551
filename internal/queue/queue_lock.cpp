#include "internal/queue/queue_lock.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace medsync::queue {

namespace {

std::string ReadHolder(int fd) {
  char    buf[32] = {};
  ssize_t n       = ::pread(fd, buf, sizeof(buf) - 1, 0);
  if (n <= 0) {
    return {};
  }
  return std::string(buf, static_cast<std::size_t>(n));
}

} // namespace

std::string QueueLock::PathFor(const std::string& db_path) {
  return db_path + ".lock";
}

QueueLock::QueueLock(const std::string& db_path) : path_(PathFor(db_path)) {
  fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd_ < 0) {
    throw util::StorageError("cannot open queue lock " + path_ + ": " + std::strerror(errno));
  }

  if (::flock(fd_, LOCK_EX | LOCK_NB) != 0) {
    const int  err    = errno;
    const auto holder = ReadHolder(fd_);
    ::close(fd_);
    fd_ = -1;
    if (err == EWOULDBLOCK) {
      throw util::InvalidState("queue " + db_path + " is in use" + (holder.empty() ? "" : " by pid " + holder));
    }
    throw util::StorageError("cannot lock " + path_ + ": " + std::strerror(err));
  }

  const auto pid = std::to_string(::getpid());
  if (::ftruncate(fd_, 0) != 0 || ::pwrite(fd_, pid.data(), pid.size(), 0) < 0) {
    MEDSYNC_LOG_WARN("failed to record pid in queue lock", {observability::StringField("path", path_)});
  }
  MEDSYNC_LOG_DEBUG("queue lock acquired", {observability::StringField("path", path_)});
}

QueueLock::~QueueLock() {
  if (fd_ >= 0) {
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
  }
}

} // namespace medsync::queue
