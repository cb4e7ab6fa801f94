#include "QueueLock.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <system_error>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <wx/log.h>

namespace fs = std::filesystem;

QueueLock::QueueLock(fs::path path) : path_(std::move(path)) {}

QueueLock::~QueueLock() { Release(); }

OpResult QueueLock::TryAcquire(bool& acquired) {
  acquired = false;
  if (fd_ >= 0) {
    acquired = true;
    return OkResult();
  }

  std::error_code ec;
  if (path_.has_parent_path()) fs::create_directories(path_.parent_path(), ec);
  if (ec) return FailResult("Cannot create " + FromPath(path_.parent_path()), ec);

  const int fd = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) {
    return FailResult("Cannot open lock file " + FromPath(path_),
                      std::error_code(errno, std::generic_category()));
  }

  if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
    const int err = errno;
    ::close(fd);
    if (err == EWOULDBLOCK) return OkResult();
    return FailResult("Cannot lock " + FromPath(path_), std::error_code(err, std::generic_category()));
  }

  if (::ftruncate(fd, 0) == 0) {
    char pid[32];
    const int n = std::snprintf(pid, sizeof(pid), "%d\n", static_cast<int>(::getpid()));
    if (::pwrite(fd, pid, static_cast<size_t>(n), 0) != n) {
      wxLogVerbose("Cannot record pid in %s: %s", FromPath(path_), std::strerror(errno));
    }
  }

  fd_ = fd;
  acquired = true;
  return OkResult();
}

void QueueLock::Release() {
  if (fd_ < 0) return;
  ::flock(fd_, LOCK_UN);
  ::close(fd_);
  fd_ = -1;
}
