#pragma once

#include "util.h"

#include <filesystem>

// Exclusive advisory lock on <database>.lock, held for the lifetime of the
// process that owns the task queue. The file also records the owner's pid.
class QueueLock final {
public:
  explicit QueueLock(std::filesystem::path path);
  ~QueueLock();

  QueueLock(const QueueLock&) = delete;
  QueueLock& operator=(const QueueLock&) = delete;

  // acquired=false (and ok) when another open of the file holds the lock.
  OpResult TryAcquire(bool& acquired);
  void Release();

  const std::filesystem::path& Path() const { return path_; }

private:
  std::filesystem::path path_;
  int fd_{-1};
};
