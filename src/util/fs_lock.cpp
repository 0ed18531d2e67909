// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "util/fs_lock.hpp"
#include "util/logging.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace kvmrelay {
namespace util {

DirectoryLock::DirectoryLock(const fs::path &directory,
                             const std::string &lockfile_name)
    : path_(directory / lockfile_name) {}

DirectoryLock::~DirectoryLock() { Release(); }

LockResult DirectoryLock::Acquire() {
  if (fd_ != -1) {
    return LockResult::Success;
  }

  int fd = open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd == -1) {
    LOG_ERROR("Failed to create lock file {}: {}", path_.string(),
              std::strerror(errno));
    return LockResult::ErrorWrite;
  }

  // flock() locks follow the open file description, not the process
  if (flock(fd, LOCK_EX | LOCK_NB) == -1) {
    LOG_ERROR("Failed to lock {}: {}", path_.string(), std::strerror(errno));
    close(fd);
    return LockResult::ErrorLock;
  }

  fd_ = fd;
  return LockResult::Success;
}

void DirectoryLock::Release() {
  if (fd_ == -1) {
    return;
  }
  flock(fd_, LOCK_UN);
  close(fd_);
  fd_ = -1;
}

} // namespace util
} // namespace kvmrelay
