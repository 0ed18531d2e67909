// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef KVMRELAY_UTIL_FS_LOCK_HPP
#define KVMRELAY_UTIL_FS_LOCK_HPP

#include <filesystem>
#include <string>

namespace kvmrelay {
namespace util {

namespace fs = std::filesystem;

enum class LockResult { Success, ErrorWrite, ErrorLock };

/**
 * Exclusive lock on <directory>/<lockfile_name>, released on destruction
 *
 * Keeps two relay daemons from sharing a data directory, and with it the
 * control socket and the rendezvous ports. The lock belongs to this
 * object, so a second DirectoryLock on the same directory fails even
 * inside one process.
 */
class DirectoryLock {
public:
  explicit DirectoryLock(const fs::path &directory,
                         const std::string &lockfile_name = ".lock");
  ~DirectoryLock();

  DirectoryLock(const DirectoryLock &) = delete;
  DirectoryLock &operator=(const DirectoryLock &) = delete;

  // Creates the lock file if needed. Success if already held.
  LockResult Acquire();
  void Release();

  bool IsHeld() const { return fd_ != -1; }
  const fs::path &path() const { return path_; }

private:
  fs::path path_;
  int fd_{-1};
};

} // namespace util
} // namespace kvmrelay

#endif // KVMRELAY_UTIL_FS_LOCK_HPP
