// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#include "util/fs_lock.hpp"
#include "util/logging.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace peerlink {
namespace util {

DirectoryLock::~DirectoryLock() { Release(); }

LockResult DirectoryLock::Acquire(const std::filesystem::path &directory,
                                  const std::string &lockfile_name) {
  if (fd_ != -1) {
    return LockResult::Success;
  }

  auto path = directory / lockfile_name;
  // O_CLOEXEC: child processes must not inherit the lock
  int fd = open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd == -1) {
    reason_ = std::strerror(errno);
    LOG_ERROR("Failed to open lock file {}: {}", path.string(), reason_);
    return LockResult::ErrorWrite;
  }

  struct flock lock {};
  lock.l_type = F_WRLCK;
  lock.l_whence = SEEK_SET;
  lock.l_start = 0;
  lock.l_len = 0; // whole file

  if (fcntl(fd, F_SETLK, &lock) == -1) {
    reason_ = std::strerror(errno);
    close(fd);
    LOG_ERROR("Failed to lock directory {}: {}", directory.string(), reason_);
    return LockResult::ErrorLock;
  }

  fd_ = fd;
  LOG_TRACE("Acquired directory lock: {}", directory.string());
  return LockResult::Success;
}

void DirectoryLock::Release() {
  if (fd_ != -1) {
    // Closing the descriptor drops the fcntl lock
    close(fd_);
    fd_ = -1;
  }
}

} // namespace util
} // namespace peerlink
