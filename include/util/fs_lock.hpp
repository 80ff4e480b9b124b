// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <string>

namespace peerlink {
namespace util {

enum class LockResult {
  Success,    // Lock acquired
  ErrorWrite, // Could not create the lock file
  ErrorLock,  // Held by another process
};

/**
 * DirectoryLock - exclusive fcntl() lock on <directory>/<name>
 *
 * Keeps a second peerlinkd from sharing a data directory (identity and
 * downloads). The lock is held for the lifetime of the object and released
 * when the descriptor closes.
 */
class DirectoryLock {
public:
  DirectoryLock() = default;
  ~DirectoryLock();

  DirectoryLock(const DirectoryLock &) = delete;
  DirectoryLock &operator=(const DirectoryLock &) = delete;

  LockResult Acquire(const std::filesystem::path &directory,
                     const std::string &lockfile_name = ".lock");
  void Release();

  bool IsHeld() const { return fd_ != -1; }
  const std::string &reason() const { return reason_; }

private:
  int fd_{-1};
  std::string reason_;
};

} // namespace util
} // namespace peerlink
