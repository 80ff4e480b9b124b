// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#include "network/collaborators.hpp"
#include "util/files.hpp"

namespace peerlink {
namespace network {

uint64_t DirectoryStorage::available_bytes() const {
  if (!util::ensure_directory(dir_)) {
    return 0;
  }
  return util::available_space(dir_);
}

} // namespace network
} // namespace peerlink
