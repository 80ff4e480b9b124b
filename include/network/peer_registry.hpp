// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#pragma once

/*
 PeerRegistry - registry of connected peers

 Purpose
 - Hold exactly one PeerConnection per peer id
 - Enforce the connection limit (MAX_CONNECTIONS)
 - Provide the per-peer activity snapshot the global state is derived from

 Invariants
 - A second add() for an id already present is refused and leaves the
   registry unchanged
 - add() beyond capacity is refused and leaves the registry unchanged

 Threading
 - All public methods are thread-safe (protected by mutex_); peers are
   returned by shared_ptr and used outside the lock
*/

#include "network/connection_state.hpp"
#include "network/peer_connection.hpp"
#include "network/protocol.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace peerlink {
namespace network {

class PeerRegistry {
public:
  enum class AddResult { Added, AlreadyConnected, RegistryFull, Invalid };

  explicit PeerRegistry(size_t max_connections = protocol::MAX_CONNECTIONS);
  ~PeerRegistry() = default;

  PeerRegistry(const PeerRegistry &) = delete;
  PeerRegistry &operator=(const PeerRegistry &) = delete;

  AddResult add(PeerConnectionPtr peer);

  // Remove by id (idempotent); returns the removed peer, if any
  PeerConnectionPtr remove(const std::string &id);

  PeerConnectionPtr get(const std::string &id) const;
  bool contains(const std::string &id) const;

  std::vector<PeerConnectionPtr> all() const;
  std::vector<std::string> ids() const;

  size_t size() const;
  size_t capacity() const { return max_connections_; }
  bool is_full() const;
  bool empty() const;

  std::vector<PeerActivity> activities() const;
  ConnectionState derive_global_state() const;

  // Remove every peer without notifying anyone; returns them for teardown
  std::vector<PeerConnectionPtr> clear();

private:
  const size_t max_connections_;
  mutable std::mutex mutex_;
  std::map<std::string, PeerConnectionPtr> peers_;
};

const char *AddResultName(PeerRegistry::AddResult result);

} // namespace network
} // namespace peerlink
