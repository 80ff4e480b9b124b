// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#include "network/peer_registry.hpp"
#include "util/logging.hpp"

namespace peerlink {
namespace network {

const char *AddResultName(PeerRegistry::AddResult result) {
  switch (result) {
  case PeerRegistry::AddResult::Added:
    return "added";
  case PeerRegistry::AddResult::AlreadyConnected:
    return "already connected";
  case PeerRegistry::AddResult::RegistryFull:
    return "registry full";
  case PeerRegistry::AddResult::Invalid:
    return "invalid";
  }
  return "unknown";
}

PeerRegistry::PeerRegistry(size_t max_connections) : max_connections_(max_connections) {}

PeerRegistry::AddResult PeerRegistry::add(PeerConnectionPtr peer) {
  if (!peer || peer->id().empty()) {
    return AddResult::Invalid;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (peers_.count(peer->id()) > 0) {
    LOG_NET_DEBUG("Registry refused duplicate peer {}", peer->id());
    return AddResult::AlreadyConnected;
  }
  if (peers_.size() >= max_connections_) {
    LOG_NET_DEBUG("Registry full ({}/{}), refusing peer {}", peers_.size(), max_connections_,
                  peer->id());
    return AddResult::RegistryFull;
  }
  peers_.emplace(peer->id(), peer);
  LOG_NET_DEBUG("Registered peer {} ({}/{})", peer->id(), peers_.size(), max_connections_);
  return AddResult::Added;
}

PeerConnectionPtr PeerRegistry::remove(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = peers_.find(id);
  if (it == peers_.end()) {
    return nullptr;
  }
  auto peer = it->second;
  peers_.erase(it);
  LOG_NET_DEBUG("Removed peer {} ({} remaining)", id, peers_.size());
  return peer;
}

PeerConnectionPtr PeerRegistry::get(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = peers_.find(id);
  return it != peers_.end() ? it->second : nullptr;
}

bool PeerRegistry::contains(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peers_.count(id) > 0;
}

std::vector<PeerConnectionPtr> PeerRegistry::all() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<PeerConnectionPtr> result;
  result.reserve(peers_.size());
  for (const auto &[id, peer] : peers_) {
    result.push_back(peer);
  }
  return result;
}

std::vector<std::string> PeerRegistry::ids() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> result;
  result.reserve(peers_.size());
  for (const auto &[id, peer] : peers_) {
    result.push_back(id);
  }
  return result;
}

size_t PeerRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peers_.size();
}

bool PeerRegistry::is_full() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peers_.size() >= max_connections_;
}

bool PeerRegistry::empty() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peers_.empty();
}

std::vector<PeerActivity> PeerRegistry::activities() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<PeerActivity> result;
  result.reserve(peers_.size());
  for (const auto &[id, peer] : peers_) {
    PeerActivity a;
    a.connecting = peer->state().kind() == PeerConnectionState::Kind::Connecting;
    a.connected = peer->is_connected();
    a.transferring = peer->transferring();
    a.transfer_progress = peer->transfer_progress();
    a.in_voice_call = peer->in_voice_call();
    result.push_back(a);
  }
  return result;
}

ConnectionState PeerRegistry::derive_global_state() const {
  return DeriveGlobalState(activities());
}

std::vector<PeerConnectionPtr> PeerRegistry::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<PeerConnectionPtr> result;
  result.reserve(peers_.size());
  for (auto &[id, peer] : peers_) {
    result.push_back(std::move(peer));
  }
  peers_.clear();
  return result;
}

} // namespace network
} // namespace peerlink
