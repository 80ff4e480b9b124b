// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#include "network/notifications.hpp"
#include <algorithm>

namespace peerlink {
namespace network {

// ============================================================================
// ConnectionNotifications::Subscription
// ============================================================================

ConnectionNotifications::Subscription::Subscription(ConnectionNotifications *owner, size_t id)
    : owner_(owner), id_(id), active_(true) {}

ConnectionNotifications::Subscription::~Subscription() { Unsubscribe(); }

ConnectionNotifications::Subscription::Subscription(Subscription &&other) noexcept
    : owner_(other.owner_), id_(other.id_), active_(other.active_) {
  other.owner_ = nullptr;
  other.active_ = false;
}

ConnectionNotifications::Subscription &
ConnectionNotifications::Subscription::operator=(Subscription &&other) noexcept {
  if (this != &other) {
    Unsubscribe();
    owner_ = other.owner_;
    id_ = other.id_;
    active_ = other.active_;
    other.owner_ = nullptr;
    other.active_ = false;
  }
  return *this;
}

void ConnectionNotifications::Subscription::Unsubscribe() {
  if (active_ && owner_) {
    owner_->Unsubscribe(id_);
    active_ = false;
  }
}

// ============================================================================
// ConnectionNotifications
// ============================================================================

ConnectionNotifications::Subscription ConnectionNotifications::Add(CallbackEntry entry) {
  std::lock_guard<std::mutex> lock(mutex_);
  entry.id = next_id_++;
  size_t id = entry.id;
  callbacks_.push_back(std::move(entry));
  return Subscription(this, id);
}

ConnectionNotifications::Subscription
ConnectionNotifications::Subscribe(ConnectionObserver &observer) {
  ConnectionObserver *obs = &observer;
  CallbackEntry entry{};
  entry.state_change = [obs](const ConnectionState &s) { obs->on_state_change(s); };
  entry.peer_connection_change = [obs](const std::string &id, const PeerConnectionState &s) {
    obs->on_peer_connection_change(id, s);
  };
  entry.message_received = [obs](const message::PeerMessage &m, const std::string &id) {
    obs->on_message_received(m, id);
  };
  entry.transfer_progress = [obs](const std::string &id, double p) {
    obs->on_transfer_progress(id, p);
  };
  entry.transfer_complete = [obs](const std::string &id, const TransferRecord &r) {
    obs->on_transfer_complete(id, r);
  };
  entry.disconnected = [obs](const std::string &id) { obs->on_disconnected(id); };
  entry.peers_changed = [obs](const std::vector<DiscoveredPeer> &p) { obs->on_peers_changed(p); };
  return Add(std::move(entry));
}

ConnectionNotifications::Subscription
ConnectionNotifications::SubscribeStateChange(StateChangeCallback callback) {
  CallbackEntry entry{};
  entry.state_change = std::move(callback);
  return Add(std::move(entry));
}

ConnectionNotifications::Subscription
ConnectionNotifications::SubscribePeerConnectionChange(PeerConnectionChangeCallback callback) {
  CallbackEntry entry{};
  entry.peer_connection_change = std::move(callback);
  return Add(std::move(entry));
}

ConnectionNotifications::Subscription
ConnectionNotifications::SubscribeMessageReceived(MessageReceivedCallback callback) {
  CallbackEntry entry{};
  entry.message_received = std::move(callback);
  return Add(std::move(entry));
}

ConnectionNotifications::Subscription
ConnectionNotifications::SubscribeTransferProgress(TransferProgressCallback callback) {
  CallbackEntry entry{};
  entry.transfer_progress = std::move(callback);
  return Add(std::move(entry));
}

ConnectionNotifications::Subscription
ConnectionNotifications::SubscribeTransferComplete(TransferCompleteCallback callback) {
  CallbackEntry entry{};
  entry.transfer_complete = std::move(callback);
  return Add(std::move(entry));
}

ConnectionNotifications::Subscription
ConnectionNotifications::SubscribeDisconnected(DisconnectedCallback callback) {
  CallbackEntry entry{};
  entry.disconnected = std::move(callback);
  return Add(std::move(entry));
}

ConnectionNotifications::Subscription
ConnectionNotifications::SubscribePeersChanged(PeersChangedCallback callback) {
  CallbackEntry entry{};
  entry.peers_changed = std::move(callback);
  return Add(std::move(entry));
}

void ConnectionNotifications::NotifyStateChange(const ConnectionState &state) {
  for (auto &cb : Snapshot(&CallbackEntry::state_change)) {
    cb(state);
  }
}

void ConnectionNotifications::NotifyPeerConnectionChange(const std::string &peer_id,
                                                         const PeerConnectionState &state) {
  for (auto &cb : Snapshot(&CallbackEntry::peer_connection_change)) {
    cb(peer_id, state);
  }
}

void ConnectionNotifications::NotifyMessageReceived(const message::PeerMessage &msg,
                                                    const std::string &peer_id) {
  for (auto &cb : Snapshot(&CallbackEntry::message_received)) {
    cb(msg, peer_id);
  }
}

void ConnectionNotifications::NotifyTransferProgress(const std::string &peer_id, double progress) {
  for (auto &cb : Snapshot(&CallbackEntry::transfer_progress)) {
    cb(peer_id, progress);
  }
}

void ConnectionNotifications::NotifyTransferComplete(const std::string &peer_id,
                                                     const TransferRecord &record) {
  for (auto &cb : Snapshot(&CallbackEntry::transfer_complete)) {
    cb(peer_id, record);
  }
}

void ConnectionNotifications::NotifyDisconnected(const std::string &peer_id) {
  for (auto &cb : Snapshot(&CallbackEntry::disconnected)) {
    cb(peer_id);
  }
}

void ConnectionNotifications::NotifyPeersChanged(const std::vector<DiscoveredPeer> &peers) {
  for (auto &cb : Snapshot(&CallbackEntry::peers_changed)) {
    cb(peers);
  }
}

size_t ConnectionNotifications::SubscriberCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return callbacks_.size();
}

void ConnectionNotifications::Unsubscribe(size_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = std::find_if(callbacks_.begin(), callbacks_.end(),
                         [id](const CallbackEntry &entry) { return entry.id == id; });
  if (it != callbacks_.end()) {
    callbacks_.erase(it);
  }
}

} // namespace network
} // namespace peerlink
