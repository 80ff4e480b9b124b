// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#pragma once

#include "network/collaborators.hpp"
#include "network/connection_state.hpp"
#include "network/discovery.hpp"
#include "network/message.hpp"
#include "network/peer_connection.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace peerlink {
namespace network {

/**
 * ConnectionObserver - everything the engine reports upward
 *
 * All methods have empty defaults; override what you need.
 * Called on the engine's io_context thread.
 */
class ConnectionObserver {
public:
  virtual ~ConnectionObserver() = default;

  virtual void on_state_change(const ConnectionState &) {}
  virtual void on_peer_connection_change(const std::string &, const PeerConnectionState &) {}
  virtual void on_message_received(const message::PeerMessage &, const std::string &) {}
  virtual void on_transfer_progress(const std::string &, double) {}
  virtual void on_transfer_complete(const std::string &, const TransferRecord &) {}
  virtual void on_disconnected(const std::string &) {}
  virtual void on_peers_changed(const std::vector<DiscoveredPeer> &) {}
};

/**
 * Connection event notifications
 *
 * - Simple observer pattern with std::function
 * - Synchronous callbacks, invoked outside the internal lock
 * - RAII-based subscription management
 *
 * One instance per ConnectionOrchestrator (several engines can live in one
 * process, e.g. in tests).
 */
class ConnectionNotifications {
public:
  /**
   * Subscription handle - RAII wrapper
   * Automatically unsubscribes when destroyed
   */
  class Subscription {
  public:
    Subscription() = default;
    ~Subscription();

    // Movable but not copyable
    Subscription(Subscription &&other) noexcept;
    Subscription &operator=(Subscription &&other) noexcept;
    Subscription(const Subscription &) = delete;
    Subscription &operator=(const Subscription &) = delete;

    void Unsubscribe();

  private:
    friend class ConnectionNotifications;
    Subscription(ConnectionNotifications *owner, size_t id);

    ConnectionNotifications *owner_{nullptr};
    size_t id_{0};
    bool active_{false};
  };

  using StateChangeCallback = std::function<void(const ConnectionState &state)>;
  using PeerConnectionChangeCallback =
      std::function<void(const std::string &peer_id, const PeerConnectionState &state)>;
  using MessageReceivedCallback =
      std::function<void(const message::PeerMessage &msg, const std::string &peer_id)>;
  using TransferProgressCallback =
      std::function<void(const std::string &peer_id, double progress)>;
  using TransferCompleteCallback =
      std::function<void(const std::string &peer_id, const TransferRecord &record)>;
  using DisconnectedCallback = std::function<void(const std::string &peer_id)>;
  using PeersChangedCallback = std::function<void(const std::vector<DiscoveredPeer> &peers)>;

  ConnectionNotifications() = default;
  ~ConnectionNotifications() = default;

  ConnectionNotifications(const ConnectionNotifications &) = delete;
  ConnectionNotifications &operator=(const ConnectionNotifications &) = delete;

  // The observer must outlive the returned subscription
  [[nodiscard]] Subscription Subscribe(ConnectionObserver &observer);

  [[nodiscard]] Subscription SubscribeStateChange(StateChangeCallback callback);
  [[nodiscard]] Subscription SubscribePeerConnectionChange(PeerConnectionChangeCallback callback);
  [[nodiscard]] Subscription SubscribeMessageReceived(MessageReceivedCallback callback);
  [[nodiscard]] Subscription SubscribeTransferProgress(TransferProgressCallback callback);
  [[nodiscard]] Subscription SubscribeTransferComplete(TransferCompleteCallback callback);
  [[nodiscard]] Subscription SubscribeDisconnected(DisconnectedCallback callback);
  [[nodiscard]] Subscription SubscribePeersChanged(PeersChangedCallback callback);

  void NotifyStateChange(const ConnectionState &state);
  void NotifyPeerConnectionChange(const std::string &peer_id, const PeerConnectionState &state);
  void NotifyMessageReceived(const message::PeerMessage &msg, const std::string &peer_id);
  void NotifyTransferProgress(const std::string &peer_id, double progress);
  void NotifyTransferComplete(const std::string &peer_id, const TransferRecord &record);
  void NotifyDisconnected(const std::string &peer_id);
  void NotifyPeersChanged(const std::vector<DiscoveredPeer> &peers);

  size_t SubscriberCount() const;

private:
  struct CallbackEntry {
    size_t id;
    StateChangeCallback state_change;
    PeerConnectionChangeCallback peer_connection_change;
    MessageReceivedCallback message_received;
    TransferProgressCallback transfer_progress;
    TransferCompleteCallback transfer_complete;
    DisconnectedCallback disconnected;
    PeersChangedCallback peers_changed;
  };

  Subscription Add(CallbackEntry entry);
  void Unsubscribe(size_t id);

  template <typename Member> auto Snapshot(Member member) const {
    std::vector<std::remove_cvref_t<decltype(std::declval<CallbackEntry>().*member)>> snapshot;
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot.reserve(callbacks_.size());
    for (const auto &entry : callbacks_) {
      if (entry.*member)
        snapshot.push_back(entry.*member);
    }
    return snapshot;
  }

  mutable std::mutex mutex_;
  std::vector<CallbackEntry> callbacks_;
  size_t next_id_{1}; // 0 reserved for invalid
};

} // namespace network
} // namespace peerlink
