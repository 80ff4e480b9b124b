// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#pragma once

#include "network/protocol.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace peerlink {
namespace network {

enum class DiscoverySource { Service, Manual };

const char *DiscoverySourceName(DiscoverySource source);

// Advertised service (local multicast announcements)
struct ServiceEndpoint {
  std::string name;
  std::string type;
  std::string domain;
  std::string host;
  uint16_t port = 0;

  bool operator==(const ServiceEndpoint &other) const = default;
};

// Address typed in by the user
struct ManualEndpoint {
  std::string host;
  uint16_t port = 0;

  bool operator==(const ManualEndpoint &other) const = default;
};

using PeerEndpoint = std::variant<ServiceEndpoint, ManualEndpoint>;

struct DiscoveredPeer {
  std::string id;
  std::string display_name;
  PeerEndpoint endpoint;
  DiscoverySource source = DiscoverySource::Service;
  int64_t last_seen = 0; // Unix seconds (util::GetTime)

  const std::string &host() const;
  uint16_t port() const;

  bool operator==(const DiscoveredPeer &other) const = default;
};

// Manual peers are keyed "host:port" (IPv6 literals bracketed)
std::string ManualPeerId(const std::string &host, uint16_t port);

/**
 * DiscoveryBackend - a source of candidate peers
 *
 * A backend publishes its complete current view through the peers handler
 * every time it changes. Handlers run on the owner's io_context.
 */
class DiscoveryBackend {
public:
  using PeersHandler = std::function<void(const std::vector<DiscoveredPeer> &peers)>;

  virtual ~DiscoveryBackend() = default;

  virtual void set_peers_handler(PeersHandler handler) = 0;
  virtual void start() = 0;
  // Stopping publishes an empty view
  virtual void stop() = 0;
  virtual bool is_running() const = 0;
  virtual const char *name() const = 0;
};

/*
 DiscoveryCoordinator - merges candidate peers from every backend

 Purpose
 - Own the discovery backends and start/stop them together
 - Keep manual peers ("host:port") alongside backend results
 - Publish one deduplicated peer list to the orchestrator

 Merge rule
 - Manual peers always survive a backend update
 - Backend peers are replaced wholesale by each backend's latest view
 - When two sources report the same id, the first one kept wins (manual
   peers first, then backends in registration order)

 Manual peers not seen within MANUAL_PEER_STALE_SEC are removed by
 cleanup_stale_peers().
*/
class DiscoveryCoordinator {
public:
  using PeersChangedHandler = std::function<void(const std::vector<DiscoveredPeer> &peers)>;

  DiscoveryCoordinator() = default;
  ~DiscoveryCoordinator();

  DiscoveryCoordinator(const DiscoveryCoordinator &) = delete;
  DiscoveryCoordinator &operator=(const DiscoveryCoordinator &) = delete;

  void add_backend(std::shared_ptr<DiscoveryBackend> backend);

  void start();
  void stop();
  bool is_running() const;

  // Returns the peer id; an existing manual entry for the same address is
  // refreshed instead of duplicated
  std::string add_manual_peer(const std::string &host, uint16_t port,
                              const std::optional<std::string> &name = std::nullopt);
  bool remove_manual_peer(const std::string &id);

  // Refresh last_seen of a manual peer (e.g. after a successful connection)
  void mark_seen(const std::string &id);

  // Drop manual peers whose last_seen is older than the interval. Returns
  // the number removed.
  size_t cleanup_stale_peers(int64_t older_than_sec = protocol::MANUAL_PEER_STALE_SEC);

  std::vector<DiscoveredPeer> peers() const;
  std::optional<DiscoveredPeer> find(const std::string &id) const;

  void set_peers_changed_handler(PeersChangedHandler handler);

private:
  void on_backend_peers(size_t index, const std::vector<DiscoveredPeer> &peers);
  // Rebuilds merged_ from manual_ and backend views. Caller holds mutex_.
  void rebuild_locked();
  void notify();

  mutable std::mutex mutex_;
  std::vector<std::shared_ptr<DiscoveryBackend>> backends_;
  std::vector<std::vector<DiscoveredPeer>> backend_views_;
  std::vector<DiscoveredPeer> manual_;
  std::vector<DiscoveredPeer> merged_;
  bool running_{false};
  PeersChangedHandler peers_changed_handler_;
};

} // namespace network
} // namespace peerlink
