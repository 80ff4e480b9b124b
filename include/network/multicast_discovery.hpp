// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#pragma once

#include "network/discovery.hpp"
#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <array>
#include <map>
#include <optional>
#include <string>

namespace peerlink {
namespace network {

/**
 * MulticastDiscovery - local-network service advertisement over UDP multicast
 *
 * Every ANNOUNCE_INTERVAL the local service is announced to the multicast
 * group as a small JSON datagram:
 *
 *   {"proto":"peerlink","version":1,"id":"<peer id>","name":"<display name>",
 *    "port":<tcp port>}
 *
 * Announcements from other peers become Service peers; the host is the
 * datagram's source address. Our own announcements (multicast loopback) are
 * recognised by id and dropped. A service not heard from within SERVICE_TTL
 * disappears from the published view.
 */
class MulticastDiscovery : public DiscoveryBackend {
public:
  struct Config {
    std::string group;
    uint16_t port;
    std::chrono::milliseconds announce_interval;
    std::chrono::seconds service_ttl;

    Config()
        : group(protocol::multicast::GROUP_V4), port(protocol::multicast::PORT),
          announce_interval(protocol::multicast::ANNOUNCE_INTERVAL),
          service_ttl(protocol::multicast::SERVICE_TTL) {}
  };

  // local_port is the TCP port advertised to others
  MulticastDiscovery(boost::asio::io_context &io_context, std::string local_id,
                     std::string local_name, uint16_t local_port, Config config = Config{});
  ~MulticastDiscovery() override;

  void set_peers_handler(PeersHandler handler) override { peers_handler_ = std::move(handler); }
  void start() override;
  void stop() override;
  bool is_running() const override { return running_; }
  const char *name() const override { return "multicast"; }

  // The advertised TCP port may only be known after the listener bound
  void set_local_port(uint16_t port) { local_port_ = port; }

  static std::string make_announcement(const std::string &id, const std::string &name,
                                       uint16_t port);

  // Parse a datagram received from sender_host; std::nullopt for anything
  // that is not a well-formed announcement
  static std::optional<DiscoveredPeer> parse_announcement(const std::string &datagram,
                                                          const std::string &sender_host);

  // Feed a parsed announcement (also used by the receive loop)
  void handle_announcement(const std::string &datagram, const std::string &sender_host);

  // Drop expired services; publishes if anything changed
  void expire_services();

private:
  bool open_socket();
  void close_socket();
  void start_receive();
  void schedule_announce();
  void announce();
  void publish();

  boost::asio::io_context &io_context_;
  std::string local_id_;
  std::string local_name_;
  uint16_t local_port_;
  Config config_;

  std::optional<boost::asio::ip::udp::socket> socket_;
  boost::asio::ip::udp::endpoint group_endpoint_;
  boost::asio::ip::udp::endpoint sender_endpoint_;
  std::array<char, protocol::multicast::MAX_DATAGRAM_SIZE> recv_buffer_{};
  boost::asio::steady_timer announce_timer_;

  std::map<std::string, DiscoveredPeer> services_;
  bool running_{false};
  PeersHandler peers_handler_;
};

} // namespace network
} // namespace peerlink
