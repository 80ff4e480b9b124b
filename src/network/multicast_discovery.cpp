// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#include "network/multicast_discovery.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <nlohmann/json.hpp>

namespace peerlink {
namespace network {

using json = nlohmann::json;
namespace ip = boost::asio::ip;

namespace {
constexpr const char *kProtoTag = "peerlink";
} // namespace

MulticastDiscovery::MulticastDiscovery(boost::asio::io_context &io_context, std::string local_id,
                                       std::string local_name, uint16_t local_port,
                                       Config config)
    : io_context_(io_context), local_id_(std::move(local_id)),
      local_name_(std::move(local_name)), local_port_(local_port), config_(std::move(config)),
      announce_timer_(io_context) {}

MulticastDiscovery::~MulticastDiscovery() {
  announce_timer_.cancel();
  close_socket();
}

std::string MulticastDiscovery::make_announcement(const std::string &id, const std::string &name,
                                                  uint16_t port) {
  json j;
  j["proto"] = kProtoTag;
  j["version"] = protocol::PROTOCOL_VERSION;
  j["id"] = id;
  j["name"] = name;
  j["port"] = port;
  return j.dump();
}

std::optional<DiscoveredPeer> MulticastDiscovery::parse_announcement(const std::string &datagram,
                                                                     const std::string &sender_host) {
  if (datagram.size() > protocol::multicast::MAX_DATAGRAM_SIZE) {
    return std::nullopt;
  }
  json j = json::parse(datagram, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    return std::nullopt;
  }
  if (!j.contains("proto") || !j["proto"].is_string() ||
      j["proto"].get<std::string>() != kProtoTag) {
    return std::nullopt;
  }
  if (!j.contains("id") || !j["id"].is_string() || !j.contains("port") ||
      !j["port"].is_number_unsigned()) {
    return std::nullopt;
  }
  auto port = j["port"].get<uint64_t>();
  std::string id = j["id"].get<std::string>();
  if (id.empty() || port == 0 || port > 65535) {
    return std::nullopt;
  }

  DiscoveredPeer peer;
  peer.id = id;
  peer.display_name = (j.contains("name") && j["name"].is_string()) ? j["name"].get<std::string>()
                                                                     : sender_host;
  ServiceEndpoint ep;
  ep.name = peer.display_name;
  ep.type = protocol::SERVICE_TYPE;
  ep.domain = protocol::SERVICE_DOMAIN;
  ep.host = sender_host;
  ep.port = static_cast<uint16_t>(port);
  peer.endpoint = ep;
  peer.source = DiscoverySource::Service;
  peer.last_seen = util::GetTime();
  return peer;
}

void MulticastDiscovery::start() {
  if (running_) {
    return;
  }
  if (!open_socket()) {
    LOG_DISC_WARN("Multicast discovery unavailable on {}:{}", config_.group, config_.port);
    return;
  }
  running_ = true;
  LOG_DISC_INFO("Multicast discovery started on {}:{}", config_.group, config_.port);
  start_receive();
  announce();
  schedule_announce();
}

void MulticastDiscovery::stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  announce_timer_.cancel();
  close_socket();
  services_.clear();
  publish();
  LOG_DISC_INFO("Multicast discovery stopped");
}

bool MulticastDiscovery::open_socket() {
  boost::system::error_code ec;
  auto group = ip::make_address(config_.group, ec);
  if (ec) {
    LOG_DISC_ERROR("Invalid multicast group {}: {}", config_.group, ec.message());
    return false;
  }
  group_endpoint_ = ip::udp::endpoint(group, config_.port);

  socket_.emplace(io_context_);
  ip::udp::endpoint listen_endpoint(group.is_v6() ? ip::udp::v6() : ip::udp::v4(), config_.port);

  socket_->open(listen_endpoint.protocol(), ec);
  if (!ec) {
    socket_->set_option(ip::udp::socket::reuse_address(true), ec);
  }
  if (!ec) {
    socket_->bind(listen_endpoint, ec);
  }
  if (!ec) {
    socket_->set_option(ip::multicast::join_group(group), ec);
  }
  if (!ec) {
    // Same-host peers need loopback; stay on the local link
    socket_->set_option(ip::multicast::enable_loopback(true), ec);
  }
  if (!ec) {
    socket_->set_option(ip::multicast::hops(1), ec);
  }
  if (ec) {
    LOG_DISC_ERROR("Failed to set up multicast socket: {}", ec.message());
    close_socket();
    return false;
  }
  return true;
}

void MulticastDiscovery::close_socket() {
  if (!socket_) {
    return;
  }
  boost::system::error_code ec;
  socket_->cancel(ec);
  socket_->close(ec);
  socket_.reset();
}

void MulticastDiscovery::start_receive() {
  if (!socket_) {
    return;
  }
  socket_->async_receive_from(
      boost::asio::buffer(recv_buffer_), sender_endpoint_,
      [this](const boost::system::error_code &ec, std::size_t bytes) {
        if (ec == boost::asio::error::operation_aborted || !running_) {
          return;
        }
        if (ec) {
          LOG_DISC_DEBUG("Multicast receive error: {}", ec.message());
        } else {
          handle_announcement(std::string(recv_buffer_.data(), bytes),
                              sender_endpoint_.address().to_string());
        }
        start_receive();
      });
}

void MulticastDiscovery::handle_announcement(const std::string &datagram,
                                             const std::string &sender_host) {
  auto peer = parse_announcement(datagram, sender_host);
  if (!peer) {
    LOG_DISC_TRACE("Discarded invalid multicast message from {}", sender_host);
    return;
  }
  if (peer->id == local_id_) {
    return;
  }

  auto it = services_.find(peer->id);
  bool changed = it == services_.end() || it->second.endpoint != peer->endpoint ||
                 it->second.display_name != peer->display_name;
  if (it == services_.end()) {
    LOG_DISC_INFO("Discovered {} ({}) at {}:{}", peer->display_name, peer->id, peer->host(),
                  peer->port());
  }
  services_[peer->id] = *peer;
  if (changed) {
    publish();
  }
}

void MulticastDiscovery::expire_services() {
  const int64_t cutoff = util::GetTime() - config_.service_ttl.count();
  bool changed = false;
  for (auto it = services_.begin(); it != services_.end();) {
    if (it->second.last_seen < cutoff) {
      LOG_DISC_DEBUG("Service {} expired", it->first);
      it = services_.erase(it);
      changed = true;
    } else {
      ++it;
    }
  }
  if (changed) {
    publish();
  }
}

void MulticastDiscovery::schedule_announce() {
  announce_timer_.expires_after(config_.announce_interval);
  announce_timer_.async_wait([this](const boost::system::error_code &ec) {
    if (ec || !running_) {
      return;
    }
    expire_services();
    announce();
    schedule_announce();
  });
}

void MulticastDiscovery::announce() {
  if (!socket_ || local_port_ == 0) {
    return;
  }
  auto datagram = std::make_shared<std::string>(make_announcement(local_id_, local_name_, local_port_));
  socket_->async_send_to(boost::asio::buffer(*datagram), group_endpoint_,
                         [datagram](const boost::system::error_code &ec, std::size_t) {
                           if (ec && ec != boost::asio::error::operation_aborted) {
                             LOG_DISC_DEBUG("Multicast announce failed: {}", ec.message());
                           }
                         });
}

void MulticastDiscovery::publish() {
  if (!peers_handler_) {
    return;
  }
  std::vector<DiscoveredPeer> view;
  view.reserve(services_.size());
  for (const auto &[id, peer] : services_) {
    view.push_back(peer);
  }
  auto handler = peers_handler_;
  handler(view);
}

} // namespace network
} // namespace peerlink
