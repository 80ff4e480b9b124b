// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#include "network/peer_connection.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"

namespace peerlink {
namespace network {

std::string PeerConnectionState::ToString() const {
  switch (kind_) {
  case Kind::Connecting:
    return "connecting";
  case Kind::Connected:
    return "connected";
  case Kind::Disconnected:
    return "disconnected";
  case Kind::Failed:
    return "failed(" + reason_ + ")";
  }
  return "unknown";
}

std::atomic<uint64_t> PeerConnection::next_generation_{1};

#ifdef PEERLINK_TESTS
// Test-only heartbeat override (0ms = disabled)
std::atomic<std::chrono::milliseconds> PeerConnection::heartbeat_interval_override_ms_{
    std::chrono::milliseconds{0}};

void PeerConnection::SetHeartbeatIntervalForTest(std::chrono::milliseconds interval) {
  heartbeat_interval_override_ms_.store(interval, std::memory_order_relaxed);
}

void PeerConnection::ResetHeartbeatIntervalForTest() {
  heartbeat_interval_override_ms_.store(std::chrono::milliseconds{0}, std::memory_order_relaxed);
}
#endif

std::chrono::milliseconds PeerConnection::heartbeat_interval() {
#ifdef PEERLINK_TESTS
  auto ov = heartbeat_interval_override_ms_.load(std::memory_order_relaxed);
  if (ov.count() > 0) {
    return ov;
  }
#endif
  return std::chrono::duration_cast<std::chrono::milliseconds>(protocol::HEARTBEAT_INTERVAL);
}

PeerConnection::PeerConnection(PrivateTag, boost::asio::io_context &io_context,
                               TransportSessionPtr session,
                               message::PeerIdentity remote_identity, std::string local_id)
    : io_context_(io_context), session_(std::move(session)),
      identity_(std::move(remote_identity)), local_id_(std::move(local_id)),
      state_(PeerConnectionState::Connecting()), generation_(next_generation_.fetch_add(1)),
      heartbeat_timer_(io_context) {}

PeerConnection::~PeerConnection() {
  if (state_.is_active()) {
    LOG_NET_ERROR("PeerConnection destructor called while still active - peer={}, state={}. "
                  "disconnect() or cancel() must run first.",
                  identity_.id, state_.ToString());
  }
  heartbeat_timer_.cancel();
}

PeerConnectionPtr PeerConnection::create(boost::asio::io_context &io_context,
                                         TransportSessionPtr session,
                                         message::PeerIdentity remote_identity,
                                         std::string local_id) {
  return std::make_shared<PeerConnection>(PrivateTag{}, io_context, std::move(session),
                                          std::move(remote_identity), std::move(local_id));
}

std::string PeerConnection::endpoint() const {
  return session_ ? session_->endpoint() : std::string();
}

void PeerConnection::start() {
  if (state_.kind() != PeerConnectionState::Kind::Connecting) {
    LOG_NET_TRACE("PeerConnection::start() ignored for peer {} in state {}", identity_.id,
                  state_.ToString());
    return;
  }
  if (!session_ || session_->state() == TransportSession::State::Closed) {
    LOG_NET_WARN("Cannot start peer {}: transport already closed", identity_.id);
    set_state(PeerConnectionState::Failed(TransportErrorString(TransportError::Closed)));
    return;
  }

  install_session_handlers();
  session_->start();
  set_state(PeerConnectionState::Connected());
}

void PeerConnection::install_session_handlers() {
  auto self = shared_from_this();
  uint64_t gen = generation_;
  session_->set_handlers(
      [self, gen](const message::PeerMessage &msg) { self->on_message(gen, msg); },
      [self, gen](message::DecodeError error) {
        if (gen != self->generation_)
          return;
        LOG_NET_WARN("Dropping undecodable message from peer {}: {}", self->identity_.id,
                     message::DecodeErrorString(error));
      },
      [self, gen](TransportError error) { self->on_session_closed(gen, error); });
}

bool PeerConnection::send(const message::PeerMessage &msg) {
  if (!session_ || !session_->is_ready()) {
    return false;
  }
  return session_->send(msg);
}

void PeerConnection::on_message(uint64_t generation, const message::PeerMessage &msg) {
  if (generation != generation_ || !state_.is_active()) {
    return;
  }

  switch (msg.type()) {
  case message::MessageType::Ping:
    if (!send(message::make_pong(local_id_))) {
      LOG_NET_DEBUG("Failed to answer ping from peer {}", identity_.id);
    }
    return;
  case message::MessageType::Pong:
    last_pong_ = util::GetSteadyTime();
    return;
  default:
    break;
  }

  if (message_handler_) {
    auto handler = message_handler_;
    handler(shared_from_this(), msg);
  }
}

void PeerConnection::on_session_closed(uint64_t generation, TransportError error) {
  if (generation != generation_ || !state_.is_active()) {
    return;
  }
  LOG_NET_INFO("Transport to peer {} closed: {}", identity_.id, TransportErrorString(error));
  set_state(PeerConnectionState::Failed(TransportErrorString(error)));
}

void PeerConnection::disconnect(bool send_disconnect) {
  if (!state_.is_active()) {
    return;
  }
  LOG_NET_DEBUG("Disconnecting peer {} (send_disconnect={})", identity_.id, send_disconnect);

  if (send_disconnect && session_ && session_->is_ready()) {
    if (!session_->send(message::make_disconnect(local_id_))) {
      LOG_NET_DEBUG("Disconnect message to peer {} not sent", identity_.id);
    }
  }
  if (session_) {
    session_->clear_handlers();
    session_->close();
  }
  set_state(PeerConnectionState::Disconnected());
}

void PeerConnection::cancel() {
  ++generation_;
  heartbeat_timer_.cancel();
  if (session_) {
    session_->clear_handlers();
    session_->close();
  }
  state_ = PeerConnectionState::Disconnected();
  message_handler_ = nullptr;
  state_handler_ = nullptr;
  disconnected_handler_ = nullptr;
}

void PeerConnection::replace_session(TransportSessionPtr session) {
  if (session_) {
    session_->clear_handlers();
    session_->close();
  }
  session_ = std::move(session);
  generation_ = next_generation_.fetch_add(1);
  LOG_NET_DEBUG("Peer {} transport replaced (generation {})", identity_.id, generation_);

  if (state_.is_connected() && session_) {
    install_session_handlers();
    session_->start();
    schedule_heartbeat();
  }
}

void PeerConnection::set_state(PeerConnectionState state) {
  if (state_ == state) {
    return;
  }
  auto self = shared_from_this();
  bool was_active = state_.is_active();
  state_ = std::move(state);

  if (state_.is_connected()) {
    schedule_heartbeat();
  }

  if (state_handler_) {
    auto handler = state_handler_;
    handler(self, state_);
  }

  if (was_active && !state_.is_active()) {
    heartbeat_timer_.cancel();
    if (session_) {
      session_->clear_handlers();
      session_->close();
    }
    if (disconnected_handler_) {
      auto handler = disconnected_handler_;
      handler(self);
    }
  }
}

void PeerConnection::schedule_heartbeat() {
  auto self = shared_from_this();
  uint64_t gen = generation_;
  heartbeat_timer_.expires_after(heartbeat_interval());
  heartbeat_timer_.async_wait([self, gen](const boost::system::error_code &ec) {
    if (ec || gen != self->generation_ || !self->state_.is_connected()) {
      return;
    }
    self->send_ping();
    self->schedule_heartbeat();
  });
}

void PeerConnection::send_ping() {
  if (transferring_) {
    return;
  }
  ++pings_sent_;
  // Lenient: a failed ping is logged and never tears the connection down
  if (!send(message::make_ping(local_id_))) {
    LOG_NET_DEBUG("Heartbeat ping to peer {} failed", identity_.id);
  }
}

} // namespace network
} // namespace peerlink
