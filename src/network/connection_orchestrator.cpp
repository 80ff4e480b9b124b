// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#include "network/connection_orchestrator.hpp"
#include "network/multicast_discovery.hpp"
#include "network/real_transport.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <boost/asio/post.hpp>
#include <future>

namespace peerlink {
namespace network {

using message::MessageType;
using message::PeerIdentity;
using message::PeerMessage;

#ifdef PEERLINK_TESTS
std::atomic<std::chrono::milliseconds> ConnectionOrchestrator::requesting_timeout_override_ms_{
    std::chrono::milliseconds{0}};
std::atomic<std::chrono::milliseconds> ConnectionOrchestrator::consent_timeout_override_ms_{
    std::chrono::milliseconds{0}};
std::atomic<std::chrono::milliseconds> ConnectionOrchestrator::rejected_delay_override_ms_{
    std::chrono::milliseconds{0}};

void ConnectionOrchestrator::SetRequestingTimeoutForTest(std::chrono::milliseconds timeout) {
  requesting_timeout_override_ms_.store(timeout, std::memory_order_relaxed);
}

void ConnectionOrchestrator::SetConsentTimeoutForTest(std::chrono::milliseconds timeout) {
  consent_timeout_override_ms_.store(timeout, std::memory_order_relaxed);
}

void ConnectionOrchestrator::SetRejectedRecoveryDelayForTest(std::chrono::milliseconds delay) {
  rejected_delay_override_ms_.store(delay, std::memory_order_relaxed);
}

void ConnectionOrchestrator::ResetTimeoutsForTest() {
  requesting_timeout_override_ms_.store(std::chrono::milliseconds{0}, std::memory_order_relaxed);
  consent_timeout_override_ms_.store(std::chrono::milliseconds{0}, std::memory_order_relaxed);
  rejected_delay_override_ms_.store(std::chrono::milliseconds{0}, std::memory_order_relaxed);
}
#endif

std::chrono::milliseconds ConnectionOrchestrator::requesting_timeout() {
#ifdef PEERLINK_TESTS
  auto ov = requesting_timeout_override_ms_.load(std::memory_order_relaxed);
  if (ov.count() > 0) {
    return ov;
  }
#endif
  return protocol::REQUESTING_TIMEOUT;
}

std::chrono::milliseconds ConnectionOrchestrator::consent_timeout() {
#ifdef PEERLINK_TESTS
  auto ov = consent_timeout_override_ms_.load(std::memory_order_relaxed);
  if (ov.count() > 0) {
    return ov;
  }
#endif
  return protocol::CONSENT_TIMEOUT;
}

std::chrono::milliseconds ConnectionOrchestrator::rejected_recovery_delay() {
#ifdef PEERLINK_TESTS
  auto ov = rejected_delay_override_ms_.load(std::memory_order_relaxed);
  if (ov.count() > 0) {
    return ov;
  }
#endif
  return protocol::REJECTED_RECOVERY_DELAY;
}

const char *ConnectionResultName(ConnectionResult result) {
  switch (result) {
  case ConnectionResult::Success:
    return "success";
  case ConnectionResult::NotRunning:
    return "not running";
  case ConnectionResult::AlreadyConnected:
    return "already connected";
  case ConnectionResult::RequestInProgress:
    return "request in progress";
  case ConnectionResult::RegistryFull:
    return "registry full";
  case ConnectionResult::CircuitOpen:
    return "circuit open";
  case ConnectionResult::TransportFailed:
    return "transport failed";
  }
  return "unknown";
}

namespace {

bool IsSessionState(StateKind kind) {
  return kind == StateKind::Connecting || kind == StateKind::Connected ||
         kind == StateKind::Transferring || kind == StateKind::VoiceCall;
}

} // namespace

ConnectionOrchestrator::ConnectionOrchestrator(
    IdentityProvider &identity, ConsentProvider &consent, StorageProvider &storage,
    const Config &config, std::shared_ptr<Transport> transport,
    std::shared_ptr<boost::asio::io_context> external_io_context)
    : config_(config), identity_provider_(identity), consent_provider_(consent),
      storage_(storage),
      // Shared ownership keeps the io_context alive for every pending handler
      io_context_(external_io_context ? external_io_context
                                      : std::make_shared<boost::asio::io_context>()),
      external_io_context_(external_io_context != nullptr), transport_(std::move(transport)),
      local_identity_(identity.local_identity()), state_(ConnectionState::Idle()),
      registry_(config.max_connections), requesting_timer_(*io_context_),
      rejected_timer_(*io_context_), reconnect_timer_(*io_context_) {

  if (!transport_) {
    auto tls = identity_provider_.tls_credential();
    auto real = std::make_shared<RealTransport>(*io_context_, tls);
    if (!real->tls_ready()) {
      LOG_NET_ERROR("TLS disabled: {}", real->tls_error());
    } else if (real->tls_enabled() && !local_identity_.certificate_fingerprint && tls) {
      local_identity_.certificate_fingerprint =
          RealTransport::certificate_fingerprint(tls->certificate_path);
    }
    transport_ = std::move(real);
  }

  if (config_.enable_multicast_discovery) {
    multicast_ = std::make_shared<MulticastDiscovery>(
        *io_context_, local_identity_.id, local_identity_.display_name, config_.listen_port);
    discovery_.add_backend(multicast_);
  }

  discovery_.set_peers_changed_handler(
      [this](const std::vector<DiscoveredPeer> &peers) { notifications_.NotifyPeersChanged(peers); });

  register_message_handlers();

  LOG_NET_TRACE("ConnectionOrchestrator initialized (id: {}, external_io_context: {})",
                local_identity_.id, external_io_context_ ? "yes" : "no");
}

ConnectionOrchestrator::~ConnectionOrchestrator() {
  stop();
  alive_->store(false);
}

// ============================================================================
// LIFECYCLE
// ============================================================================

bool ConnectionOrchestrator::start() {
  if (running_.load(std::memory_order_acquire)) {
    return false;
  }

  std::lock_guard<std::mutex> lock(start_stop_mutex_);
  if (running_.load(std::memory_order_acquire)) {
    return false;
  }
  running_.store(true, std::memory_order_release);

  transport_->run();

  if (config_.listen_enabled) {
    auto io = io_context_;
    auto alive = alive_;
    bool listening = transport_->listen(
        config_.listen_port, [this, io, alive](TransportConnectionPtr connection) {
          boost::asio::post(*io, [this, io, alive, connection]() {
            if (!alive->load() || !running_.load(std::memory_order_acquire)) {
              connection->close();
              return;
            }
            handle_inbound_session(TransportSession::accept(*io, connection));
          });
        });
    if (listening) {
      LOG_NET_INFO("Listening on port {}", transport_->listening_port());
      if (multicast_) {
        multicast_->set_local_port(transport_->listening_port());
      }
    } else {
      LOG_NET_ERROR("Failed to listen on port {}", config_.listen_port);
    }
  }

  discovery_.start();
  if (CanTransition(state_.kind(), StateKind::Discovering)) {
    transition(ConnectionState::Discovering());
  }

  if (config_.io_threads > 0 && !external_io_context_) {
    io_context_->restart();
    work_guard_ = std::make_unique<
        boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
        boost::asio::make_work_guard(*io_context_));
    for (size_t i = 0; i < config_.io_threads; ++i) {
      io_threads_.emplace_back([this]() { io_context_->run(); });
    }
  }

  return true;
}

void ConnectionOrchestrator::stop() {
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }

  std::lock_guard<std::mutex> lock(start_stop_mutex_);
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }
  running_.store(false, std::memory_order_release);

  // Peers and handshakes live on the reactor thread; tear them down there so
  // Disconnect messages go out before the io_context stops
  bool own_threads = !io_threads_.empty();
  if (own_threads && !io_context_->get_executor().running_in_this_thread()) {
    std::promise<void> done;
    auto finished = done.get_future();
    boost::asio::post(*io_context_, [this, &done]() {
      teardown();
      done.set_value();
    });
    finished.wait();
  } else {
    teardown();
  }

  if (own_threads) {
    work_guard_.reset();
    io_context_->stop();
    for (auto &thread : io_threads_) {
      if (thread.joinable() && thread.get_id() != std::this_thread::get_id()) {
        thread.join();
      } else if (thread.joinable()) {
        thread.detach();
      }
    }
    io_threads_.clear();
  }

  LOG_NET_INFO("ConnectionOrchestrator stopped");
}

void ConnectionOrchestrator::teardown() {
  rejected_timer_.cancel();
  reconnect_timer_.cancel();
  reconnect_peer_.reset();
  yielded_.reset();

  if (outgoing_) {
    cancel_request();
  }

  std::vector<uint64_t> inbound_ids;
  for (const auto &[id, hs] : inbound_) {
    inbound_ids.push_back(id);
  }
  for (uint64_t id : inbound_ids) {
    drop_inbound(id);
  }

  disconnect_all();

  discovery_.stop();
  transport_->stop();

  if (CanTransition(state_.kind(), StateKind::Idle)) {
    transition(ConnectionState::Idle());
  }
}

// ============================================================================
// STATE MACHINE
// ============================================================================

bool ConnectionOrchestrator::transition(const ConnectionState &target) {
  if (!CanTransition(state_.kind(), target.kind())) {
    LOG_NET_WARN("Invalid state transition: {} -> {}", state_.ToString(), target.ToString());
    return false;
  }
  LOG_NET_DEBUG("State: {} -> {}", state_.ToString(), target.ToString());
  state_ = target;
  notifications_.NotifyStateChange(state_);
  return true;
}

void ConnectionOrchestrator::normalize_to_discovering() {
  if (state_.kind() == StateKind::Idle || state_.is_terminal()) {
    transition(ConnectionState::Discovering());
  }
}

void ConnectionOrchestrator::enter_connecting(StateKind via) {
  if (!CanTransition(state_.kind(), StateKind::Connecting)) {
    normalize_to_discovering();
    if (via == StateKind::Requesting) {
      if (state_.kind() == StateKind::Discovering) {
        transition(ConnectionState::PeerFound());
      }
      transition(ConnectionState::Requesting());
    } else {
      transition(ConnectionState::IncomingRequest());
    }
  }
  transition(ConnectionState::Connecting());
}

void ConnectionOrchestrator::update_global_state() {
  if (registry_.empty()) {
    // The handshake and disconnect flows own the state while nobody is connected
    return;
  }

  ConnectionState target = registry_.derive_global_state();

  if (!IsSessionState(state_.kind())) {
    enter_connecting(StateKind::Requesting);
  }
  if (state_.kind() == StateKind::Connecting && target.kind() != StateKind::Connecting) {
    transition(ConnectionState::Connected());
  }

  if (target.kind() == state_.kind()) {
    if (target.kind() == StateKind::Transferring) {
      // Progress is reported through the transfer callbacks, not re-transitions
      state_ = target;
    }
    return;
  }

  // Transferring <-> VoiceCall passes through Connected
  if (!CanTransition(state_.kind(), target.kind()) &&
      CanTransition(state_.kind(), StateKind::Connected)) {
    transition(ConnectionState::Connected());
  }
  if (target.kind() != state_.kind()) {
    transition(target);
  }
}

void ConnectionOrchestrator::resume_discovery() {
  if (!running_.load(std::memory_order_acquire) || discovery_.is_running()) {
    return;
  }
  discovery_.start();
  if (registry_.empty() && state_.kind() != StateKind::Discovering) {
    normalize_to_discovering();
  }
}

void ConnectionOrchestrator::schedule_rejected_recovery() {
  uint64_t generation = attempt_generation_;
  rejected_timer_.expires_after(rejected_recovery_delay());
  rejected_timer_.async_wait([this, generation](const boost::system::error_code &ec) {
    if (ec || generation != attempt_generation_) {
      return;
    }
    if (state_.kind() == StateKind::Rejected) {
      transition(ConnectionState::Discovering());
    }
  });
}

void ConnectionOrchestrator::start_discovery() {
  discovery_.start();
  if (registry_.empty()) {
    normalize_to_discovering();
  }
}

void ConnectionOrchestrator::stop_discovery() {
  discovery_.stop();
  if (state_.kind() == StateKind::Discovering) {
    transition(ConnectionState::Idle());
  }
}

void ConnectionOrchestrator::handle_lifecycle_change(LifecycleEvent event) {
  if (event == LifecycleEvent::Background) {
    for (const auto &peer : registry_.all()) {
      if (peer->transferring() || peer->in_voice_call()) {
        LOG_NET_DEBUG("Backgrounded with activity on {}, keeping discovery", peer->id());
        return;
      }
    }
    discovery_.stop();
    return;
  }

  if (registry_.empty() && running_.load(std::memory_order_acquire)) {
    start_discovery();
  }
}

// ============================================================================
// OUTGOING HANDSHAKE
// ============================================================================

ConnectionResult ConnectionOrchestrator::request_connection(const std::string &host,
                                                            uint16_t port) {
  if (!running_.load(std::memory_order_acquire)) {
    return ConnectionResult::NotRunning;
  }
  std::string id = discovery_.add_manual_peer(host, port);
  auto peer = discovery_.find(id);
  if (!peer) {
    return ConnectionResult::TransportFailed;
  }
  return request_connection(*peer);
}

ConnectionResult ConnectionOrchestrator::request_connection(const DiscoveredPeer &peer) {
  if (!running_.load(std::memory_order_acquire)) {
    return ConnectionResult::NotRunning;
  }
  if (pending_consent_ && !outgoing_) {
    // Dialing the peer that is asking us to connect answers its request
    uint64_t id = *pending_consent_;
    auto it = inbound_.find(id);
    if (it != inbound_.end() &&
        (it->second.identity->id == peer.id || it->second.session->host() == peer.host())) {
      LOG_NET_INFO("{} is already asking to connect, accepting", it->second.identity->id);
      consent_provider_.cancel_consent(it->second.identity->id);
      accept_inbound(id);
      return ConnectionResult::Success;
    }
  }
  if (outgoing_ || pending_consent_) {
    LOG_NET_DEBUG("Ignoring request to {}: handshake in progress", peer.id);
    return ConnectionResult::RequestInProgress;
  }
  if (registry_.contains(peer.id)) {
    return ConnectionResult::AlreadyConnected;
  }
  for (const auto &[identity_id, target] : dial_targets_) {
    if (target.id == peer.id && registry_.contains(identity_id)) {
      return ConnectionResult::AlreadyConnected;
    }
  }
  if (registry_.is_full()) {
    return ConnectionResult::RegistryFull;
  }
  if (!circuit_breaker_.ShouldAttemptConnection(peer.id)) {
    LOG_NET_INFO("Not connecting to {}: circuit open", peer.id);
    return ConnectionResult::CircuitOpen;
  }
  if (!transport_->is_running()) {
    return ConnectionResult::TransportFailed;
  }

  rejected_timer_.cancel();
  uint64_t generation = ++attempt_generation_;

  if (attempt_drives_state()) {
    normalize_to_discovering();
    if (state_.kind() == StateKind::Discovering) {
      transition(ConnectionState::PeerFound());
    }
    transition(ConnectionState::Requesting());
  }

  LOG_NET_INFO("Requesting connection to {} at {}:{}", peer.id, peer.host(), peer.port());

  OutgoingAttempt attempt;
  attempt.generation = generation;
  attempt.target = peer;
  outgoing_ = std::move(attempt);

  // connect() always reports readiness asynchronously
  outgoing_->session = TransportSession::connect(
      *io_context_, *transport_, peer.host(), peer.port(),
      [this, generation](bool ready, TransportError error) {
        on_outgoing_ready(generation, ready, error);
      });

  return ConnectionResult::Success;
}

void ConnectionOrchestrator::on_outgoing_ready(uint64_t generation, bool ready,
                                               TransportError error) {
  if (!outgoing_ || outgoing_->generation != generation) {
    return;
  }
  if (!ready) {
    fail_outgoing(generation, TransportErrorString(error), true, false);
    return;
  }

  auto session = outgoing_->session;
  session->set_handlers(
      [this, generation](const PeerMessage &msg) { on_outgoing_message(generation, msg); },
      [this, generation](message::DecodeError error) {
        LOG_NET_WARN("Undecodable handshake message: {}", message::DecodeErrorString(error));
        fail_outgoing(generation, "Handshake failed", true, true);
      },
      [this, generation](TransportError error) {
        fail_outgoing(generation, TransportErrorString(error), true, false);
      });
  session->start();

  if (!session->send(message::make_hello(local_identity_)) ||
      !session->send(message::make_connection_request(local_identity_.id))) {
    fail_outgoing(generation, TransportErrorString(session->last_error()), true, false);
    return;
  }
  outgoing_->request_sent = true;

  requesting_timer_.expires_after(requesting_timeout());
  requesting_timer_.async_wait([this, generation](const boost::system::error_code &ec) {
    if (ec) {
      return;
    }
    on_requesting_timeout(generation);
  });
}

void ConnectionOrchestrator::on_outgoing_message(uint64_t generation, const PeerMessage &msg) {
  if (!outgoing_ || outgoing_->generation != generation) {
    return;
  }

  switch (msg.type()) {
  case MessageType::Hello:
    LOG_NET_DEBUG("Hello from {} before accept", msg.sender_id());
    return;

  case MessageType::ConnectionAccept: {
    PeerIdentity remote;
    std::string error = validate_identity(msg, outgoing_->session, remote);
    if (!error.empty()) {
      fail_outgoing(generation, error, true, true);
      return;
    }
    if (auto reason = admission_error(remote.id)) {
      LOG_NET_INFO("Dropping accepted connection to {}: {}", remote.id, *reason);
      if (!outgoing_->session->send(message::make_disconnect(local_identity_.id))) {
        LOG_NET_DEBUG("Could not send disconnect to {}", remote.id);
      }
      fail_outgoing(generation, "Connection failed", false, false);
      return;
    }

    requesting_timer_.cancel();
    OutgoingAttempt attempt = std::move(*outgoing_);
    outgoing_.reset();

    if (attempt_drives_state()) {
      enter_connecting(StateKind::Requesting);
    }
    retry_controller_.Reset();
    circuit_breaker_.RecordSuccess(attempt.target.id);
    if (attempt.target.source == DiscoverySource::Manual) {
      discovery_.mark_seen(attempt.target.id);
    }
    dial_targets_[remote.id] = attempt.target;
    reconnect_peer_.reset();

    register_peer(attempt.session, remote);
    return;
  }

  case MessageType::ConnectionReject: {
    message::RejectionPayload rejection;
    if (message::decode_payload(msg, rejection) != message::DecodeError::None) {
      rejection.reason = "unknown";
    }
    LOG_NET_INFO("Connection to {} rejected ({})", outgoing_->target.id, rejection.reason);

    if (rejection.reason == protocol::reasons::BUSY && !msg.sender_id().empty() &&
        ResolveTieBreak(local_identity_.id, msg.sender_id()) == TieBreakDecision::AcceptIncoming) {
      // The peer may be dialing us as well; its attempt wins
      yielded_ = YieldedAttempt{msg.sender_id(), util::GetSteadyTime() + requesting_timeout()};
    }

    requesting_timer_.cancel();
    OutgoingAttempt attempt = std::move(*outgoing_);
    outgoing_.reset();
    attempt.session->close();
    reconnect_peer_.reset();

    if (attempt_drives_state()) {
      transition(ConnectionState::Rejected());
      schedule_rejected_recovery();
    }
    return;
  }

  case MessageType::ConnectionCancel: {
    LOG_NET_INFO("Connection to {} cancelled by peer", outgoing_->target.id);
    requesting_timer_.cancel();
    OutgoingAttempt attempt = std::move(*outgoing_);
    outgoing_.reset();
    attempt.session->close();

    if (attempt_drives_state()) {
      transition(ConnectionState::Disconnected());
      transition(ConnectionState::Discovering());
    }
    return;
  }

  default:
    LOG_NET_WARN("Unexpected {} during handshake with {}", message::MessageTypeName(msg.type()),
                 outgoing_->target.id);
    fail_outgoing(generation, "Handshake failed", true, true);
    return;
  }
}

void ConnectionOrchestrator::on_requesting_timeout(uint64_t generation) {
  fail_outgoing(generation, "Connection timed out", true, true);
}

void ConnectionOrchestrator::fail_outgoing(uint64_t generation, const std::string &reason,
                                           bool record_failure, bool send_cancel) {
  if (!outgoing_ || outgoing_->generation != generation) {
    return;
  }

  requesting_timer_.cancel();
  OutgoingAttempt attempt = std::move(*outgoing_);
  outgoing_.reset();

  if (attempt.session) {
    attempt.session->clear_handlers();
    if (send_cancel && attempt.session->is_ready() &&
        !attempt.session->send(message::make_connection_cancel(local_identity_.id))) {
      LOG_NET_DEBUG("Could not send connectionCancel to {}", attempt.target.id);
    }
    attempt.session->close();
  }

  LOG_NET_WARN("Connection to {} failed: {}", attempt.target.id, reason);
  if (record_failure) {
    circuit_breaker_.RecordFailure(attempt.target.id);
  }

  if (attempt_drives_state()) {
    transition(ConnectionState::Failed(reason));
  }
  resume_discovery();

  if (config_.auto_reconnect && reconnect_peer_ && *reconnect_peer_ == attempt.target.id) {
    schedule_reconnect(attempt.target);
  }
}

void ConnectionOrchestrator::abandon_outgoing(bool send_cancel) {
  if (!outgoing_) {
    return;
  }
  requesting_timer_.cancel();
  OutgoingAttempt attempt = std::move(*outgoing_);
  outgoing_.reset();
  ++attempt_generation_;

  if (attempt.session) {
    attempt.session->clear_handlers();
    if (send_cancel && attempt.request_sent && attempt.session->is_ready() &&
        !attempt.session->send(message::make_connection_cancel(local_identity_.id))) {
      LOG_NET_DEBUG("Could not send connectionCancel to {}", attempt.target.id);
    }
    attempt.session->close();
  }
  LOG_NET_DEBUG("Abandoned connection attempt to {}", attempt.target.id);
}

void ConnectionOrchestrator::cancel_request() {
  if (!outgoing_) {
    return;
  }
  reconnect_peer_.reset();
  abandon_outgoing(true);
  if (attempt_drives_state() && state_.kind() == StateKind::Requesting) {
    transition(ConnectionState::Disconnected());
    transition(ConnectionState::Discovering());
  }
}

// ============================================================================
// INBOUND HANDSHAKE
// ============================================================================

void ConnectionOrchestrator::handle_inbound_session(TransportSessionPtr session) {
  if (!session) {
    return;
  }
  if (!running_.load(std::memory_order_acquire) || !session->is_ready()) {
    session->close();
    return;
  }

  uint64_t id = next_inbound_id_++;
  InboundHandshake hs;
  hs.id = id;
  hs.session = session;
  hs.timer = std::make_shared<boost::asio::steady_timer>(*io_context_);
  auto it = inbound_.emplace(id, std::move(hs)).first;

  LOG_NET_DEBUG("Inbound session from {}", session->endpoint());

  session->set_handlers(
      [this, id](const PeerMessage &msg) { on_inbound_message(id, msg); },
      [this, id](message::DecodeError error) {
        LOG_NET_WARN("Undecodable handshake message: {}", message::DecodeErrorString(error));
        drop_inbound(id);
      },
      [this, id](TransportError) { on_inbound_closed(id); });

  // Hello must arrive within the consent window
  arm_inbound_timer(it->second, consent_timeout());
  session->start();
}

void ConnectionOrchestrator::arm_inbound_timer(InboundHandshake &hs,
                                               std::chrono::milliseconds timeout) {
  hs.timer->expires_after(timeout);
  hs.timer->async_wait([this, id = hs.id](const boost::system::error_code &ec) {
    if (ec) {
      return;
    }
    on_inbound_timeout(id);
  });
}

void ConnectionOrchestrator::on_inbound_message(uint64_t id, const PeerMessage &msg) {
  auto it = inbound_.find(id);
  if (it == inbound_.end()) {
    return;
  }

  switch (msg.type()) {
  case MessageType::Hello:
    on_inbound_hello(it->second, msg);
    return;
  case MessageType::ConnectionRequest:
    on_inbound_request(it->second);
    return;
  case MessageType::ConnectionCancel:
  case MessageType::Disconnect:
    LOG_NET_INFO("Inbound request from {} withdrawn", it->second.session->endpoint());
    drop_inbound(id);
    return;
  default:
    LOG_NET_WARN("Unexpected {} during inbound handshake from {}",
                 message::MessageTypeName(msg.type()), it->second.session->endpoint());
    drop_inbound(id);
    return;
  }
}

void ConnectionOrchestrator::on_inbound_hello(InboundHandshake &hs, const PeerMessage &msg) {
  uint64_t id = hs.id;
  if (hs.identity) {
    LOG_NET_WARN("Duplicate hello from {}", hs.identity->id);
    drop_inbound(id);
    return;
  }

  PeerIdentity remote;
  std::string error = validate_identity(msg, hs.session, remote);
  if (!error.empty()) {
    LOG_NET_WARN("Rejecting inbound handshake from {}: {}", hs.session->endpoint(), error);
    drop_inbound(id);
    return;
  }
  hs.identity = remote;

  if (auto reason = admission_error(remote.id)) {
    reject_inbound(id, *reason);
    return;
  }

  if (outgoing_) {
    resolve_simultaneous(hs);
    return;
  }
  if (yielded_to(remote.id)) {
    LOG_NET_INFO("Simultaneous connect with {}: accepting theirs after busy", remote.id);
    yielded_.reset();
    rejected_timer_.cancel();
    hs.auto_accept = true;
  }
}

bool ConnectionOrchestrator::resolve_simultaneous(InboundHandshake &hs) {
  // Both sides dialed at once
  if (ResolveTieBreak(local_identity_.id, hs.identity->id) == TieBreakDecision::KeepOutgoing) {
    LOG_NET_INFO("Simultaneous connect with {}: keeping our attempt", hs.identity->id);
    reject_inbound(hs.id, protocol::reasons::BUSY);
    return false;
  }
  LOG_NET_INFO("Simultaneous connect with {}: accepting theirs", hs.identity->id);
  hs.auto_accept = true;
  abandon_outgoing(true);
  return true;
}

bool ConnectionOrchestrator::yielded_to(const std::string &peer_id) const {
  return yielded_ && yielded_->peer_id == peer_id && util::GetSteadyTime() < yielded_->deadline;
}

void ConnectionOrchestrator::on_inbound_request(InboundHandshake &hs) {
  uint64_t id = hs.id;
  if (!hs.identity) {
    LOG_NET_WARN("Connection request before hello from {}", hs.session->endpoint());
    drop_inbound(id);
    return;
  }
  if (hs.awaiting_consent) {
    return;
  }
  if (auto reason = admission_error(hs.identity->id)) {
    reject_inbound(id, *reason);
    return;
  }
  if (outgoing_ && !hs.auto_accept) {
    // Their hello arrived before we started dialing
    if (!resolve_simultaneous(hs)) {
      return;
    }
  }
  if (hs.auto_accept) {
    accept_inbound(id);
    return;
  }
  if (pending_consent_) {
    reject_inbound(id, protocol::reasons::BUSY);
    return;
  }

  hs.awaiting_consent = true;
  pending_consent_ = id;
  pending_request_ = PendingRequest{*hs.identity, hs.session->endpoint(), util::GetTime()};
  arm_inbound_timer(hs, consent_timeout());

  if (attempt_drives_state()) {
    normalize_to_discovering();
    transition(ConnectionState::IncomingRequest());
  }

  LOG_NET_INFO("Connection request from {} ({})", hs.identity->display_name, hs.identity->id);

  // Decisions are applied from a fresh handler, never re-entrantly
  auto io = io_context_;
  auto alive = alive_;
  consent_provider_.request_consent(*pending_request_, [this, io, alive, id](bool accepted) {
    boost::asio::post(*io, [this, alive, id, accepted]() {
      if (!alive->load()) {
        return;
      }
      on_consent_decision(id, accepted);
    });
  });
}

void ConnectionOrchestrator::on_consent_decision(uint64_t id, bool accepted) {
  if (!pending_consent_ || *pending_consent_ != id) {
    LOG_NET_DEBUG("Ignoring stale consent decision");
    return;
  }
  if (accepted) {
    accept_inbound(id);
  } else {
    reject_inbound(id, protocol::reasons::USER_DECLINED);
  }
}

void ConnectionOrchestrator::accept_inbound(uint64_t id) {
  auto it = inbound_.find(id);
  if (it == inbound_.end()) {
    return;
  }
  InboundHandshake hs = std::move(it->second);
  inbound_.erase(it);
  hs.timer->cancel();

  bool was_pending = pending_consent_ && *pending_consent_ == id;
  if (was_pending) {
    pending_consent_.reset();
    pending_request_.reset();
  }

  // Peers may have connected while the user was deciding
  if (auto reason = admission_error(hs.identity->id)) {
    hs.session->clear_handlers();
    if (!hs.session->send(message::make_connection_reject(local_identity_.id, *reason))) {
      LOG_NET_DEBUG("Could not send connectionReject to {}", hs.identity->id);
    }
    hs.session->close();
    if (attempt_drives_state() && state_.kind() == StateKind::IncomingRequest) {
      transition(ConnectionState::Rejected());
      transition(ConnectionState::Discovering());
    }
    return;
  }

  hs.session->clear_handlers();
  if (!hs.session->send(message::make_connection_accept(local_identity_)) ||
      !hs.session->send(message::make_hello(local_identity_))) {
    LOG_NET_WARN("Lost {} while accepting", hs.identity->id);
    hs.session->close();
    if (attempt_drives_state() && state_.kind() == StateKind::IncomingRequest) {
      transition(ConnectionState::Disconnected());
      transition(ConnectionState::Discovering());
    }
    return;
  }

  if (attempt_drives_state()) {
    enter_connecting(StateKind::IncomingRequest);
  }
  register_peer(hs.session, *hs.identity);
}

void ConnectionOrchestrator::reject_inbound(uint64_t id, const std::string &reason) {
  auto it = inbound_.find(id);
  if (it == inbound_.end()) {
    return;
  }
  InboundHandshake hs = std::move(it->second);
  inbound_.erase(it);
  hs.timer->cancel();

  LOG_NET_INFO("Rejecting connection from {} ({})",
               hs.identity ? hs.identity->id : hs.session->endpoint(), reason);
  hs.session->clear_handlers();
  if (!hs.session->send(message::make_connection_reject(local_identity_.id, reason))) {
    LOG_NET_DEBUG("Could not send connectionReject to {}", hs.session->endpoint());
  }
  hs.session->close();

  if (pending_consent_ && *pending_consent_ == id) {
    pending_consent_.reset();
    pending_request_.reset();
    if (attempt_drives_state() && state_.kind() == StateKind::IncomingRequest) {
      transition(ConnectionState::Rejected());
      transition(ConnectionState::Discovering());
    }
  }
}

void ConnectionOrchestrator::drop_inbound(uint64_t id) {
  auto it = inbound_.find(id);
  if (it == inbound_.end()) {
    return;
  }
  InboundHandshake hs = std::move(it->second);
  inbound_.erase(it);
  hs.timer->cancel();
  hs.session->clear_handlers();
  hs.session->close();

  if (pending_consent_ && *pending_consent_ == id) {
    pending_consent_.reset();
    pending_request_.reset();
    consent_provider_.cancel_consent(hs.identity->id);
    if (attempt_drives_state() && state_.kind() == StateKind::IncomingRequest) {
      transition(ConnectionState::Disconnected());
      transition(ConnectionState::Discovering());
    }
  }

  // We gave up our own attempt for this one
  if (hs.auto_accept && !outgoing_ && attempt_drives_state() &&
      state_.kind() == StateKind::Requesting) {
    transition(ConnectionState::Disconnected());
    transition(ConnectionState::Discovering());
  }
}

void ConnectionOrchestrator::on_inbound_closed(uint64_t id) {
  LOG_NET_DEBUG("Inbound handshake session closed");
  drop_inbound(id);
}

void ConnectionOrchestrator::on_inbound_timeout(uint64_t id) {
  auto it = inbound_.find(id);
  if (it == inbound_.end()) {
    return;
  }
  if (!it->second.awaiting_consent) {
    LOG_NET_INFO("No handshake from {} in time", it->second.session->endpoint());
    drop_inbound(id);
    return;
  }

  LOG_NET_INFO("Connection request from {} expired", it->second.identity->id);
  consent_provider_.cancel_consent(it->second.identity->id);
  reject_inbound(id, protocol::reasons::TIMEOUT);
}

std::optional<PendingRequest> ConnectionOrchestrator::pending_request() const {
  return pending_request_;
}

uint16_t ConnectionOrchestrator::listening_port() const {
  return transport_->listening_port();
}

// ============================================================================
// HANDSHAKE CHECKS
// ============================================================================

std::string ConnectionOrchestrator::validate_identity(const PeerMessage &msg,
                                                      const TransportSessionPtr &session,
                                                      PeerIdentity &out) const {
  if (msg.version() != protocol::PROTOCOL_VERSION) {
    return "Protocol version mismatch";
  }
  if (message::decode_payload(msg, out) != message::DecodeError::None || out.id.empty()) {
    return "Malformed identity";
  }
  if (out.id == local_identity_.id) {
    return "Connected to self";
  }
  auto presented = session ? session->peer_certificate_fingerprint() : std::nullopt;
  if (presented && out.certificate_fingerprint && *presented != *out.certificate_fingerprint) {
    return "Certificate fingerprint mismatch";
  }
  return {};
}

std::optional<const char *>
ConnectionOrchestrator::admission_error(const std::string &peer_id) const {
  if (registry_.contains(peer_id)) {
    return protocol::reasons::ALREADY_CONNECTED;
  }
  if (registry_.is_full()) {
    return protocol::reasons::CAPACITY;
  }
  return std::nullopt;
}

// ============================================================================
// REGISTERED PEERS
// ============================================================================

PeerConnectionPtr ConnectionOrchestrator::register_peer(TransportSessionPtr session,
                                                        const PeerIdentity &identity) {
  auto peer = PeerConnection::create(*io_context_, session, identity, local_identity_.id);
  peer->set_message_handler(
      [this](PeerConnectionPtr p, const PeerMessage &msg) { on_peer_message(p, msg); });
  peer->set_state_handler(
      [this](PeerConnectionPtr p, const PeerConnectionState &state) { on_peer_state(p, state); });
  peer->set_disconnected_handler([this](PeerConnectionPtr p) { on_peer_lost(p); });

  const std::string peer_id = identity.id;
  std::weak_ptr<PeerConnection> weak = peer;
  auto transfer = FileTransferSession::create(
      *io_context_, peer_id, local_identity_.id, storage_,
      [weak](const PeerMessage &msg) {
        auto p = weak.lock();
        return p && p->send(msg);
      },
      [weak]() -> size_t {
        auto p = weak.lock();
        return p && p->session() ? p->session()->send_queue_bytes() : 0;
      });
  transfer->set_progress_handler(
      [this, peer_id](double progress) { on_transfer_progress(peer_id, progress); });
  transfer->set_phase_handler([this, peer_id](FileTransferSession::Phase phase, const std::string &) {
    on_transfer_phase(peer_id, phase);
  });
  transfer->set_record_handler([this, peer_id](const TransferRecord &record) {
    notifications_.NotifyTransferComplete(peer_id, record);
  });
  peer->set_file_transfer(transfer);

  auto result = registry_.add(peer);
  if (result != PeerRegistry::AddResult::Added) {
    LOG_NET_WARN("Could not register {}: {}", peer_id, AddResultName(result));
    transfer->set_progress_handler(nullptr);
    transfer->set_phase_handler(nullptr);
    transfer->set_record_handler(nullptr);
    peer->cancel();
    return nullptr;
  }

  peer->start();
  LOG_NET_INFO("Connected to {} ({}) at {} [{}/{}]", identity.display_name, peer_id,
               peer->endpoint(), registry_.size(), registry_.capacity());
  return peer;
}

void ConnectionOrchestrator::on_peer_message(PeerConnectionPtr peer, const PeerMessage &msg) {
  notifications_.NotifyMessageReceived(msg, peer->id());
  if (!dispatcher_.Dispatch(peer, msg)) {
    LOG_NET_DEBUG("Unhandled {} from {}", message::MessageTypeName(msg.type()), peer->id());
  }
}

void ConnectionOrchestrator::on_peer_state(PeerConnectionPtr peer,
                                           const PeerConnectionState &state) {
  notifications_.NotifyPeerConnectionChange(peer->id(), state);
  if (state.is_connected() && registry_.get(peer->id()) == peer) {
    update_global_state();
  }
}

void ConnectionOrchestrator::on_peer_lost(PeerConnectionPtr peer) {
  // Deliberate disconnects deregister first
  if (registry_.get(peer->id()) != peer) {
    return;
  }

  const std::string peer_id = peer->id();
  std::string reason =
      peer->state().reason().empty() ? std::string("Connection lost") : peer->state().reason();
  LOG_NET_WARN("Lost connection to {}: {}", peer_id, reason);

  registry_.remove(peer_id);
  teardown_peer(peer, false);
  notifications_.NotifyDisconnected(peer_id);

  std::optional<DiscoveredPeer> redial;
  if (auto it = dial_targets_.find(peer_id); it != dial_targets_.end()) {
    redial = it->second;
    dial_targets_.erase(it);
  }

  if (registry_.empty()) {
    transition(ConnectionState::Failed(reason));
    resume_discovery();
  } else {
    update_global_state();
  }

  if (config_.auto_reconnect && redial &&
      peer->state().kind() == PeerConnectionState::Kind::Failed) {
    retry_controller_.Reset();
    schedule_reconnect(*redial);
  }
}

void ConnectionOrchestrator::on_remote_disconnect(PeerConnectionPtr peer) {
  if (registry_.get(peer->id()) != peer) {
    return;
  }
  const std::string peer_id = peer->id();
  LOG_NET_INFO("Peer {} disconnected", peer_id);

  registry_.remove(peer_id);
  teardown_peer(peer, false);
  peer->disconnect(false);
  dial_targets_.erase(peer_id);
  notifications_.NotifyDisconnected(peer_id);

  if (registry_.empty()) {
    transition(ConnectionState::Failed("Peer disconnected"));
    resume_discovery();
  } else {
    update_global_state();
  }
}

void ConnectionOrchestrator::teardown_peer(const PeerConnectionPtr &peer, bool deliberate) {
  if (auto transfer = peer->file_transfer()) {
    if (transfer->is_active()) {
      if (deliberate) {
        transfer->cancel();
      } else {
        transfer->handle_transport_failure();
      }
    }
    transfer->set_progress_handler(nullptr);
    transfer->set_phase_handler(nullptr);
    transfer->set_record_handler(nullptr);
  }
  peer->set_transferring(false);

  if (peer->in_voice_call()) {
    peer->set_in_voice_call(false);
    if (call_sink_) {
      call_sink_->on_call_end(peer->id());
    }
  }
}

bool ConnectionOrchestrator::disconnect(const std::string &peer_id) {
  auto peer = registry_.remove(peer_id);
  if (!peer) {
    return false;
  }
  LOG_NET_INFO("Disconnecting from {}", peer_id);

  teardown_peer(peer, true);
  peer->disconnect(true);
  dial_targets_.erase(peer_id);
  if (reconnect_peer_) {
    reconnect_timer_.cancel();
    reconnect_peer_.reset();
  }
  notifications_.NotifyDisconnected(peer_id);

  if (registry_.empty()) {
    transition(ConnectionState::Disconnected());
    transition(ConnectionState::Discovering());
    resume_discovery();
  } else {
    update_global_state();
  }
  return true;
}

void ConnectionOrchestrator::disconnect_all() {
  for (const auto &peer_id : registry_.ids()) {
    disconnect(peer_id);
  }
}

void ConnectionOrchestrator::on_transfer_phase(const std::string &peer_id,
                                               FileTransferSession::Phase phase) {
  auto peer = registry_.get(peer_id);
  if (!peer) {
    return;
  }
  bool active =
      phase == FileTransferSession::Phase::Accepted || phase == FileTransferSession::Phase::Streaming;
  peer->set_transferring(active);
  if (!active) {
    peer->set_transfer_progress(0.0);
  }
  update_global_state();
}

void ConnectionOrchestrator::on_transfer_progress(const std::string &peer_id, double progress) {
  auto peer = registry_.get(peer_id);
  if (!peer) {
    return;
  }
  peer->set_transfer_progress(progress);
  notifications_.NotifyTransferProgress(peer_id, progress);
  update_global_state();
}

// ============================================================================
// MESSAGE ROUTING
// ============================================================================

void ConnectionOrchestrator::register_message_handlers() {
  // Late handshake traffic (the acceptor's second hello among others)
  dispatcher_.RegisterHandler(
      {MessageType::Hello, MessageType::ConnectionRequest, MessageType::ConnectionAccept,
       MessageType::ConnectionReject, MessageType::ConnectionCancel},
      [](PeerConnectionPtr peer, const PeerMessage &msg) {
        LOG_NET_DEBUG("Ignoring {} from connected peer {}", message::MessageTypeName(msg.type()),
                      peer->id());
        return true;
      });

  dispatcher_.RegisterHandler(MessageType::Disconnect,
                              [this](PeerConnectionPtr peer, const PeerMessage &) {
                                on_remote_disconnect(peer);
                                return true;
                              });

  // === File transfer ===

  dispatcher_.RegisterHandler(
      MessageType::FileOffer, [this](PeerConnectionPtr peer, const PeerMessage &msg) {
        if (!config_.features.file_transfer) {
          LOG_XFER_INFO("File transfer disabled, rejecting offer from {}", peer->id());
          if (!peer->send(message::make_file_reject(local_identity_.id,
                                                    protocol::reasons::FEATURE_DISABLED))) {
            LOG_XFER_DEBUG("Could not send fileReject to {}", peer->id());
          }
          return true;
        }
        return peer->file_transfer() && peer->file_transfer()->handle_message(msg);
      });

  dispatcher_.RegisterHandler(
      {MessageType::FileAccept, MessageType::FileReject, MessageType::FileChunk,
       MessageType::FileComplete, MessageType::BatchStart, MessageType::BatchComplete},
      [](PeerConnectionPtr peer, const PeerMessage &msg) {
        return peer->file_transfer() && peer->file_transfer()->handle_message(msg);
      });

  // === Voice call signaling ===

  dispatcher_.RegisterHandler(
      MessageType::CallRequest, [this](PeerConnectionPtr peer, const PeerMessage &) {
        if (!config_.features.voice_call) {
          if (!peer->send(message::make_call_reject(local_identity_.id,
                                                    protocol::reasons::FEATURE_DISABLED))) {
            LOG_NET_DEBUG("Could not send callReject to {}", peer->id());
          }
          return true;
        }
        for (const auto &other : registry_.all()) {
          if (other->in_voice_call()) {
            if (!peer->send(message::make_call_reject(local_identity_.id, protocol::reasons::BUSY))) {
              LOG_NET_DEBUG("Could not send callReject to {}", peer->id());
            }
            return true;
          }
        }
        if (call_sink_) {
          call_sink_->on_call_request(peer->id());
        }
        return true;
      });

  dispatcher_.RegisterHandler(MessageType::CallAccept,
                              [this](PeerConnectionPtr peer, const PeerMessage &) {
                                peer->set_in_voice_call(true);
                                update_global_state();
                                if (call_sink_) {
                                  call_sink_->on_call_accept(peer->id());
                                }
                                return true;
                              });

  dispatcher_.RegisterHandler(
      MessageType::CallReject, [this](PeerConnectionPtr peer, const PeerMessage &msg) {
        message::RejectionPayload rejection;
        if (message::decode_payload(msg, rejection) != message::DecodeError::None) {
          return false;
        }
        if (call_sink_) {
          call_sink_->on_call_reject(peer->id(), rejection.reason);
        }
        return true;
      });

  dispatcher_.RegisterHandler(MessageType::CallEnd,
                              [this](PeerConnectionPtr peer, const PeerMessage &) {
                                peer->set_in_voice_call(false);
                                update_global_state();
                                if (call_sink_) {
                                  call_sink_->on_call_end(peer->id());
                                }
                                return true;
                              });

  dispatcher_.RegisterHandler(
      {MessageType::SdpOffer, MessageType::SdpAnswer, MessageType::IceCandidate},
      [this](PeerConnectionPtr peer, const PeerMessage &msg) {
        if (call_sink_) {
          call_sink_->on_signaling(peer->id(), msg);
        }
        return true;
      });

  // === Chat ===

  dispatcher_.RegisterHandler(
      MessageType::TextMessage, [this](PeerConnectionPtr peer, const PeerMessage &msg) {
        if (!config_.features.chat) {
          if (!peer->send(message::make_chat_reject(local_identity_.id,
                                                    protocol::reasons::FEATURE_DISABLED))) {
            LOG_NET_DEBUG("Could not send chatReject to {}", peer->id());
          }
          return true;
        }
        message::TextMessagePayload text;
        if (message::decode_payload(msg, text) != message::DecodeError::None) {
          return false;
        }
        if (chat_sink_) {
          chat_sink_->on_text_message(peer->id(), text);
        }
        return true;
      });

  dispatcher_.RegisterHandler(
      MessageType::MediaMessage, [this](PeerConnectionPtr peer, const PeerMessage &msg) {
        if (!config_.features.chat) {
          if (!peer->send(message::make_chat_reject(local_identity_.id,
                                                    protocol::reasons::FEATURE_DISABLED))) {
            LOG_NET_DEBUG("Could not send chatReject to {}", peer->id());
          }
          return true;
        }
        message::MediaMessagePayload media;
        if (message::decode_payload(msg, media) != message::DecodeError::None) {
          return false;
        }
        if (chat_sink_) {
          chat_sink_->on_media_message(peer->id(), media);
        }
        return true;
      });

  dispatcher_.RegisterHandler(
      MessageType::Reaction, [this](PeerConnectionPtr peer, const PeerMessage &msg) {
        message::ReactionPayload reaction;
        if (message::decode_payload(msg, reaction) != message::DecodeError::None) {
          return false;
        }
        if (chat_sink_) {
          chat_sink_->on_reaction(peer->id(), reaction);
        }
        return true;
      });

  dispatcher_.RegisterHandler(
      MessageType::MessageReceipt, [this](PeerConnectionPtr peer, const PeerMessage &msg) {
        message::MessageReceiptPayload receipt;
        if (message::decode_payload(msg, receipt) != message::DecodeError::None) {
          return false;
        }
        if (chat_sink_) {
          chat_sink_->on_receipt(peer->id(), receipt);
        }
        return true;
      });

  dispatcher_.RegisterHandler(
      MessageType::TypingIndicator, [this](PeerConnectionPtr peer, const PeerMessage &msg) {
        message::TypingIndicatorPayload typing;
        if (message::decode_payload(msg, typing) != message::DecodeError::None) {
          return false;
        }
        if (chat_sink_) {
          chat_sink_->on_typing(peer->id(), typing.is_typing);
        }
        return true;
      });

  dispatcher_.RegisterHandler(
      MessageType::ChatReject, [this](PeerConnectionPtr peer, const PeerMessage &msg) {
        message::RejectionPayload rejection;
        if (message::decode_payload(msg, rejection) != message::DecodeError::None) {
          return false;
        }
        if (chat_sink_) {
          chat_sink_->on_chat_rejected(peer->id(), rejection.reason);
        }
        return true;
      });
}

// ============================================================================
// SENDING
// ============================================================================

bool ConnectionOrchestrator::send_message(const std::string &peer_id, const PeerMessage &msg) {
  auto peer = registry_.get(peer_id);
  return peer && peer->is_connected() && peer->send(msg);
}

bool ConnectionOrchestrator::send_text(const std::string &peer_id, const std::string &text) {
  message::TextMessagePayload payload;
  payload.text = text;
  payload.timestamp = static_cast<double>(util::GetTime());
  payload.sender_name = local_identity_.display_name;
  return send_message(peer_id, message::make_text_message(local_identity_.id, payload));
}

bool ConnectionOrchestrator::send_file(const std::string &peer_id,
                                       const std::filesystem::path &path) {
  if (!config_.features.file_transfer) {
    return false;
  }
  auto peer = registry_.get(peer_id);
  if (!peer || !peer->is_connected() || !peer->file_transfer()) {
    return false;
  }
  return peer->file_transfer()->send_file(path);
}

bool ConnectionOrchestrator::send_files(const std::string &peer_id,
                                        const std::vector<std::filesystem::path> &paths) {
  if (!config_.features.file_transfer) {
    return false;
  }
  auto peer = registry_.get(peer_id);
  if (!peer || !peer->is_connected() || !peer->file_transfer()) {
    return false;
  }
  return peer->file_transfer()->send_files(paths);
}

bool ConnectionOrchestrator::cancel_transfer(const std::string &peer_id) {
  auto peer = registry_.get(peer_id);
  if (!peer || !peer->file_transfer() || !peer->file_transfer()->is_active()) {
    return false;
  }
  peer->file_transfer()->cancel();
  return true;
}

bool ConnectionOrchestrator::start_call(const std::string &peer_id) {
  if (!config_.features.voice_call) {
    return false;
  }
  return send_message(peer_id, message::make_call_request(local_identity_.id));
}

bool ConnectionOrchestrator::answer_call(const std::string &peer_id, bool accept) {
  auto peer = registry_.get(peer_id);
  if (!peer) {
    return false;
  }
  if (!accept) {
    return peer->send(
        message::make_call_reject(local_identity_.id, protocol::reasons::USER_DECLINED));
  }
  if (!peer->send(message::make_call_accept(local_identity_.id))) {
    return false;
  }
  peer->set_in_voice_call(true);
  update_global_state();
  return true;
}

bool ConnectionOrchestrator::end_call(const std::string &peer_id) {
  auto peer = registry_.get(peer_id);
  if (!peer || !peer->in_voice_call()) {
    return false;
  }
  if (!peer->send(message::make_call_end(local_identity_.id))) {
    LOG_NET_DEBUG("Could not send callEnd to {}", peer_id);
  }
  peer->set_in_voice_call(false);
  update_global_state();
  return true;
}

// ============================================================================
// RECONNECT
// ============================================================================

void ConnectionOrchestrator::schedule_reconnect(const DiscoveredPeer &target) {
  auto delay = retry_controller_.NextDelay();
  if (!delay) {
    LOG_NET_INFO("Giving up on {} after {} attempts", target.id,
                 retry_controller_.CurrentAttempt());
    reconnect_peer_.reset();
    return;
  }

  reconnect_peer_ = target.id;
  LOG_NET_DEBUG("Reconnecting to {} in {}ms", target.id, delay->count());
  reconnect_timer_.expires_after(*delay);
  reconnect_timer_.async_wait([this, target](const boost::system::error_code &ec) {
    if (ec || !running_.load(std::memory_order_acquire)) {
      return;
    }
    if (!reconnect_peer_ || *reconnect_peer_ != target.id) {
      return;
    }

    ConnectionResult result = request_connection(target);
    switch (result) {
    case ConnectionResult::Success:
      // Failure of the attempt reschedules through fail_outgoing()
      return;
    case ConnectionResult::RequestInProgress:
    case ConnectionResult::TransportFailed:
      schedule_reconnect(target);
      return;
    default:
      LOG_NET_INFO("Not reconnecting to {}: {}", target.id, ConnectionResultName(result));
      reconnect_peer_.reset();
      return;
    }
  });
}

} // namespace network
} // namespace peerlink
