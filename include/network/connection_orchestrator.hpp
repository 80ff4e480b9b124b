// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#pragma once

#include "network/circuit_breaker.hpp"
#include "network/collaborators.hpp"
#include "network/connection_state.hpp"
#include "network/discovery.hpp"
#include "network/file_transfer_session.hpp"
#include "network/message.hpp"
#include "network/message_dispatcher.hpp"
#include "network/notifications.hpp"
#include "network/peer_connection.hpp"
#include "network/peer_registry.hpp"
#include "network/protocol.hpp"
#include "network/retry_controller.hpp"
#include "network/transport.hpp"
#include "network/transport_session.hpp"
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace peerlink {
namespace network {

class MulticastDiscovery;

// Result of request_connection()
enum class ConnectionResult {
  Success,
  NotRunning,
  AlreadyConnected,
  RequestInProgress,
  RegistryFull,
  CircuitOpen,
  TransportFailed
};

const char *ConnectionResultName(ConnectionResult result);

// ConnectionOrchestrator - top-level coordinator of the session engine
// Owns the global state machine, the discovery coordinator, the peer registry
// and the resilience primitives; runs both sides of the handshake and routes
// post-handshake messages to the file transfer session or the collaborators.
//
// Global state: guarded transitions only (invalid ones are logged no-ops).
// While the registry is empty the handshake flows drive the state
// (Discovering -> PeerFound -> Requesting -> Connecting -> Connected, or
// IncomingRequest -> Connecting -> Connected). Once at least one peer is
// registered the state is derived from the registry with the precedence
// Transferring > VoiceCall > Connected, and further handshakes run without
// touching it.
//
// CRITICAL ARCHITECTURE CONSTRAINT: Single-threaded networking reactor
// - Every timer, receive callback and transfer step runs on one io_context
// - Config::io_threads MUST be 1 in production (0 = external io_context for tests)
// - Public methods other than start()/stop() must run on the io_context
//   thread; other threads post() onto io_context()
class ConnectionOrchestrator {
public:
  struct Config {
    uint16_t listen_port;            // 0 = ephemeral
    bool listen_enabled;             // Accept inbound handshakes
    bool enable_multicast_discovery; // Announce/browse on the local network
    bool auto_reconnect;             // Redial peers that dropped unexpectedly
    FeatureSettings features;
    size_t max_connections;
    size_t io_threads; // MUST be 1 in production (0 = external io_context for tests)

    Config()
        : listen_port(protocol::DEFAULT_PORT), listen_enabled(true),
          enable_multicast_discovery(true), auto_reconnect(true), features(),
          max_connections(protocol::MAX_CONNECTIONS), io_threads(1) {}
  };

  /**
   * @param transport           nullptr = RealTransport on the orchestrator's
   *                            io_context, with TLS when the identity
   *                            provider supplies a credential
   * @param external_io_context nullptr = create and own an io_context
   *
   * Collaborators must outlive the orchestrator.
   */
  ConnectionOrchestrator(IdentityProvider &identity, ConsentProvider &consent,
                         StorageProvider &storage, const Config &config = Config{},
                         std::shared_ptr<Transport> transport = nullptr,
                         std::shared_ptr<boost::asio::io_context> external_io_context = nullptr);
  ~ConnectionOrchestrator();

  ConnectionOrchestrator(const ConnectionOrchestrator &) = delete;
  ConnectionOrchestrator &operator=(const ConnectionOrchestrator &) = delete;

  // Lifecycle
  bool start();
  void stop();
  bool is_running() const { return running_.load(std::memory_order_acquire); }

  // Optional sinks (may be null)
  void set_chat_sink(ChatSink *sink) { chat_sink_ = sink; }
  void set_call_sink(CallSignalingSink *sink) { call_sink_ = sink; }

  // Discovery
  DiscoveryCoordinator &discovery() { return discovery_; }
  void start_discovery();
  void stop_discovery();

  // Outgoing handshake
  ConnectionResult request_connection(const DiscoveredPeer &peer);
  // Manual address: registered with discovery as "host:port" first
  ConnectionResult request_connection(const std::string &host, uint16_t port);
  // Abandon the attempt in progress (sends connectionCancel)
  void cancel_request();

  // Deliberate disconnects
  bool disconnect(const std::string &peer_id);
  void disconnect_all();

  // Post-handshake sends
  bool send_message(const std::string &peer_id, const message::PeerMessage &msg);
  bool send_text(const std::string &peer_id, const std::string &text);
  bool send_file(const std::string &peer_id, const std::filesystem::path &path);
  bool send_files(const std::string &peer_id, const std::vector<std::filesystem::path> &paths);
  bool cancel_transfer(const std::string &peer_id);

  // Voice call signaling (media itself is external)
  bool start_call(const std::string &peer_id);
  bool answer_call(const std::string &peer_id, bool accept);
  bool end_call(const std::string &peer_id);

  // Policy
  void set_features(const FeatureSettings &features) { config_.features = features; }
  const FeatureSettings &features() const { return config_.features; }
  void handle_lifecycle_change(LifecycleEvent event);

  // Entry point for inbound transport sessions (listener, tests)
  void handle_inbound_session(TransportSessionPtr session);

  // Queries
  const ConnectionState &state() const { return state_; }
  const message::PeerIdentity &local_identity() const { return local_identity_; }
  PeerRegistry &registry() { return registry_; }
  ConnectionNotifications &notifications() { return notifications_; }
  CircuitBreaker &circuit_breaker() { return circuit_breaker_; }
  RetryController &retry_controller() { return retry_controller_; }
  std::optional<PendingRequest> pending_request() const;
  bool has_outgoing_attempt() const { return outgoing_.has_value(); }
  uint64_t attempt_generation() const { return attempt_generation_; }
  uint16_t listening_port() const;
  boost::asio::io_context &io_context() { return *io_context_; }

#ifdef PEERLINK_TESTS
  static void SetRequestingTimeoutForTest(std::chrono::milliseconds timeout);
  static void SetConsentTimeoutForTest(std::chrono::milliseconds timeout);
  static void SetRejectedRecoveryDelayForTest(std::chrono::milliseconds delay);
  static void ResetTimeoutsForTest();

  // Test-only: drive the state machine directly
  bool transition_for_test(const ConnectionState &target) { return transition(target); }
  MessageDispatcher &dispatcher_for_test() { return dispatcher_; }
#endif

private:
  // An outgoing handshake in flight
  struct OutgoingAttempt {
    uint64_t generation = 0;
    DiscoveredPeer target;
    TransportSessionPtr session;
    bool request_sent = false;
  };

  // An inbound handshake in flight (before registration)
  struct InboundHandshake {
    uint64_t id = 0;
    TransportSessionPtr session;
    std::optional<message::PeerIdentity> identity;
    bool auto_accept = false; // simultaneous connect resolved in its favour
    bool awaiting_consent = false;
    std::shared_ptr<boost::asio::steady_timer> timer;
  };

  // State machine
  bool transition(const ConnectionState &target);
  void update_global_state();
  bool attempt_drives_state() const { return registry_.empty(); }
  void normalize_to_discovering();
  // Walk the handshake states up to Connecting (via Requesting or IncomingRequest)
  void enter_connecting(StateKind via);
  void resume_discovery();
  void schedule_rejected_recovery();

  // Outgoing handshake
  void on_outgoing_ready(uint64_t generation, bool ready, TransportError error);
  void on_outgoing_message(uint64_t generation, const message::PeerMessage &msg);
  void on_requesting_timeout(uint64_t generation);
  void fail_outgoing(uint64_t generation, const std::string &reason, bool record_failure,
                     bool send_cancel);
  void abandon_outgoing(bool send_cancel);

  // Inbound handshake
  void on_inbound_message(uint64_t id, const message::PeerMessage &msg);
  void on_inbound_closed(uint64_t id);
  void on_inbound_timeout(uint64_t id);
  void on_inbound_hello(InboundHandshake &hs, const message::PeerMessage &msg);
  void on_inbound_request(InboundHandshake &hs);
  // Tie-break for a request arriving while we dial out; true if handled
  bool resolve_simultaneous(InboundHandshake &hs);
  bool yielded_to(const std::string &peer_id) const;
  void on_consent_decision(uint64_t id, bool accepted);
  void accept_inbound(uint64_t id);
  void reject_inbound(uint64_t id, const std::string &reason);
  void drop_inbound(uint64_t id);
  void arm_inbound_timer(InboundHandshake &hs, std::chrono::milliseconds timeout);

  // Shared handshake checks; empty string means acceptable
  std::string validate_identity(const message::PeerMessage &msg, const TransportSessionPtr &session,
                                message::PeerIdentity &out) const;
  std::optional<const char *> admission_error(const std::string &peer_id) const;

  // Registered peers
  PeerConnectionPtr register_peer(TransportSessionPtr session,
                                  const message::PeerIdentity &identity);
  void register_message_handlers();
  void on_peer_message(PeerConnectionPtr peer, const message::PeerMessage &msg);
  void on_peer_state(PeerConnectionPtr peer, const PeerConnectionState &state);
  void on_peer_lost(PeerConnectionPtr peer);
  void on_remote_disconnect(PeerConnectionPtr peer);
  // deliberate: cancel the transfer instead of failing it
  void teardown_peer(const PeerConnectionPtr &peer, bool deliberate);
  void teardown();
  void on_transfer_phase(const std::string &peer_id, FileTransferSession::Phase phase);
  void on_transfer_progress(const std::string &peer_id, double progress);

  // Reconnect
  void schedule_reconnect(const DiscoveredPeer &target);

  static std::chrono::milliseconds requesting_timeout();
  static std::chrono::milliseconds consent_timeout();
  static std::chrono::milliseconds rejected_recovery_delay();

  Config config_;
  IdentityProvider &identity_provider_;
  ConsentProvider &consent_provider_;
  StorageProvider &storage_;
  ChatSink *chat_sink_{nullptr};
  CallSignalingSink *call_sink_{nullptr};

  std::shared_ptr<boost::asio::io_context> io_context_;
  bool external_io_context_;
  std::shared_ptr<Transport> transport_;
  std::unique_ptr<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::vector<std::thread> io_threads_;

  std::atomic<bool> running_{false};
  std::mutex start_stop_mutex_;
  std::shared_ptr<std::atomic<bool>> alive_ = std::make_shared<std::atomic<bool>>(true);

  message::PeerIdentity local_identity_;
  ConnectionState state_;
  ConnectionNotifications notifications_;
  DiscoveryCoordinator discovery_;
  std::shared_ptr<MulticastDiscovery> multicast_;
  PeerRegistry registry_;
  MessageDispatcher dispatcher_;
  RetryController retry_controller_;
  CircuitBreaker circuit_breaker_;

  // Outgoing handshake
  std::optional<OutgoingAttempt> outgoing_;
  uint64_t attempt_generation_{0};
  boost::asio::steady_timer requesting_timer_;
  boost::asio::steady_timer rejected_timer_;

  // Inbound handshakes
  std::map<uint64_t, InboundHandshake> inbound_;
  uint64_t next_inbound_id_{1};
  std::optional<uint64_t> pending_consent_;
  std::optional<PendingRequest> pending_request_;

  // A larger-id peer answered our attempt with busy because it is dialing
  // us too; its own attempt is accepted without consent until the deadline.
  struct YieldedAttempt {
    std::string peer_id;
    std::chrono::steady_clock::time_point deadline;
  };
  std::optional<YieldedAttempt> yielded_;

  // Peers we dialed (by identity id), for reconnection
  std::map<std::string, DiscoveredPeer> dial_targets_;
  // Discovery id of the peer being redialed
  std::optional<std::string> reconnect_peer_;
  boost::asio::steady_timer reconnect_timer_;

#ifdef PEERLINK_TESTS
  static std::atomic<std::chrono::milliseconds> requesting_timeout_override_ms_;
  static std::atomic<std::chrono::milliseconds> consent_timeout_override_ms_;
  static std::atomic<std::chrono::milliseconds> rejected_delay_override_ms_;
#endif
};

} // namespace network
} // namespace peerlink
