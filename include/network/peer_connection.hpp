// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#pragma once

#include "network/message.hpp"
#include "network/protocol.hpp"
#include "network/transport_session.hpp"
#include <atomic>
#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace peerlink {
namespace network {

class PeerConnection;
class FileTransferSession;
using PeerConnectionPtr = std::shared_ptr<PeerConnection>;

// Per-peer lifecycle state
class PeerConnectionState {
public:
  enum class Kind { Connecting, Connected, Disconnected, Failed };

  PeerConnectionState() = default;
  static PeerConnectionState Connecting() { return PeerConnectionState(Kind::Connecting); }
  static PeerConnectionState Connected() { return PeerConnectionState(Kind::Connected); }
  static PeerConnectionState Disconnected() { return PeerConnectionState(Kind::Disconnected); }
  static PeerConnectionState Failed(std::string reason) {
    PeerConnectionState s(Kind::Failed);
    s.reason_ = std::move(reason);
    return s;
  }

  Kind kind() const { return kind_; }
  const std::string &reason() const { return reason_; }
  bool is_active() const { return kind_ == Kind::Connecting || kind_ == Kind::Connected; }
  bool is_connected() const { return kind_ == Kind::Connected; }

  std::string ToString() const;

  bool operator==(const PeerConnectionState &other) const = default;

private:
  explicit PeerConnectionState(Kind kind) : kind_(kind) {}

  Kind kind_{Kind::Connecting};
  std::string reason_;
};

// Receives every message except Ping/Pong, which are answered internally
using PeerMessageHandler =
    std::function<void(PeerConnectionPtr peer, const message::PeerMessage &msg)>;
using PeerStateHandler =
    std::function<void(PeerConnectionPtr peer, const PeerConnectionState &state)>;
using PeerDisconnectedHandler = std::function<void(PeerConnectionPtr peer)>;

// PeerConnection - one registered peer after a successful handshake
// Owns its TransportSession, runs the generation-tagged receive loop and the
// heartbeat, and reports state changes upward.
//
// Generation token: minted on creation and on replace_session(). The receive
// loop and heartbeat capture it and exit silently once it is stale.
//
// NOTE: single-threaded reactor; no locks inside PeerConnection.
class PeerConnection : public std::enable_shared_from_this<PeerConnection> {
private:
  // Passkey idiom: allows make_shared while preventing direct construction
  struct PrivateTag {};

public:
  static PeerConnectionPtr create(boost::asio::io_context &io_context,
                                  TransportSessionPtr session,
                                  message::PeerIdentity remote_identity,
                                  std::string local_id);

  PeerConnection(PrivateTag, boost::asio::io_context &io_context, TransportSessionPtr session,
                 message::PeerIdentity remote_identity, std::string local_id);
  ~PeerConnection();

  PeerConnection(const PeerConnection &) = delete;
  PeerConnection &operator=(const PeerConnection &) = delete;

  // Connecting -> Connected: starts the receive loop and heartbeat
  void start();

  // Send a message; false if the session is gone
  bool send(const message::PeerMessage &msg);

  // Deliberate close (optionally sending Disconnect first) -> Disconnected
  void disconnect(bool send_disconnect = true);

  // Close without notifying anyone (registry teardown, shutdown)
  void cancel();

  // Swap in a new transport; the old one is closed and its pending work
  // becomes stale
  void replace_session(TransportSessionPtr session);

  void set_message_handler(PeerMessageHandler handler) { message_handler_ = std::move(handler); }
  void set_state_handler(PeerStateHandler handler) { state_handler_ = std::move(handler); }
  void set_disconnected_handler(PeerDisconnectedHandler handler) {
    disconnected_handler_ = std::move(handler);
  }

  const std::string &id() const { return identity_.id; }
  const message::PeerIdentity &identity() const { return identity_; }
  const PeerConnectionState &state() const { return state_; }
  bool is_active() const { return state_.is_active(); }
  bool is_connected() const { return state_.is_connected(); }
  uint64_t generation() const { return generation_; }
  const TransportSessionPtr &session() const { return session_; }
  std::string endpoint() const;

  // Sub-session flags maintained by the orchestrator
  bool transferring() const { return transferring_; }
  void set_transferring(bool transferring) { transferring_ = transferring; }
  double transfer_progress() const { return transfer_progress_; }
  void set_transfer_progress(double progress) { transfer_progress_ = progress; }
  bool in_voice_call() const { return in_voice_call_; }
  void set_in_voice_call(bool in_call) { in_voice_call_ = in_call; }

  const std::shared_ptr<FileTransferSession> &file_transfer() const { return file_transfer_; }
  void set_file_transfer(std::shared_ptr<FileTransferSession> session) {
    file_transfer_ = std::move(session);
  }

  // Last Pong seen (diagnostics only; the heartbeat never disconnects)
  std::chrono::steady_clock::time_point last_pong() const { return last_pong_; }
  uint64_t pings_sent() const { return pings_sent_; }

#ifdef PEERLINK_TESTS
  // Test-only: override heartbeat interval (0ms = default)
  static void SetHeartbeatIntervalForTest(std::chrono::milliseconds interval);
  static void ResetHeartbeatIntervalForTest();
#endif

private:
  void install_session_handlers();
  void on_message(uint64_t generation, const message::PeerMessage &msg);
  void on_session_closed(uint64_t generation, TransportError error);

  void set_state(PeerConnectionState state);

  // Heartbeat
  void schedule_heartbeat();
  void send_ping();

  static std::chrono::milliseconds heartbeat_interval();

  boost::asio::io_context &io_context_;
  TransportSessionPtr session_;
  message::PeerIdentity identity_;
  std::string local_id_;
  PeerConnectionState state_;
  uint64_t generation_;
  static std::atomic<uint64_t> next_generation_;

  boost::asio::steady_timer heartbeat_timer_;
  std::chrono::steady_clock::time_point last_pong_{};
  uint64_t pings_sent_{0};

  bool transferring_{false};
  double transfer_progress_{0.0};
  bool in_voice_call_{false};
  std::shared_ptr<FileTransferSession> file_transfer_;

  PeerMessageHandler message_handler_;
  PeerStateHandler state_handler_;
  PeerDisconnectedHandler disconnected_handler_;

#ifdef PEERLINK_TESTS
  static std::atomic<std::chrono::milliseconds> heartbeat_interval_override_ms_;
#endif
};

} // namespace network
} // namespace peerlink
