// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#pragma once

#include <string>
#include <vector>

namespace peerlink {
namespace network {

/**
 * Global connection state machine
 *
 * The orchestrator owns one ConnectionState and mutates it only through
 * CanTransition(). Transferring carries a progress fraction and Failed a
 * human-readable reason; neither value takes part in the adjacency check.
 */
enum class StateKind {
  Idle,
  Discovering,
  PeerFound,
  Requesting,
  IncomingRequest,
  Connecting,
  Connected,
  Transferring,
  VoiceCall,
  Disconnected,
  Rejected,
  Failed,
};

const char *StateKindName(StateKind kind);

class ConnectionState {
public:
  ConnectionState() = default;

  static ConnectionState Idle() { return ConnectionState(StateKind::Idle); }
  static ConnectionState Discovering() { return ConnectionState(StateKind::Discovering); }
  static ConnectionState PeerFound() { return ConnectionState(StateKind::PeerFound); }
  static ConnectionState Requesting() { return ConnectionState(StateKind::Requesting); }
  static ConnectionState IncomingRequest() { return ConnectionState(StateKind::IncomingRequest); }
  static ConnectionState Connecting() { return ConnectionState(StateKind::Connecting); }
  static ConnectionState Connected() { return ConnectionState(StateKind::Connected); }
  static ConnectionState Transferring(double progress);
  static ConnectionState VoiceCall() { return ConnectionState(StateKind::VoiceCall); }
  static ConnectionState Disconnected() { return ConnectionState(StateKind::Disconnected); }
  static ConnectionState Rejected() { return ConnectionState(StateKind::Rejected); }
  static ConnectionState Failed(std::string reason);

  StateKind kind() const { return kind_; }
  double progress() const { return progress_; }
  const std::string &reason() const { return reason_; }

  bool is_terminal() const {
    return kind_ == StateKind::Disconnected || kind_ == StateKind::Rejected ||
           kind_ == StateKind::Failed;
  }

  // e.g. "Transferring(42%)", "Failed(Connection timed out)"
  std::string ToString() const;

  bool operator==(const ConnectionState &other) const = default;

private:
  explicit ConnectionState(StateKind kind) : kind_(kind) {}

  StateKind kind_{StateKind::Idle};
  double progress_{0.0};
  std::string reason_;
};

// Adjacency table lookup; targets compare by kind only
bool CanTransition(StateKind from, StateKind to);

// Allowed targets from a state (empty for none)
const std::vector<StateKind> &AllowedTransitions(StateKind from);

/**
 * Per-peer activity used to derive the global state from the registry
 */
struct PeerActivity {
  bool connecting{false};
  bool connected{false};
  bool transferring{false};
  double transfer_progress{0.0};
  bool in_voice_call{false};
};

/**
 * Precedence: Transferring > VoiceCall > Connected > Connecting > Discovering
 *
 * Connecting only when every entry is still connecting; an empty registry
 * falls back to Discovering.
 */
ConnectionState DeriveGlobalState(const std::vector<PeerActivity> &peers);

/**
 * Simultaneous-connect tie-break
 *
 * Both sides dialed each other. The lexicographically larger id keeps its
 * outgoing attempt; the smaller id abandons its own and accepts the incoming
 * one. Identical ids cannot occur between distinct peers; they resolve to
 * KeepOutgoing so a loopback attempt never accepts itself.
 */
enum class TieBreakDecision {
  KeepOutgoing,   // reject the incoming attempt
  AcceptIncoming, // cancel the outgoing attempt, auto-accept the incoming one
};

TieBreakDecision ResolveTieBreak(const std::string &local_id, const std::string &remote_id);

} // namespace network
} // namespace peerlink
