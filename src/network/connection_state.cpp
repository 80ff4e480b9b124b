// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#include "network/connection_state.hpp"
#include <algorithm>
#include <cmath>
#include <map>

namespace peerlink {
namespace network {

namespace {

const std::map<StateKind, std::vector<StateKind>> &AdjacencyTable() {
  static const std::map<StateKind, std::vector<StateKind>> table = {
      {StateKind::Idle, {StateKind::Discovering}},
      {StateKind::Discovering,
       {StateKind::PeerFound, StateKind::Idle, StateKind::IncomingRequest}},
      {StateKind::PeerFound,
       {StateKind::Requesting, StateKind::Discovering, StateKind::IncomingRequest}},
      {StateKind::Requesting,
       {StateKind::Connecting, StateKind::Rejected, StateKind::Failed, StateKind::Disconnected}},
      {StateKind::IncomingRequest,
       {StateKind::Connecting, StateKind::Rejected, StateKind::Disconnected}},
      {StateKind::Connecting, {StateKind::Connected, StateKind::Failed, StateKind::Disconnected}},
      {StateKind::Connected,
       {StateKind::Transferring, StateKind::VoiceCall, StateKind::Disconnected, StateKind::Failed}},
      {StateKind::Transferring, {StateKind::Connected, StateKind::Failed, StateKind::Disconnected}},
      {StateKind::VoiceCall, {StateKind::Connected, StateKind::Disconnected, StateKind::Failed}},
      {StateKind::Disconnected, {StateKind::Idle, StateKind::Discovering}},
      {StateKind::Rejected, {StateKind::Idle, StateKind::Discovering}},
      {StateKind::Failed, {StateKind::Idle, StateKind::Discovering}},
  };
  return table;
}

} // namespace

const char *StateKindName(StateKind kind) {
  switch (kind) {
  case StateKind::Idle:
    return "Idle";
  case StateKind::Discovering:
    return "Discovering";
  case StateKind::PeerFound:
    return "PeerFound";
  case StateKind::Requesting:
    return "Requesting";
  case StateKind::IncomingRequest:
    return "IncomingRequest";
  case StateKind::Connecting:
    return "Connecting";
  case StateKind::Connected:
    return "Connected";
  case StateKind::Transferring:
    return "Transferring";
  case StateKind::VoiceCall:
    return "VoiceCall";
  case StateKind::Disconnected:
    return "Disconnected";
  case StateKind::Rejected:
    return "Rejected";
  case StateKind::Failed:
    return "Failed";
  }
  return "Unknown";
}

ConnectionState ConnectionState::Transferring(double progress) {
  ConnectionState s(StateKind::Transferring);
  s.progress_ = std::clamp(progress, 0.0, 1.0);
  return s;
}

ConnectionState ConnectionState::Failed(std::string reason) {
  ConnectionState s(StateKind::Failed);
  s.reason_ = std::move(reason);
  return s;
}

std::string ConnectionState::ToString() const {
  std::string out = StateKindName(kind_);
  if (kind_ == StateKind::Transferring) {
    out += "(" + std::to_string(static_cast<int>(std::lround(progress_ * 100))) + "%)";
  } else if (kind_ == StateKind::Failed && !reason_.empty()) {
    out += "(" + reason_ + ")";
  }
  return out;
}

const std::vector<StateKind> &AllowedTransitions(StateKind from) {
  static const std::vector<StateKind> none;
  const auto &table = AdjacencyTable();
  auto it = table.find(from);
  return it == table.end() ? none : it->second;
}

bool CanTransition(StateKind from, StateKind to) {
  const auto &targets = AllowedTransitions(from);
  return std::find(targets.begin(), targets.end(), to) != targets.end();
}

ConnectionState DeriveGlobalState(const std::vector<PeerActivity> &peers) {
  if (peers.empty()) {
    return ConnectionState::Discovering();
  }

  for (const auto &p : peers) {
    if (p.transferring) {
      return ConnectionState::Transferring(p.transfer_progress);
    }
  }
  for (const auto &p : peers) {
    if (p.in_voice_call) {
      return ConnectionState::VoiceCall();
    }
  }
  for (const auto &p : peers) {
    if (p.connected) {
      return ConnectionState::Connected();
    }
  }
  bool all_connecting = std::all_of(peers.begin(), peers.end(),
                                    [](const PeerActivity &p) { return p.connecting; });
  if (all_connecting) {
    return ConnectionState::Connecting();
  }
  return ConnectionState::Discovering();
}

TieBreakDecision ResolveTieBreak(const std::string &local_id, const std::string &remote_id) {
  return local_id < remote_id ? TieBreakDecision::AcceptIncoming : TieBreakDecision::KeepOutgoing;
}

} // namespace network
} // namespace peerlink
