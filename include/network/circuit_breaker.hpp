// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#pragma once

/*
 CircuitBreaker - per-peer connection gate

 Purpose
 - Stop hammering a peer that keeps failing
 - Let it back in after a cooldown

 Rules
 1. FAILURE_THRESHOLD consecutive failures open the circuit for that peer
 2. While open, ShouldAttemptConnection() returns false
 3. After COOLDOWN since the last failure the circuit closes again and the
    failure count starts over
 4. RecordSuccess() forgets the peer

 Time comes from util::GetSteadyTime() so tests drive it with SetMockTime().
*/

#include "network/protocol.hpp"
#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <string>

namespace peerlink {
namespace network {

class CircuitBreaker {
public:
  struct Entry {
    int failure_count{0};
    std::chrono::steady_clock::time_point last_failed_at{};
  };

  CircuitBreaker(int failure_threshold = protocol::breaker::FAILURE_THRESHOLD,
                 std::chrono::seconds cooldown = protocol::breaker::COOLDOWN);

  CircuitBreaker(const CircuitBreaker &) = delete;
  CircuitBreaker &operator=(const CircuitBreaker &) = delete;

  bool ShouldAttemptConnection(const std::string &peer_id);
  void RecordFailure(const std::string &peer_id);
  void RecordSuccess(const std::string &peer_id);

  bool IsOpen(const std::string &peer_id) const;
  int FailureCount(const std::string &peer_id) const;
  size_t TrackedPeerCount() const;

  void Clear();

private:
  bool IsOpenLocked(const Entry &entry, std::chrono::steady_clock::time_point now) const;

  const int failure_threshold_;
  const std::chrono::seconds cooldown_;

  mutable std::mutex mutex_;
  std::map<std::string, Entry> entries_;
};

} // namespace network
} // namespace peerlink
