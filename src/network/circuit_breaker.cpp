// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#include "network/circuit_breaker.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"

namespace peerlink {
namespace network {

CircuitBreaker::CircuitBreaker(int failure_threshold, std::chrono::seconds cooldown)
    : failure_threshold_(failure_threshold), cooldown_(cooldown) {}

bool CircuitBreaker::IsOpenLocked(const Entry &entry,
                                  std::chrono::steady_clock::time_point now) const {
  return entry.failure_count >= failure_threshold_ && now - entry.last_failed_at < cooldown_;
}

bool CircuitBreaker::ShouldAttemptConnection(const std::string &peer_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(peer_id);
  if (it == entries_.end()) {
    return true;
  }

  const auto now = util::GetSteadyTime();
  if (IsOpenLocked(it->second, now)) {
    return false;
  }

  // Cooldown elapsed: half-open, next failure counts from one again
  if (it->second.failure_count >= failure_threshold_) {
    LOG_NET_DEBUG("Circuit for {} closed after cooldown", peer_id);
    entries_.erase(it);
  }
  return true;
}

void CircuitBreaker::RecordFailure(const std::string &peer_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto &entry = entries_[peer_id];
  entry.failure_count++;
  entry.last_failed_at = util::GetSteadyTime();

  if (entry.failure_count == failure_threshold_) {
    LOG_NET_WARN("Circuit opened for {} after {} failures (cooldown {}s)", peer_id,
                 entry.failure_count, cooldown_.count());
  }
}

void CircuitBreaker::RecordSuccess(const std::string &peer_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.erase(peer_id);
}

bool CircuitBreaker::IsOpen(const std::string &peer_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(peer_id);
  return it != entries_.end() && IsOpenLocked(it->second, util::GetSteadyTime());
}

int CircuitBreaker::FailureCount(const std::string &peer_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(peer_id);
  return it == entries_.end() ? 0 : it->second.failure_count;
}

size_t CircuitBreaker::TrackedPeerCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

void CircuitBreaker::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
}

} // namespace network
} // namespace peerlink
