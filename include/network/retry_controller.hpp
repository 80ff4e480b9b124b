// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#pragma once

#include "network/protocol.hpp"
#include <chrono>
#include <mutex>
#include <optional>
#include <random>

namespace peerlink {
namespace network {

/**
 * RetryController - exponential backoff with jitter
 *
 * delay(n) = min(initial * multiplier^n, max_delay) * (1 +/- jitter)
 *
 * NextDelay() consumes one attempt; after max_attempts calls it returns
 * std::nullopt until Reset(). Internally synchronized.
 */
class RetryController {
public:
  struct Config {
    int max_attempts;
    std::chrono::milliseconds initial_delay;
    double multiplier;
    std::chrono::milliseconds max_delay;
    double jitter_fraction;

    Config()
        : max_attempts(protocol::retry::MAX_ATTEMPTS),
          initial_delay(protocol::retry::INITIAL_DELAY),
          multiplier(protocol::retry::MULTIPLIER), max_delay(protocol::retry::MAX_DELAY),
          jitter_fraction(protocol::retry::JITTER_FRACTION) {}
  };

  RetryController();
  explicit RetryController(const Config &config);

  RetryController(const RetryController &) = delete;
  RetryController &operator=(const RetryController &) = delete;

  std::optional<std::chrono::milliseconds> NextDelay();

  void Reset();

  bool CanRetry() const;
  int CurrentAttempt() const;

  const Config &config() const { return config_; }

  // Delay for attempt n before jitter (exposed for tests)
  std::chrono::milliseconds BaseDelay(int attempt) const;

private:
  const Config config_;

  mutable std::mutex mutex_;
  int attempt_{0};
  std::mt19937 rng_;
};

} // namespace network
} // namespace peerlink
