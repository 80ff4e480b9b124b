// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#include "network/retry_controller.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <cmath>

namespace peerlink {
namespace network {

RetryController::RetryController() : RetryController(Config{}) {}

RetryController::RetryController(const Config &config)
    : config_(config), rng_(std::random_device{}()) {}

std::chrono::milliseconds RetryController::BaseDelay(int attempt) const {
  double delay = static_cast<double>(config_.initial_delay.count()) *
                 std::pow(config_.multiplier, attempt);
  delay = std::min(delay, static_cast<double>(config_.max_delay.count()));
  return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

std::optional<std::chrono::milliseconds> RetryController::NextDelay() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (attempt_ >= config_.max_attempts) {
    return std::nullopt;
  }

  double base = static_cast<double>(BaseDelay(attempt_).count());
  ++attempt_;

  std::uniform_real_distribution<double> jitter(-config_.jitter_fraction,
                                                config_.jitter_fraction);
  double delay = base * (1.0 + jitter(rng_));

  LOG_NET_DEBUG("Retry attempt {}/{} in {:.0f}ms", attempt_, config_.max_attempts, delay);
  return std::chrono::milliseconds(static_cast<int64_t>(std::max(0.0, delay)));
}

void RetryController::Reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  attempt_ = 0;
}

bool RetryController::CanRetry() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return attempt_ < config_.max_attempts;
}

int RetryController::CurrentAttempt() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return attempt_;
}

} // namespace network
} // namespace peerlink
