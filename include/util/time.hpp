// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace peerlink {
namespace util {

/**
 * Mockable time source
 *
 * Production code calls GetTime() or GetSteadyTime() instead of reading the
 * clocks directly. Tests call SetMockTime() to control the current time;
 * when mock time is 0 (default) the real clocks are used.
 *
 * Circuit breaker cooldowns and discovery staleness are measured with these
 * functions so they can be tested without waiting.
 */

/**
 * Current time as Unix timestamp (seconds since epoch)
 * Returns mock time if set
 */
int64_t GetTime();

/**
 * Current steady clock time point
 * When mock time is active the steady clock advances with the mock value
 */
std::chrono::steady_clock::time_point GetSteadyTime();

/**
 * Set mock time (Unix seconds, 0 disables mocking)
 *
 * Mock time does not advance by itself; tests call SetMockTime() again.
 */
void SetMockTime(int64_t time);

/**
 * Current mock time setting (0 if disabled)
 */
int64_t GetMockTime();

/**
 * Format a Unix timestamp as "YYYY-MM-DD HH:MM:SS UTC"
 */
std::string FormatTime(int64_t unix_time);

/**
 * RAII helper to set mock time and restore the previous value on scope exit
 */
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_time_(GetMockTime()) {
    SetMockTime(time);
  }

  ~MockTimeScope() { SetMockTime(previous_time_); }

  MockTimeScope(const MockTimeScope&) = delete;
  MockTimeScope& operator=(const MockTimeScope&) = delete;
  MockTimeScope(MockTimeScope&&) = delete;
  MockTimeScope& operator=(MockTimeScope&&) = delete;

private:
  const int64_t previous_time_;
};

} // namespace util
} // namespace peerlink
