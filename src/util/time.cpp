// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#include "util/time.hpp"
#include <atomic>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace peerlink {
namespace util {

// 0 means mock time is disabled
static std::atomic<int64_t> g_mock_time{0};

// Steady clock simulation: the first GetSteadyTime() call under a new mock
// value pins a real steady reference, later mock values are offsets from it.
static std::mutex g_steady_mutex;
static std::chrono::steady_clock::time_point g_real_steady_reference;
static int64_t g_mock_steady_reference{0};
static bool g_steady_initialized{false};

int64_t GetTime() {
  int64_t mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock != 0) {
    return mock;
  }

  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::chrono::steady_clock::time_point GetSteadyTime() {
  int64_t mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock != 0) {
    std::lock_guard<std::mutex> lock(g_steady_mutex);

    if (!g_steady_initialized) {
      g_real_steady_reference = std::chrono::steady_clock::now();
      g_mock_steady_reference = mock;
      g_steady_initialized = true;
    }

    return g_real_steady_reference + std::chrono::seconds(mock - g_mock_steady_reference);
  }

  return std::chrono::steady_clock::now();
}

void SetMockTime(int64_t time) {
  int64_t previous = g_mock_time.exchange(time, std::memory_order_relaxed);

  // Entering or leaving mock mode starts a new steady reference. Advancing an
  // existing mock clock keeps the reference so steady time moves forward.
  if (previous == 0 || time == 0) {
    std::lock_guard<std::mutex> lock(g_steady_mutex);
    g_steady_initialized = false;
  }
}

int64_t GetMockTime() { return g_mock_time.load(std::memory_order_relaxed); }

std::string FormatTime(int64_t unix_time) {
  std::time_t t = static_cast<std::time_t>(unix_time);
  std::tm tm_utc;

#if defined(_WIN32)
  if (gmtime_s(&tm_utc, &t) != 0) {
    return "invalid";
  }
#else
  if (!gmtime_r(&t, &tm_utc)) {
    return "invalid";
  }
#endif

  std::ostringstream oss;
  oss << std::put_time(&tm_utc, "%Y-%m-%d %H:%M:%S UTC");
  return oss.str();
}

} // namespace util
} // namespace peerlink
