// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#pragma once

#include "version.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace peerlink {
namespace protocol {

// Protocol version - increment when the envelope or handshake changes.
// A Hello carrying a different version aborts the handshake.
constexpr uint32_t PROTOCOL_VERSION = 1;

// Default TCP listen port
constexpr uint16_t DEFAULT_PORT = 9876;

// Service type advertised by local discovery
constexpr const char *SERVICE_TYPE = "_peerlink._tcp";
constexpr const char *SERVICE_DOMAIN = "local.";

// Local multicast discovery (announce/response datagrams)
namespace multicast {
constexpr const char *GROUP_V4 = "239.255.42.99";
constexpr uint16_t PORT = 9877;
constexpr std::chrono::seconds ANNOUNCE_INTERVAL{5};
// A service not re-announced within this window is considered gone
constexpr std::chrono::seconds SERVICE_TTL{20};
constexpr size_t MAX_DATAGRAM_SIZE = 1400;
} // namespace multicast

// ============================================================================
// FRAMING
// ============================================================================

// 4-byte big-endian length prefix before every envelope
constexpr size_t FRAME_HEADER_SIZE = 4;

// Largest envelope a peer may declare. Checked against the length prefix
// before any payload byte is buffered.
constexpr uint32_t MAX_FRAME_SIZE = 16 * 1024 * 1024; // 16 MiB

// Per-connection outbound queue limit. File streaming pauses while the queue
// is above FILE_SEND_HIGH_WATER.
constexpr size_t DEFAULT_SEND_QUEUE_SIZE = 32 * 1024 * 1024; // 32 MiB

// ============================================================================
// CONNECTION POLICY
// ============================================================================

// Registry capacity (concurrent connected peers)
constexpr size_t MAX_CONNECTIONS = 5;

// Timeouts and intervals
constexpr std::chrono::seconds CONNECT_TIMEOUT{10};      // transport readiness
constexpr std::chrono::seconds REQUESTING_TIMEOUT{15};   // initiator waits for accept/reject
constexpr std::chrono::seconds CONSENT_TIMEOUT{30};      // acceptor waits for the user
constexpr std::chrono::seconds HEARTBEAT_INTERVAL{10};   // Ping cadence while connected
constexpr std::chrono::seconds REJECTED_RECOVERY_DELAY{2}; // Rejected -> Discovering

// ============================================================================
// RESILIENCE
// ============================================================================

namespace retry {
constexpr int MAX_ATTEMPTS = 5;
constexpr std::chrono::milliseconds INITIAL_DELAY{1000};
constexpr double MULTIPLIER = 2.0;
constexpr std::chrono::milliseconds MAX_DELAY{30000};
constexpr double JITTER_FRACTION = 0.1; // +/-10%
} // namespace retry

namespace breaker {
constexpr int FAILURE_THRESHOLD = 3;
constexpr std::chrono::seconds COOLDOWN{300};
} // namespace breaker

// ============================================================================
// FILE TRANSFER
// ============================================================================

constexpr size_t FILE_CHUNK_SIZE = 64 * 1024; // 64 KiB
// Free space required beyond the file itself before accepting an offer
constexpr uint64_t STORAGE_SAFETY_MARGIN = 10ull * 1024 * 1024; // 10 MB
constexpr size_t FILE_SEND_HIGH_WATER = 4 * 1024 * 1024;

// Rejection reasons carried in RejectionPayload
namespace reasons {
constexpr const char *INSUFFICIENT_STORAGE = "insufficientStorage";
constexpr const char *FEATURE_DISABLED = "featureDisabled";
constexpr const char *USER_DECLINED = "userDeclined";
constexpr const char *BUSY = "busy";
constexpr const char *TIMEOUT = "timeout";
constexpr const char *ALREADY_CONNECTED = "alreadyConnected";
constexpr const char *CAPACITY = "capacity";
constexpr const char *INVALID_OFFER = "invalidOffer";
} // namespace reasons

// Discovery: manual peers not seen for this long are dropped
constexpr int64_t MANUAL_PEER_STALE_SEC = 24 * 60 * 60;

} // namespace protocol
} // namespace peerlink
