// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace peerlink {
namespace network {

// Abstract transport interface for network communication
// Allows dependency injection of different implementations:
// - RealTransport: TCP (optionally TLS) sockets via boost::asio
// - LoopbackTransport: in-memory byte pipes for testing (in test/)

class Transport;
class TransportConnection;
using TransportConnectionPtr = std::shared_ptr<TransportConnection>;

// Why a connection failed or ended
enum class TransportError {
  None,
  Refused,
  Reset,
  TimedOut,
  Unreachable,
  TlsFailure,
  Closed,
  Other,
};

// User-facing description ("Connection refused", ...)
const char *TransportErrorString(TransportError error);

// PEM certificate chain and private key used for TLS sessions
struct TlsCredential {
  std::string certificate_path;
  std::string private_key_path;
};

// Callback types for transport events
using ConnectCallback = std::function<void(bool success)>;
using ReceiveCallback = std::function<void(const std::vector<uint8_t> &data)>;
using DisconnectCallback = std::function<void()>;
using AcceptCallback = std::function<void(TransportConnectionPtr)>;

// TransportConnection - one byte-stream connection
// Implementations handle actual I/O (TCP socket, TLS stream, in-memory pipe).
// Callbacks are delivered on the owner's io_context.
class TransportConnection {
public:
  virtual ~TransportConnection() = default;

  // Start receiving data (callbacks invoked when data arrives or connection
  // closes)
  virtual void start() = 0;

  // Send data (returns true if queued successfully, false if connection closed)
  // Semantics:
  // - Returns false if the connection is already closed at call time.
  // - Returns true if the implementation accepted the send attempt. Some
  //   implementations (e.g., RealTransport) enforce backpressure on an
  //   internal strand and may later drop the payload and disconnect on
  //   overflow. Callers must not treat `true` as "written"; rely on the
  //   disconnect callback to learn about fatal flow-control errors.
  virtual bool send(const std::vector<uint8_t> &data) = 0;

  virtual void close() = 0;
  virtual bool is_open() const = 0;

  virtual std::string remote_address() const = 0;
  virtual uint16_t remote_port() const = 0;
  virtual bool is_inbound() const = 0;
  virtual uint64_t connection_id() const = 0;

  // Bytes accepted by send() but not yet written
  virtual size_t send_queue_bytes() const = 0;

  // Reason for the last connect failure or disconnect (None while healthy)
  virtual TransportError last_error() const = 0;

  // SHA-256 (lowercase hex) of the peer's DER certificate; std::nullopt for
  // plaintext sessions
  virtual std::optional<std::string> peer_certificate_fingerprint() const = 0;

  virtual void set_receive_callback(ReceiveCallback callback) = 0;
  virtual void set_disconnect_callback(DisconnectCallback callback) = 0;
};

// Transport - Factory for creating connections
// Implementations provide both outbound connection initiation and inbound
// acceptance
class Transport {
public:
  virtual ~Transport() = default;

  // Initiate outbound connection (callback called on success/fail, returns
  // connection object)
  virtual TransportConnectionPtr connect(const std::string &address, uint16_t port,
                                         ConnectCallback callback) = 0;

  // Start accepting inbound connections (returns true if listening started
  // successfully). Inbound TLS connections are handed over after the
  // server-side handshake.
  virtual bool listen(uint16_t port, AcceptCallback accept_callback) = 0;

  virtual void stop_listening() = 0;

  // Actual bound port (0 if not listening)
  virtual uint16_t listening_port() const = 0;

  virtual void run() = 0;

  // Stop transport (stops listening, refuses new connections)
  virtual void stop() = 0;

  virtual bool is_running() const = 0;
};

} // namespace network
} // namespace peerlink
