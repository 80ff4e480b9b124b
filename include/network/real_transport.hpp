// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#pragma once

#include "network/transport.hpp"
#include <atomic>
#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/strand.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <queue>
#include <vector>

namespace peerlink {
namespace network {

// Map an asio/ssl error to the transport taxonomy
TransportError TransportErrorFromCode(const boost::system::error_code &ec);

/**
 * RealTransportConnection - TCP socket implementation of TransportConnection
 *
 * Wraps an ssl::stream over a tcp::socket. Without a TLS context the stream's
 * next layer is used directly and the session is plaintext.
 *
 * TLS peers present self-signed certificates; chain verification is not
 * used. Identity is pinned by the handshake layer, which compares
 * peer_certificate_fingerprint() with the fingerprint announced in Hello.
 */
class RealTransportConnection
    : public TransportConnection,
      public std::enable_shared_from_this<RealTransportConnection> {
public:
  using Stream = boost::asio::ssl::stream<boost::asio::ip::tcp::socket>;

  /**
   * Create outbound connection (resolves, connects, then runs the client TLS
   * handshake when tls is set)
   */
  static TransportConnectionPtr
  create_outbound(boost::asio::io_context &io_context,
                  std::shared_ptr<boost::asio::ssl::context> tls,
                  const std::string &address, uint16_t port,
                  ConnectCallback callback);

  /**
   * Create inbound connection around an accepted socket. With TLS the
   * connection is not open until server_handshake() succeeds.
   */
  static std::shared_ptr<RealTransportConnection>
  create_inbound(boost::asio::io_context &io_context,
                 std::shared_ptr<boost::asio::ssl::context> tls,
                 boost::asio::ip::tcp::socket socket);

  ~RealTransportConnection() override;

  // Non-copyable, non-movable (connections are not reusable)
  RealTransportConnection(const RealTransportConnection &) = delete;
  RealTransportConnection &operator=(const RealTransportConnection &) = delete;
  RealTransportConnection(RealTransportConnection &&) = delete;
  RealTransportConnection &operator=(RealTransportConnection &&) = delete;

  // Inbound only: run the server side of the TLS handshake (bounded by the
  // connect timeout). Plaintext connections complete immediately.
  void server_handshake(ConnectCallback callback);

  // TransportConnection interface
  void start() override;
  bool send(const std::vector<uint8_t> &data) override;
  void close() override;
  bool is_open() const override;
  std::string remote_address() const override;
  uint16_t remote_port() const override;
  bool is_inbound() const override { return is_inbound_; }
  uint64_t connection_id() const override { return id_; }
  size_t send_queue_bytes() const override { return send_queue_bytes_.load(); }
  TransportError last_error() const override { return last_error_.load(); }
  std::optional<std::string> peer_certificate_fingerprint() const override;
  void set_receive_callback(ReceiveCallback callback) override;
  void set_disconnect_callback(DisconnectCallback callback) override;

#ifdef PEERLINK_TESTS
  // Test-only: override connect timeout (0ms disables override)
  static void SetConnectTimeoutForTest(std::chrono::milliseconds timeout_ms);
  static void ResetConnectTimeoutForTest();

  // Test-only: override send queue byte limit (0 disables override)
  static void SetSendQueueLimitForTest(size_t bytes);
  static void ResetSendQueueLimitForTest();
#endif

private:
  RealTransportConnection(boost::asio::io_context &io_context,
                          std::shared_ptr<boost::asio::ssl::context> tls, bool is_inbound);

  void do_connect(const std::string &address, uint16_t port, ConnectCallback callback);
  void do_handshake(boost::asio::ssl::stream_base::handshake_type type,
                    ConnectCallback callback);

  // Arms connect_timer_; on expiry fails the pending connect/handshake
  void start_connect_timer(ConnectCallback callback);
  // Completes a connect or handshake exactly once (must be called on strand_)
  void finish_connect(bool success, TransportError error, const ConnectCallback &callback);

  // Strand-serialized internals (must be called on strand_)
  void start_read_impl();
  void do_write_impl();
  void close_impl();

  // Helper to deliver disconnect callback exactly once (must be called on strand)
  void deliver_disconnect_once();

  void record_error(TransportError error);
  void capture_peer_certificate();

  // Compute connect timeout (override if set, else default)
  std::chrono::milliseconds connect_timeout_ms() const;

  boost::asio::ip::tcp::socket &socket() { return stream_.next_layer(); }

  boost::asio::io_context &io_context_;
  std::shared_ptr<boost::asio::ssl::context> tls_;
  Stream stream_;
  boost::asio::strand<boost::asio::any_io_executor> strand_;
  bool is_inbound_;
  uint64_t id_;
  static std::atomic<uint64_t> next_id_;

  // Callbacks (accessed only on strand_)
  ReceiveCallback receive_callback_;
  DisconnectCallback disconnect_callback_;
  bool disconnect_delivered_{false};

  // Send queue (accessed only on strand_; byte count readable anywhere)
  std::queue<std::shared_ptr<std::vector<uint8_t>>> send_queue_;
  std::atomic<size_t> send_queue_bytes_{0};
  std::atomic<bool> writing_{false};

  static constexpr size_t RECV_BUFFER_SIZE = 256 * 1024; // 256 KB

  // Connect/handshake timeout. unique_ptr so close_impl() can destroy it
  // while the io_context is still alive.
  std::unique_ptr<boost::asio::steady_timer> connect_timer_;
  std::atomic<bool> connect_done_{false};
  std::shared_ptr<boost::asio::ip::tcp::resolver> resolver_;

#ifdef PEERLINK_TESTS
  static std::atomic<std::chrono::milliseconds> connect_timeout_override_ms_;
  static std::atomic<size_t> send_queue_limit_override_bytes_;
#endif

  std::atomic<bool> open_{false};
  std::atomic<TransportError> last_error_{TransportError::None};
  std::optional<std::string> peer_fingerprint_; // set once, before open_
  std::string remote_addr_;
  uint16_t remote_port_ = 0;
};

/**
 * RealTransport - boost::asio implementation of Transport
 *
 * Runs on the caller's io_context so every connection callback lands on the
 * same single-threaded reactor as the orchestrator. A TLS credential turns
 * on TLS for both directions.
 */
class RealTransport : public Transport {
public:
  explicit RealTransport(boost::asio::io_context &io_context,
                         std::optional<TlsCredential> tls = std::nullopt);
  ~RealTransport() override;

  RealTransport(const RealTransport &) = delete;
  RealTransport &operator=(const RealTransport &) = delete;

  // Transport interface
  TransportConnectionPtr connect(const std::string &address, uint16_t port,
                                 ConnectCallback callback) override;
  bool listen(uint16_t port, AcceptCallback accept_callback) override;
  void stop_listening() override;
  uint16_t listening_port() const override { return last_listen_port_; }
  void run() override;
  void stop() override;
  bool is_running() const override { return running_; }

  // False when a credential was given but could not be loaded
  bool tls_ready() const { return tls_error_.empty(); }
  const std::string &tls_error() const { return tls_error_; }
  bool tls_enabled() const { return tls_context_ != nullptr; }

  // SHA-256 fingerprint of the first certificate in a PEM file
  static std::optional<std::string> certificate_fingerprint(const std::string &pem_path);

private:
  void start_accept();
  void handle_accept(const boost::system::error_code &ec, boost::asio::ip::tcp::socket socket);

  boost::asio::io_context &io_context_;
  std::shared_ptr<boost::asio::ssl::context> tls_context_;
  std::string tls_error_;
  std::atomic<bool> running_{false};

  // Expires with the transport; pending inbound handshakes check it
  std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);

  // Acceptor for inbound connections
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  AcceptCallback accept_callback_;
  uint16_t last_listen_port_{0};
};

} // namespace network
} // namespace peerlink
