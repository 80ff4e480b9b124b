// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#pragma once

#include "network/message.hpp"
#include "network/transport.hpp"
#include "network/wire_codec.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace peerlink {
namespace network {

class TransportSession;
using TransportSessionPtr = std::shared_ptr<TransportSession>;

/**
 * TransportSession - one secured byte stream carrying framed messages
 *
 * Wraps a TransportConnection with the wire codec and a readiness wrapper:
 * an outbound session is "ready" once the transport connected (and finished
 * TLS) within CONNECT_TIMEOUT. Inbound sessions are ready on creation.
 *
 * Received frames are decoded in order and delivered one by one; a frame
 * that fails to decode is reported through the decode-error handler and
 * skipped, except FrameTooLarge which closes the session.
 *
 * The close handler fires once, when the stream ends for any reason other
 * than a local close().
 *
 * Single-threaded: all handlers run on the io_context passed at creation.
 */
class TransportSession : public std::enable_shared_from_this<TransportSession> {
private:
  struct PrivateTag {};

public:
  enum class State { Connecting, Ready, Closed };

  using ReadyHandler = std::function<void(bool ready, TransportError error)>;
  using MessageHandler = std::function<void(const message::PeerMessage &msg)>;
  using DecodeErrorHandler = std::function<void(message::DecodeError error)>;
  using CloseHandler = std::function<void(TransportError error)>;

  // Dial host:port; on_ready fires exactly once
  static TransportSessionPtr connect(boost::asio::io_context &io_context, Transport &transport,
                                     const std::string &host, uint16_t port,
                                     ReadyHandler on_ready);

  // Wrap an accepted connection
  static TransportSessionPtr accept(boost::asio::io_context &io_context,
                                    TransportConnectionPtr connection);

  TransportSession(PrivateTag, boost::asio::io_context &io_context, bool inbound,
                   std::string host, uint16_t port);
  ~TransportSession();

  TransportSession(const TransportSession &) = delete;
  TransportSession &operator=(const TransportSession &) = delete;

  // Handlers may be replaced at any time (e.g. when a handshake hands the
  // session over to a PeerConnection)
  void set_handlers(MessageHandler on_message, DecodeErrorHandler on_decode_error,
                    CloseHandler on_close);
  void clear_handlers();

  // Begin delivering received messages
  void start();

  // Encode and queue; false if closed or the message exceeds MAX_FRAME_SIZE
  bool send(const message::PeerMessage &msg);

  // Local close: no close handler
  void close();

  State state() const { return state_; }
  bool is_ready() const { return state_ == State::Ready; }
  bool is_inbound() const { return inbound_; }

  // host:port as dialed (outbound) or as seen (inbound)
  std::string endpoint() const;
  const std::string &host() const { return host_; }
  uint16_t port() const { return port_; }

  uint64_t id() const;
  size_t send_queue_bytes() const;
  std::optional<std::string> peer_certificate_fingerprint() const;
  TransportError last_error() const;

#ifdef PEERLINK_TESTS
  static void SetReadyTimeoutForTest(std::chrono::milliseconds timeout);
  static void ResetReadyTimeoutForTest();
#endif

private:
  void on_connected(bool success);
  void on_ready_timeout();
  void on_receive(const std::vector<uint8_t> &data);
  void on_transport_closed();
  void fail(TransportError error);
  void detach_transport();

  static std::chrono::milliseconds ready_timeout();

  boost::asio::io_context &io_context_;
  TransportConnectionPtr connection_;
  boost::asio::steady_timer ready_timer_;
  ReadyHandler ready_handler_;
  FrameDecoder decoder_;

  MessageHandler message_handler_;
  DecodeErrorHandler decode_error_handler_;
  CloseHandler close_handler_;

  State state_{State::Connecting};
  bool inbound_;
  bool started_{false};
  std::string host_;
  uint16_t port_;

#ifdef PEERLINK_TESTS
  static std::atomic<std::chrono::milliseconds> ready_timeout_override_ms_;
#endif
};

} // namespace network
} // namespace peerlink
