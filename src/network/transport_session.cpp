// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#include "network/transport_session.hpp"
#include "network/protocol.hpp"
#include "util/logging.hpp"
#include <boost/asio/post.hpp>

namespace peerlink {
namespace network {

using message::DecodeError;

#ifdef PEERLINK_TESTS
std::atomic<std::chrono::milliseconds> TransportSession::ready_timeout_override_ms_{std::chrono::milliseconds{0}};

void TransportSession::SetReadyTimeoutForTest(std::chrono::milliseconds timeout) {
  ready_timeout_override_ms_.store(timeout, std::memory_order_relaxed);
}

void TransportSession::ResetReadyTimeoutForTest() {
  ready_timeout_override_ms_.store(std::chrono::milliseconds{0}, std::memory_order_relaxed);
}
#endif

std::chrono::milliseconds TransportSession::ready_timeout() {
#ifdef PEERLINK_TESTS
  auto ov = ready_timeout_override_ms_.load(std::memory_order_relaxed);
  if (ov.count() > 0) {
    return ov;
  }
#endif
  return std::chrono::duration_cast<std::chrono::milliseconds>(protocol::CONNECT_TIMEOUT);
}

TransportSession::TransportSession(PrivateTag, boost::asio::io_context &io_context, bool inbound,
                                   std::string host, uint16_t port)
    : io_context_(io_context), ready_timer_(io_context), inbound_(inbound),
      host_(std::move(host)), port_(port) {}

TransportSession::~TransportSession() {
  if (state_ != State::Closed) {
    LOG_NET_ERROR("TransportSession {} destroyed while open; close() must run first", endpoint());
  }
}

TransportSessionPtr TransportSession::connect(boost::asio::io_context &io_context,
                                              Transport &transport, const std::string &host,
                                              uint16_t port, ReadyHandler on_ready) {
  auto session = std::make_shared<TransportSession>(PrivateTag{}, io_context, false, host, port);
  session->ready_handler_ = std::move(on_ready);

  // Bound the whole readiness phase, whatever the transport does
  session->ready_timer_.expires_after(ready_timeout());
  session->ready_timer_.async_wait([session](const boost::system::error_code &ec) {
    if (!ec) {
      session->on_ready_timeout();
    }
  });

  std::weak_ptr<TransportSession> weak = session;
  session->connection_ = transport.connect(host, port, [weak](bool success) {
    if (auto self = weak.lock()) {
      self->on_connected(success);
    }
  });

  if (!session->connection_) {
    // Transport not running: report asynchronously like any other failure
    boost::asio::post(io_context, [session]() {
      if (session->state_ == State::Connecting) {
        session->fail(TransportError::Other);
      }
    });
  }
  return session;
}

TransportSessionPtr TransportSession::accept(boost::asio::io_context &io_context,
                                             TransportConnectionPtr connection) {
  auto session = std::make_shared<TransportSession>(
      PrivateTag{}, io_context, true, connection ? connection->remote_address() : "",
      connection ? connection->remote_port() : 0);
  session->connection_ = std::move(connection);
  session->state_ = session->connection_ && session->connection_->is_open() ? State::Ready
                                                                            : State::Closed;
  return session;
}

void TransportSession::on_connected(bool success) {
  if (state_ != State::Connecting) {
    return; // timed out or closed meanwhile
  }
  if (!success) {
    fail(connection_ ? connection_->last_error() : TransportError::Other);
    return;
  }

  ready_timer_.cancel();
  state_ = State::Ready;
  LOG_NET_DEBUG("transport to {} ready{}", endpoint(),
                peer_certificate_fingerprint() ? " (TLS)" : "");

  auto handler = std::move(ready_handler_);
  ready_handler_ = nullptr;
  if (handler) {
    handler(true, TransportError::None);
  }
}

void TransportSession::on_ready_timeout() {
  if (state_ != State::Connecting) {
    return;
  }
  LOG_NET_DEBUG("transport to {} not ready after {} ms", endpoint(), ready_timeout().count());
  fail(TransportError::TimedOut);
}

void TransportSession::fail(TransportError error) {
  if (state_ == State::Closed) {
    return;
  }
  const bool was_connecting = state_ == State::Connecting;
  state_ = State::Closed;
  ready_timer_.cancel();
  detach_transport();

  if (was_connecting) {
    auto handler = std::move(ready_handler_);
    ready_handler_ = nullptr;
    if (handler) {
      handler(false, error == TransportError::None ? TransportError::Other : error);
    }
    return;
  }

  auto handler = std::move(close_handler_);
  message_handler_ = nullptr;
  decode_error_handler_ = nullptr;
  close_handler_ = nullptr;
  if (handler) {
    handler(error == TransportError::None ? TransportError::Closed : error);
  }
}

void TransportSession::detach_transport() {
  if (!connection_) {
    return;
  }
  // Break the connection -> callback -> session cycle before closing
  connection_->set_receive_callback({});
  connection_->set_disconnect_callback({});
  connection_->close();
}

void TransportSession::set_handlers(MessageHandler on_message,
                                    DecodeErrorHandler on_decode_error, CloseHandler on_close) {
  message_handler_ = std::move(on_message);
  decode_error_handler_ = std::move(on_decode_error);
  close_handler_ = std::move(on_close);
}

void TransportSession::clear_handlers() {
  message_handler_ = nullptr;
  decode_error_handler_ = nullptr;
  close_handler_ = nullptr;
}

void TransportSession::start() {
  if (started_ || state_ != State::Ready || !connection_) {
    return;
  }
  started_ = true;

  auto self = shared_from_this();
  connection_->set_receive_callback([self](const std::vector<uint8_t> &data) {
    self->on_receive(data);
  });
  connection_->set_disconnect_callback([self]() { self->on_transport_closed(); });
  connection_->start();
}

void TransportSession::on_receive(const std::vector<uint8_t> &data) {
  if (state_ != State::Ready) {
    return;
  }
  auto self = shared_from_this();
  decoder_.feed(data);

  while (state_ == State::Ready) {
    auto result = decoder_.next();
    if (!result) {
      break;
    }

    if (result->error == DecodeError::FrameTooLarge) {
      LOG_NET_WARN("oversized frame from {}, closing session", endpoint());
      if (decode_error_handler_) {
        // Copy: the handler may clear the session's handlers
        auto handler = decode_error_handler_;
        handler(DecodeError::FrameTooLarge);
      }
      fail(TransportError::Other);
      return;
    }

    if (result->error != DecodeError::None) {
      LOG_NET_DEBUG("dropping undecodable frame from {}: {}", endpoint(),
                    message::DecodeErrorString(result->error));
      if (decode_error_handler_) {
        auto handler = decode_error_handler_;
        handler(result->error);
      }
      continue;
    }

    LOG_NET_TRACE("received {} from {}", message::MessageTypeName(result->message.type()),
                  endpoint());
    if (message_handler_) {
      // Copy: the handler may replace itself
      auto handler = message_handler_;
      handler(result->message);
    }
  }
}

void TransportSession::on_transport_closed() {
  if (state_ != State::Ready) {
    return;
  }
  TransportError error = connection_ ? connection_->last_error() : TransportError::Closed;
  LOG_NET_DEBUG("transport to {} closed: {}", endpoint(), TransportErrorString(error));
  fail(error);
}

bool TransportSession::send(const message::PeerMessage &msg) {
  if (state_ != State::Ready || !connection_) {
    return false;
  }
  auto frame = encode_frame(msg);
  if (frame.empty()) {
    LOG_NET_ERROR("refusing to send oversized {} to {}", message::MessageTypeName(msg.type()),
                  endpoint());
    return false;
  }
  LOG_NET_TRACE("sending {} to {} ({} bytes)", message::MessageTypeName(msg.type()), endpoint(),
                frame.size());
  return connection_->send(frame);
}

void TransportSession::close() {
  if (state_ == State::Closed) {
    return;
  }
  state_ = State::Closed;
  ready_timer_.cancel();
  ready_handler_ = nullptr;
  clear_handlers();
  detach_transport();
}

std::string TransportSession::endpoint() const {
  if (host_.find(':') != std::string::npos) {
    return "[" + host_ + "]:" + std::to_string(port_);
  }
  return host_ + ":" + std::to_string(port_);
}

uint64_t TransportSession::id() const { return connection_ ? connection_->connection_id() : 0; }

size_t TransportSession::send_queue_bytes() const {
  return connection_ ? connection_->send_queue_bytes() : 0;
}

std::optional<std::string> TransportSession::peer_certificate_fingerprint() const {
  if (!connection_) {
    return std::nullopt;
  }
  return connection_->peer_certificate_fingerprint();
}

TransportError TransportSession::last_error() const {
  return connection_ ? connection_->last_error() : TransportError::None;
}

} // namespace network
} // namespace peerlink
