// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#include "network/real_transport.hpp"
#include "network/protocol.hpp"
#include "util/logging.hpp"
#include "util/sha256.hpp"
#include <cassert>
#include <cstdio>
#include <openssl/pem.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

namespace peerlink {
namespace network {

namespace {

// ssl::stream always needs a context; plaintext connections get this one and
// never touch the TLS layer.
boost::asio::ssl::context &plaintext_context() {
  static boost::asio::ssl::context ctx(boost::asio::ssl::context::tls);
  return ctx;
}

std::optional<std::string> fingerprint_of(X509 *cert) {
  if (!cert) {
    return std::nullopt;
  }
  int len = i2d_X509(cert, nullptr);
  if (len <= 0) {
    return std::nullopt;
  }
  std::vector<uint8_t> der(static_cast<size_t>(len));
  unsigned char *p = der.data();
  i2d_X509(cert, &p);
  return util::Sha256Hex(der);
}

std::shared_ptr<boost::asio::ssl::context> make_tls_context(const TlsCredential &credential,
                                                            std::string &error) {
  namespace ssl = boost::asio::ssl;
  try {
    auto ctx = std::make_shared<ssl::context>(ssl::context::tls);
    ctx->set_options(ssl::context::default_workarounds | ssl::context::no_sslv2 |
                     ssl::context::no_sslv3 | ssl::context::no_tlsv1 |
                     ssl::context::no_tlsv1_1);
    ctx->use_certificate_chain_file(credential.certificate_path);
    ctx->use_private_key_file(credential.private_key_path, ssl::context::pem);

    // Both sides must present a certificate. Self-signed certificates are
    // accepted here; the handshake layer pins them by fingerprint.
    ctx->set_verify_mode(ssl::verify_peer | ssl::verify_fail_if_no_peer_cert);
    ctx->set_verify_callback([](bool, ssl::verify_context &) { return true; });
    return ctx;
  } catch (const boost::system::system_error &e) {
    error = e.what();
    return nullptr;
  }
}

} // namespace

TransportError TransportErrorFromCode(const boost::system::error_code &ec) {
  namespace error = boost::asio::error;
  if (!ec) {
    return TransportError::None;
  }
  if (ec.category() == error::get_ssl_category() ||
      ec.category() == boost::asio::ssl::error::get_stream_category()) {
    return TransportError::TlsFailure;
  }
  if (ec == error::connection_refused) {
    return TransportError::Refused;
  }
  if (ec == error::connection_reset || ec == error::broken_pipe ||
      ec == error::connection_aborted) {
    return TransportError::Reset;
  }
  if (ec == error::timed_out) {
    return TransportError::TimedOut;
  }
  if (ec == error::host_unreachable || ec == error::network_unreachable ||
      ec == error::network_down || ec == error::host_not_found ||
      ec == error::host_not_found_try_again) {
    return TransportError::Unreachable;
  }
  if (ec == error::eof || ec == error::operation_aborted) {
    return TransportError::Closed;
  }
  return TransportError::Other;
}

// ============================================================================
// RealTransportConnection
// ============================================================================

std::atomic<uint64_t> RealTransportConnection::next_id_{1};

#ifdef PEERLINK_TESTS
std::atomic<std::chrono::milliseconds> RealTransportConnection::connect_timeout_override_ms_{std::chrono::milliseconds{0}};
std::atomic<size_t> RealTransportConnection::send_queue_limit_override_bytes_{0};
#endif

TransportConnectionPtr RealTransportConnection::create_outbound(
    boost::asio::io_context &io_context, std::shared_ptr<boost::asio::ssl::context> tls,
    const std::string &address, uint16_t port, ConnectCallback callback) {
  auto conn = std::shared_ptr<RealTransportConnection>(
      new RealTransportConnection(io_context, std::move(tls), false));
  // Defer do_connect onto the strand so shared_from_this() is safe and the
  // object lifetime is extended regardless of factory return-value usage.
  boost::asio::post(conn->strand_, [conn, address, port, callback]() mutable {
    conn->do_connect(address, port, std::move(callback));
  });
  return conn;
}

std::shared_ptr<RealTransportConnection>
RealTransportConnection::create_inbound(boost::asio::io_context &io_context,
                                        std::shared_ptr<boost::asio::ssl::context> tls,
                                        boost::asio::ip::tcp::socket socket) {
  auto conn = std::shared_ptr<RealTransportConnection>(
      new RealTransportConnection(io_context, std::move(tls), true));
  conn->socket() = std::move(socket);

  boost::system::error_code ec;
  auto remote_ep = conn->socket().remote_endpoint(ec);
  if (!ec) {
    conn->remote_addr_ = remote_ep.address().to_string();
    conn->remote_port_ = remote_ep.port();
  } else {
    LOG_NET_TRACE("failed to get remote endpoint: {}", ec.message());
  }

  return conn;
}

RealTransportConnection::RealTransportConnection(
    boost::asio::io_context &io_context, std::shared_ptr<boost::asio::ssl::context> tls,
    bool is_inbound)
    : io_context_(io_context), tls_(std::move(tls)),
      stream_(io_context, tls_ ? *tls_ : plaintext_context()),
      strand_(io_context.get_executor()), is_inbound_(is_inbound), id_(next_id_++),
      connect_timer_(std::make_unique<boost::asio::steady_timer>(io_context)) {}

RealTransportConnection::~RealTransportConnection() {
  // Cleanup happens in close() while the shared_ptr is still alive. The
  // logging subsystem may already be gone here, so nothing is logged.
}

void RealTransportConnection::record_error(TransportError error) {
  TransportError expected = TransportError::None;
  last_error_.compare_exchange_strong(expected, error);
}

void RealTransportConnection::start_connect_timer(ConnectCallback callback) {
  auto timeout = connect_timeout_ms();
  if (timeout.count() <= 0 || !connect_timer_) {
    return;
  }
  connect_timer_->expires_after(timeout);
  connect_timer_->async_wait(boost::asio::bind_executor(
      strand_, [this, self = shared_from_this(), callback](const boost::system::error_code &ec) {
        if (ec == boost::asio::error::operation_aborted) {
          return;
        }
        if (connect_done_) return;

        LOG_NET_WARN("connect timeout to {}:{} after {} ms", remote_addr_, remote_port_,
                     connect_timeout_ms().count());
        boost::system::error_code ignored;
        if (resolver_) resolver_->cancel();
        socket().cancel(ignored);
        socket().close(ignored);
        finish_connect(false, TransportError::TimedOut, callback);
      }));
}

void RealTransportConnection::finish_connect(bool success, TransportError error,
                                             const ConnectCallback &callback) {
  if (connect_done_.exchange(true)) {
    return;
  }
  if (connect_timer_) (void)connect_timer_->cancel();

  if (success) {
    open_ = true;
  } else {
    record_error(error);
  }

  if (callback) {
    try {
      callback(success);
    } catch (const std::exception &e) {
      LOG_NET_ERROR("exception in connect callback for {}:{}: {}", remote_addr_, remote_port_,
                    e.what());
    }
  }
}

void RealTransportConnection::do_connect(const std::string &address, uint16_t port,
                                         ConnectCallback callback) {
  remote_addr_ = address;
  remote_port_ = port;
  connect_done_ = false;

  start_connect_timer(callback);

  // Resolve address (store resolver_ to allow cancellation)
  resolver_ = std::make_shared<boost::asio::ip::tcp::resolver>(io_context_);
  resolver_->async_resolve(
      address, std::to_string(port),
      boost::asio::bind_executor(strand_,
      [this, self = shared_from_this(), callback](const boost::system::error_code &ec,
                 boost::asio::ip::tcp::resolver::results_type results) {
        if (connect_done_) return; // timed out or completed
        if (ec) {
          LOG_NET_TRACE("failed to resolve {}: {}", remote_addr_, ec.message());
          finish_connect(false, TransportErrorFromCode(ec), callback);
          return;
        }

        boost::asio::async_connect(
            socket(), results,
            boost::asio::bind_executor(strand_,
            [this, self, callback](const boost::system::error_code &ec,
                                   const boost::asio::ip::tcp::endpoint &) {
              if (connect_done_) return; // timed out already
              if (ec) {
                LOG_NET_TRACE("failed to connect to {}:{}: {}", remote_addr_, remote_port_,
                              ec.message());
                finish_connect(false, TransportErrorFromCode(ec), callback);
                return;
              }

              boost::system::error_code opt_ec;
              socket().set_option(boost::asio::ip::tcp::no_delay(true), opt_ec);
              socket().set_option(boost::asio::socket_base::keep_alive(true), opt_ec);

              // Canonicalize remote address/port from the actual socket endpoint
              auto ep = socket().remote_endpoint(opt_ec);
              if (!opt_ec) {
                remote_addr_ = ep.address().to_string();
                remote_port_ = ep.port();
              }

              LOG_NET_TRACE("connected to {}:{}", remote_addr_, remote_port_);

              if (!tls_) {
                finish_connect(true, TransportError::None, callback);
                return;
              }
              // Timer keeps running across the TLS handshake
              do_handshake(boost::asio::ssl::stream_base::client, callback);
            }));
      }));
}

void RealTransportConnection::server_handshake(ConnectCallback callback) {
  boost::asio::dispatch(strand_, [this, self = shared_from_this(), callback]() {
    connect_done_ = false;
    if (!tls_) {
      finish_connect(true, TransportError::None, callback);
      return;
    }
    start_connect_timer(callback);
    do_handshake(boost::asio::ssl::stream_base::server, callback);
  });
}

void RealTransportConnection::do_handshake(boost::asio::ssl::stream_base::handshake_type type,
                                           ConnectCallback callback) {
  stream_.async_handshake(
      type, boost::asio::bind_executor(
                strand_, [this, self = shared_from_this(), callback](const boost::system::error_code &ec) {
                  if (connect_done_) return;
                  if (ec) {
                    LOG_NET_DEBUG("TLS handshake with {}:{} failed: {}", remote_addr_,
                                  remote_port_, ec.message());
                    boost::system::error_code ignored;
                    socket().close(ignored);
                    finish_connect(false, TransportError::TlsFailure, callback);
                    return;
                  }
                  capture_peer_certificate();
                  if (!peer_fingerprint_) {
                    LOG_NET_DEBUG("TLS peer {}:{} presented no certificate", remote_addr_,
                                  remote_port_);
                    boost::system::error_code ignored;
                    socket().close(ignored);
                    finish_connect(false, TransportError::TlsFailure, callback);
                    return;
                  }
                  LOG_NET_TRACE("TLS established with {}:{}", remote_addr_, remote_port_);
                  finish_connect(true, TransportError::None, callback);
                }));
}

void RealTransportConnection::capture_peer_certificate() {
  X509 *cert = SSL_get1_peer_certificate(stream_.native_handle());
  peer_fingerprint_ = fingerprint_of(cert);
  if (cert) {
    X509_free(cert);
  }
}

std::optional<std::string> RealTransportConnection::peer_certificate_fingerprint() const {
  return peer_fingerprint_;
}

void RealTransportConnection::start() {
  boost::asio::dispatch(strand_, [self = shared_from_this()]() {
    if (!self->open_)
      return;
    self->start_read_impl();
  });
}

void RealTransportConnection::start_read_impl() {
  if (!open_)
    return;

#ifndef NDEBUG
  assert(strand_.running_in_this_thread());
#endif

  // Fresh buffer per read so a second outstanding read can never share one
  auto buf = std::make_shared<std::vector<uint8_t>>(RECV_BUFFER_SIZE);

  auto handler = boost::asio::bind_executor(
      strand_, [this, self = shared_from_this(), buf](const boost::system::error_code &ec,
                                                      size_t bytes_transferred) {
        if (!open_) {
          deliver_disconnect_once();
          close_impl();
          return;
        }

        if (ec) {
          if (ec != boost::asio::error::eof && ec != boost::asio::error::operation_aborted) {
            LOG_NET_TRACE("read error from {}:{}: {}", remote_addr_, remote_port_, ec.message());
          }
          record_error(TransportErrorFromCode(ec));
          deliver_disconnect_once();
          close_impl();
          return;
        }

        if (bytes_transferred > 0) {
          ReceiveCallback saved_receive_cb = receive_callback_;
          if (saved_receive_cb) {
            LOG_NET_TRACE("received {} bytes from {}:{}", bytes_transferred, remote_addr_,
                          remote_port_);
            std::vector<uint8_t> data(buf->begin(), buf->begin() + bytes_transferred);
            try {
              saved_receive_cb(data);
            } catch (const std::exception &e) {
              LOG_NET_ERROR("exception in receive callback from {}:{}: {}", remote_addr_,
                            remote_port_, e.what());
            }
          }

          // The receive callback may have closed the connection
          if (!open_) {
            return;
          }
        }

        start_read_impl();
      });

  if (tls_) {
    stream_.async_read_some(boost::asio::buffer(*buf), std::move(handler));
  } else {
    socket().async_read_some(boost::asio::buffer(*buf), std::move(handler));
  }
}

// Returns false only if the connection is already closed at call time.
// Overflow is enforced on the strand: the connection is closed and the
// disconnect callback delivered.
bool RealTransportConnection::send(const std::vector<uint8_t> &data) {
  if (!open_) return false;
  // Copy before posting; the caller may free its buffer as soon as we return
  auto payload = std::make_shared<std::vector<uint8_t>>(data.begin(), data.end());
  boost::asio::dispatch(strand_, [this, self = shared_from_this(), payload]() {
    if (!open_) return;

    size_t limit = protocol::DEFAULT_SEND_QUEUE_SIZE;
#ifdef PEERLINK_TESTS
    size_t override_limit = send_queue_limit_override_bytes_.load(std::memory_order_relaxed);
    if (override_limit > 0) limit = override_limit;
#endif
    if (send_queue_bytes_ + payload->size() > limit) {
      LOG_NET_WARN("Send queue overflow (current: {} bytes, incoming: {} bytes, limit: {} bytes), "
                   "disconnecting slow-reading peer {}:{}",
                   send_queue_bytes_.load(), payload->size(), limit, remote_addr_, remote_port_);
      record_error(TransportError::Other);
      deliver_disconnect_once();
      close_impl();
      return;
    }

    send_queue_.push(payload);
    send_queue_bytes_ += payload->size();

    if (!writing_.exchange(true, std::memory_order_acquire)) {
      do_write_impl();
    }
  });
  return true;
}

void RealTransportConnection::do_write_impl() {
  if (!open_)
    return;
#ifndef NDEBUG
  assert(strand_.running_in_this_thread());
#endif

  if (send_queue_.empty()) {
    writing_.store(false, std::memory_order_release);
    return;
  }

  auto data_ptr = send_queue_.front();

  auto handler = boost::asio::bind_executor(
      strand_, [this, self = shared_from_this(), data_ptr](const boost::system::error_code &ec,
                                                           size_t) {
        // Closed while the write was in flight; queue already cleared
        if (!open_) {
          return;
        }

        if (ec) {
          LOG_NET_TRACE("write error to {}:{}: {}", remote_addr_, remote_port_, ec.message());
          record_error(TransportErrorFromCode(ec));
          deliver_disconnect_once();
          close_impl();
          return;
        }

        send_queue_.pop();
        send_queue_bytes_ -= data_ptr->size();

        if (!send_queue_.empty()) {
          do_write_impl();
        } else {
          writing_.store(false, std::memory_order_release);
        }
      });

  if (tls_) {
    boost::asio::async_write(stream_, boost::asio::buffer(*data_ptr), std::move(handler));
  } else {
    boost::asio::async_write(socket(), boost::asio::buffer(*data_ptr), std::move(handler));
  }
}

void RealTransportConnection::deliver_disconnect_once() {
#ifndef NDEBUG
  assert(strand_.running_in_this_thread());
#endif
  if (disconnect_delivered_) {
    return;
  }
  disconnect_delivered_ = true;

  DisconnectCallback saved_disconnect_cb = std::move(disconnect_callback_);
  if (saved_disconnect_cb) {
    // Post to io_context (not strand) to avoid re-entering strand
    boost::asio::post(io_context_, [cb = std::move(saved_disconnect_cb)]() {
      try {
        cb();
      } catch (const std::exception &e) {
        LOG_NET_ERROR("exception in disconnect callback: {}", e.what());
      }
    });
  }
}

void RealTransportConnection::close() {
  boost::asio::dispatch(strand_, [this, self = shared_from_this()]() {
    record_error(TransportError::Closed);
    close_impl();
  });
}

void RealTransportConnection::close_impl() {
#ifndef NDEBUG
  assert(strand_.running_in_this_thread());
#endif
  // A pending connect or handshake is abandoned silently
  connect_done_ = true;

  if (!open_.exchange(false)) {
    // Never opened (or already closed): still release the socket and timer
    boost::system::error_code ignored;
    socket().cancel(ignored);
    socket().close(ignored);
    if (connect_timer_) (void)connect_timer_->cancel();
    resolver_.reset();
    return;
  }

  // Cancel outstanding I/O first. Pending handlers hold shared_from_this()
  // and exit on operation_aborted / !open_. The ssl::stream stays alive until
  // the last handler releases the connection; TLS close_notify is skipped.
  {
    boost::system::error_code ignored;
    socket().cancel(ignored);
    socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
    socket().close(ignored);
  }

  receive_callback_ = {};
  disconnect_callback_ = {};

  // Destroy the timer here while the io_context is guaranteed alive
  {
    auto timer_to_destroy = std::move(connect_timer_);
    if (timer_to_destroy) {
      (void)timer_to_destroy->cancel();
    }
  }

  resolver_.reset();

  // Large queued buffers are released off the strand
  std::queue<std::shared_ptr<std::vector<uint8_t>>> queue_to_destroy;
  std::swap(send_queue_, queue_to_destroy);
  send_queue_bytes_ = 0;
  writing_.store(false, std::memory_order_release);

  if (!queue_to_destroy.empty()) {
    boost::asio::post(io_context_, [queue = std::move(queue_to_destroy)]() mutable {
      (void)queue;
    });
  }
}

bool RealTransportConnection::is_open() const { return open_; }

#ifdef PEERLINK_TESTS
void RealTransportConnection::SetConnectTimeoutForTest(std::chrono::milliseconds timeout_ms) {
  connect_timeout_override_ms_.store(timeout_ms, std::memory_order_relaxed);
}

void RealTransportConnection::ResetConnectTimeoutForTest() {
  connect_timeout_override_ms_.store(std::chrono::milliseconds{0}, std::memory_order_relaxed);
}

void RealTransportConnection::SetSendQueueLimitForTest(size_t bytes) {
  send_queue_limit_override_bytes_.store(bytes, std::memory_order_relaxed);
}

void RealTransportConnection::ResetSendQueueLimitForTest() {
  send_queue_limit_override_bytes_.store(0, std::memory_order_relaxed);
}
#endif

std::chrono::milliseconds RealTransportConnection::connect_timeout_ms() const {
#ifdef PEERLINK_TESTS
  auto ms = connect_timeout_override_ms_.load(std::memory_order_relaxed);
  if (ms.count() > 0) return ms;
#endif
  return std::chrono::duration_cast<std::chrono::milliseconds>(protocol::CONNECT_TIMEOUT);
}

std::string RealTransportConnection::remote_address() const { return remote_addr_; }

uint16_t RealTransportConnection::remote_port() const { return remote_port_; }

void RealTransportConnection::set_receive_callback(ReceiveCallback callback) {
  boost::asio::dispatch(strand_, [this, self = shared_from_this(), cb = std::move(callback)]() mutable {
    receive_callback_ = std::move(cb);
  });
}

void RealTransportConnection::set_disconnect_callback(DisconnectCallback callback) {
  boost::asio::dispatch(strand_, [this, self = shared_from_this(), cb = std::move(callback)]() mutable {
    disconnect_callback_ = std::move(cb);
  });
}

// ============================================================================
// RealTransport
// ============================================================================

RealTransport::RealTransport(boost::asio::io_context &io_context,
                             std::optional<TlsCredential> tls)
    : io_context_(io_context) {
  if (tls) {
    tls_context_ = make_tls_context(*tls, tls_error_);
    if (!tls_context_) {
      LOG_NET_ERROR("failed to load TLS credential ({}): {}", tls->certificate_path, tls_error_);
    }
  }
}

RealTransport::~RealTransport() { stop(); }

std::optional<std::string> RealTransport::certificate_fingerprint(const std::string &pem_path) {
  FILE *fp = std::fopen(pem_path.c_str(), "r");
  if (!fp) {
    return std::nullopt;
  }
  X509 *cert = PEM_read_X509(fp, nullptr, nullptr, nullptr);
  std::fclose(fp);
  auto fingerprint = fingerprint_of(cert);
  if (cert) {
    X509_free(cert);
  }
  return fingerprint;
}

TransportConnectionPtr RealTransport::connect(const std::string &address, uint16_t port,
                                              ConnectCallback callback) {
  if (!running_) return {};
  return RealTransportConnection::create_outbound(io_context_, tls_context_, address, port,
                                                  std::move(callback));
}

bool RealTransport::listen(uint16_t port, AcceptCallback accept_callback) {
  if (acceptor_) {
    LOG_NET_TRACE("already listening");
    return false;
  }

  accept_callback_ = std::move(accept_callback);

  try {
    using tcp = boost::asio::ip::tcp;
    acceptor_ = std::make_unique<tcp::acceptor>(io_context_);

    // Try dual-stack (IPv6 with v6_only=false); fall back to IPv4-only on failure
    try {
      acceptor_->open(tcp::v6());
      acceptor_->set_option(boost::asio::ip::v6_only(false));
      acceptor_->set_option(tcp::acceptor::reuse_address(true));
      acceptor_->bind(tcp::endpoint(tcp::v6(), port));
      acceptor_->listen(boost::asio::socket_base::max_listen_connections);
    } catch (const boost::system::system_error &) {
      boost::system::error_code ec;
      acceptor_->close(ec);
      acceptor_->open(tcp::v4());
      acceptor_->set_option(tcp::acceptor::reuse_address(true));
      acceptor_->bind(tcp::endpoint(tcp::v4(), port));
      acceptor_->listen(boost::asio::socket_base::max_listen_connections);
    }

    // Record the actual bound port (handles ephemeral port 0)
    {
      boost::system::error_code ec;
      auto ep = acceptor_->local_endpoint(ec);
      last_listen_port_ = ec ? 0 : ep.port();
    }

    LOG_NET_INFO("listening on port {}{}", last_listen_port_ ? last_listen_port_ : port,
                 tls_context_ ? " (TLS)" : "");
    start_accept();
    return true;

  } catch (const boost::system::system_error &e) {
    LOG_NET_ERROR("failed to listen on port {}: {}", port, e.what());
    if (acceptor_) {
      boost::system::error_code ec;
      acceptor_->close(ec);
      acceptor_.reset();
    }
    return false;
  }
}

void RealTransport::start_accept() {
  if (!acceptor_)
    return;

  // stop_listening()/stop() cancel pending accepts before destruction
  acceptor_->async_accept([this](const boost::system::error_code &ec,
                                 boost::asio::ip::tcp::socket socket) {
    handle_accept(ec, std::move(socket));
  });
}

void RealTransport::handle_accept(const boost::system::error_code &ec,
                                  boost::asio::ip::tcp::socket socket) {
  if (ec) {
    if (ec != boost::asio::error::operation_aborted) {
      LOG_NET_TRACE("accept error: {}", ec.message());
      start_accept();
    }
    return;
  }

  boost::system::error_code opt_ec;
  socket.set_option(boost::asio::ip::tcp::no_delay(true), opt_ec);
  socket.set_option(boost::asio::socket_base::keep_alive(true), opt_ec);

  auto conn = RealTransportConnection::create_inbound(io_context_, tls_context_, std::move(socket));
  LOG_NET_DEBUG("connection from {}:{} accepted", conn->remote_address(), conn->remote_port());

  std::weak_ptr<bool> alive = alive_;
  conn->server_handshake([this, alive, conn](bool success) {
    if (alive.expired()) {
      conn->close();
      return;
    }
    if (!success) {
      LOG_NET_DEBUG("inbound handshake from {}:{} failed: {}", conn->remote_address(),
                    conn->remote_port(), TransportErrorString(conn->last_error()));
      return;
    }
    if (!running_ || !accept_callback_) {
      conn->close();
      return;
    }
    accept_callback_(conn);
  });

  start_accept();
}

void RealTransport::stop_listening() {
  if (acceptor_) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    acceptor_.reset();
  }
  last_listen_port_ = 0;

  // Release anything the callback captured
  accept_callback_ = {};
}

void RealTransport::run() { running_ = true; }

void RealTransport::stop() {
  running_.store(false);

  // Don't log here - this is called from destructor, logger may be shut down
  stop_listening();
}

} // namespace network
} // namespace peerlink
