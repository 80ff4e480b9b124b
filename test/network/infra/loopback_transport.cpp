// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#include "network/infra/loopback_transport.hpp"
#include <boost/asio/post.hpp>
#include <deque>

namespace peerlink {
namespace test {

using network::TransportConnectionPtr;
using network::TransportError;

namespace {

// One end of an in-memory byte pipe. Bytes that arrive before start() are
// held back, like data sitting in a socket buffer.
class LoopbackConnection : public network::TransportConnection,
                           public std::enable_shared_from_this<LoopbackConnection> {
public:
    LoopbackConnection(boost::asio::io_context& io_context, uint64_t id, bool inbound,
                       std::string remote_address, uint16_t remote_port)
        : io_context_(io_context), id_(id), inbound_(inbound),
          remote_address_(std::move(remote_address)), remote_port_(remote_port) {}

    static void link(const std::shared_ptr<LoopbackConnection>& a,
                     const std::shared_ptr<LoopbackConnection>& b) {
        a->peer_ = b;
        b->peer_ = a;
    }

    void start() override {
        if (started_) return;
        started_ = true;
        while (!pending_.empty() && open_) {
            auto data = std::move(pending_.front());
            pending_.pop_front();
            dispatch(data);
        }
    }

    bool send(const std::vector<uint8_t>& data) override {
        if (!open_) return false;
        auto peer = peer_.lock();
        if (!peer) return false;
        boost::asio::post(io_context_, [peer, data]() { peer->deliver(data); });
        return true;
    }

    void close() override {
        if (!open_) return;
        open_ = false;
        last_error_ = TransportError::Closed;
        pending_.clear();
        if (auto peer = peer_.lock()) {
            boost::asio::post(io_context_, [peer]() { peer->close_from_remote(); });
        }
    }

    bool is_open() const override { return open_; }
    std::string remote_address() const override { return remote_address_; }
    uint16_t remote_port() const override { return remote_port_; }
    bool is_inbound() const override { return inbound_; }
    uint64_t connection_id() const override { return id_; }
    size_t send_queue_bytes() const override { return 0; }
    TransportError last_error() const override { return last_error_; }
    std::optional<std::string> peer_certificate_fingerprint() const override {
        return remote_fingerprint_;
    }

    void set_receive_callback(network::ReceiveCallback callback) override {
        receive_callback_ = std::move(callback);
    }
    void set_disconnect_callback(network::DisconnectCallback callback) override {
        disconnect_callback_ = std::move(callback);
    }

    void set_remote_fingerprint(std::optional<std::string> fp) { remote_fingerprint_ = std::move(fp); }

    void fail(TransportError error) {
        open_ = false;
        last_error_ = error;
    }

private:
    void deliver(const std::vector<uint8_t>& data) {
        if (!open_) return;
        if (!started_) {
            pending_.push_back(data);
            return;
        }
        dispatch(data);
    }

    void dispatch(const std::vector<uint8_t>& data) {
        if (receive_callback_) {
            auto cb = receive_callback_;
            cb(data);
        }
    }

    void close_from_remote() {
        if (!open_) return;
        open_ = false;
        last_error_ = TransportError::Reset;
        pending_.clear();
        if (disconnect_callback_) {
            auto cb = disconnect_callback_;
            cb();
        }
    }

    boost::asio::io_context& io_context_;
    uint64_t id_;
    bool inbound_;
    std::string remote_address_;
    uint16_t remote_port_;
    std::weak_ptr<LoopbackConnection> peer_;
    bool open_{true};
    bool started_{false};
    TransportError last_error_{TransportError::None};
    std::optional<std::string> remote_fingerprint_;
    std::deque<std::vector<uint8_t>> pending_;
    network::ReceiveCallback receive_callback_;
    network::DisconnectCallback disconnect_callback_;
};

} // namespace

void LoopbackNetwork::register_listener(const std::string& address, uint16_t port,
                                        LoopbackTransport* transport) {
    listeners_[key(address, port)] = transport;
}

void LoopbackNetwork::unregister_listener(const std::string& address, uint16_t port) {
    listeners_.erase(key(address, port));
}

LoopbackTransport* LoopbackNetwork::find_listener(const std::string& address, uint16_t port) const {
    auto it = listeners_.find(key(address, port));
    return it == listeners_.end() ? nullptr : it->second;
}

LoopbackTransport::LoopbackTransport(LoopbackNetwork& network, std::string address)
    : network_(network), address_(std::move(address)) {}

LoopbackTransport::~LoopbackTransport() { stop(); }

TransportConnectionPtr LoopbackTransport::connect(const std::string& address, uint16_t port,
                                                  network::ConnectCallback callback) {
    ++connect_attempts_;
    if (!running_) {
        return nullptr;
    }

    auto& io = network_.io_context();
    auto client = std::make_shared<LoopbackConnection>(io, network_.next_connection_id(), false,
                                                       address, port);
    if (stall_connects_) {
        return client;
    }

    auto* network = &network_;
    std::string local_address = address_;
    auto local_fingerprint = fingerprint_;
    boost::asio::post(io, [network, client, address, port, callback, local_address,
                           local_fingerprint]() {
        if (!client->is_open()) {
            return; // caller gave up
        }
        LoopbackTransport* target = network->find_listener(address, port);
        if (!target) {
            client->fail(TransportError::Refused);
            if (callback) callback(false);
            return;
        }

        auto server = std::make_shared<LoopbackConnection>(
            network->io_context(), network->next_connection_id(), true, local_address,
            static_cast<uint16_t>(50000 + client->connection_id() % 10000));
        server->set_remote_fingerprint(local_fingerprint);
        client->set_remote_fingerprint(target->certificate_fingerprint());
        LoopbackConnection::link(client, server);

        target->deliver_inbound(server);
        if (callback) callback(true);
    });
    return client;
}

void LoopbackTransport::deliver_inbound(TransportConnectionPtr connection) {
    if (!accept_callback_ || listen_port_ == 0) {
        connection->close();
        return;
    }
    auto cb = accept_callback_;
    cb(connection);
}

bool LoopbackTransport::listen(uint16_t port, network::AcceptCallback accept_callback) {
    if (!running_) {
        return false;
    }
    if (port == 0) {
        port = static_cast<uint16_t>(40000 + network_.next_connection_id() % 10000);
    }
    if (network_.find_listener(address_, port)) {
        return false;
    }
    listen_port_ = port;
    accept_callback_ = std::move(accept_callback);
    network_.register_listener(address_, port, this);
    return true;
}

void LoopbackTransport::stop_listening() {
    if (listen_port_ != 0) {
        network_.unregister_listener(address_, listen_port_);
    }
    listen_port_ = 0;
    accept_callback_ = nullptr;
}

void LoopbackTransport::stop() {
    stop_listening();
    running_ = false;
}

} // namespace test
} // namespace peerlink
