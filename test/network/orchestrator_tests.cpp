// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "network/connection_orchestrator.hpp"
#include "network/infra/loopback_transport.hpp"
#include "network/infra/mock_transport.hpp"
#include "util/files.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <functional>

using namespace peerlink;
using namespace peerlink::network;
using namespace std::chrono_literals;

namespace {

class FakeIdentity : public IdentityProvider {
public:
  explicit FakeIdentity(message::PeerIdentity identity) : identity_(std::move(identity)) {}
  message::PeerIdentity local_identity() const override { return identity_; }

private:
  message::PeerIdentity identity_;
};

class FakeConsent : public ConsentProvider {
public:
  enum class Mode { Accept, Reject, Hold };

  void request_consent(const PendingRequest &request, ConsentCallback decide) override {
    requests.push_back(request);
    switch (mode) {
    case Mode::Accept:
      decide(true);
      break;
    case Mode::Reject:
      decide(false);
      break;
    case Mode::Hold:
      held = std::move(decide);
      break;
    }
  }
  void cancel_consent(const std::string &peer_id) override { cancelled.push_back(peer_id); }

  Mode mode = Mode::Accept;
  std::vector<PendingRequest> requests;
  std::vector<std::string> cancelled;
  ConsentCallback held;
};

class FakeStorage : public StorageProvider {
public:
  explicit FakeStorage(std::filesystem::path dir) : dir_(std::move(dir)) {}
  uint64_t available_bytes() const override { return 1ull << 40; }
  std::filesystem::path download_directory() const override { return dir_; }

private:
  std::filesystem::path dir_;
};

class FakeChat : public ChatSink {
public:
  void on_text_message(const std::string &peer_id, const message::TextMessagePayload &text) override {
    texts.emplace_back(peer_id, text.text);
  }
  void on_media_message(const std::string &, const message::MediaMessagePayload &) override {}
  void on_reaction(const std::string &, const message::ReactionPayload &) override {}
  void on_receipt(const std::string &, const message::MessageReceiptPayload &) override {}
  void on_typing(const std::string &, bool) override {}
  void on_chat_rejected(const std::string &, const std::string &reason) override {
    rejections.push_back(reason);
  }

  std::vector<std::pair<std::string, std::string>> texts;
  std::vector<std::string> rejections;
};

class FakeCalls : public CallSignalingSink {
public:
  void on_call_request(const std::string &peer_id) override { requests.push_back(peer_id); }
  void on_call_accept(const std::string &peer_id) override { accepted.push_back(peer_id); }
  void on_call_reject(const std::string &, const std::string &reason) override {
    rejections.push_back(reason);
  }
  void on_call_end(const std::string &peer_id) override { ended.push_back(peer_id); }
  void on_signaling(const std::string &, const message::PeerMessage &) override {}

  std::vector<std::string> requests;
  std::vector<std::string> accepted;
  std::vector<std::string> rejections;
  std::vector<std::string> ended;
};

ConnectionOrchestrator::Config TestConfig() {
  ConnectionOrchestrator::Config config;
  config.listen_port = 0;
  config.enable_multicast_discovery = false;
  config.auto_reconnect = false;
  config.io_threads = 0;
  return config;
}

// One engine on the loopback network. Not movable: the orchestrator holds
// references to the collaborators.
struct Node {
  Node(test::LoopbackNetwork &network, std::shared_ptr<boost::asio::io_context> io,
       const message::PeerIdentity &local, const std::string &address,
       const std::filesystem::path &dir, const ConnectionOrchestrator::Config &config)
      : identity(local), storage(dir),
        transport(std::make_shared<test::LoopbackTransport>(network, address)) {
    util::ensure_directory(dir);
    orchestrator = std::make_unique<ConnectionOrchestrator>(identity, consent, storage, config,
                                                            transport, std::move(io));
    orchestrator->set_chat_sink(&chat);
    orchestrator->set_call_sink(&calls);
    subscription.emplace(orchestrator->notifications().SubscribeStateChange(
        [this](const ConnectionState &state) { states.push_back(state.kind()); }));
  }

  const std::string &id() const { return orchestrator->local_identity().id; }
  StateKind state() const { return orchestrator->state().kind(); }
  bool saw(StateKind kind) const {
    return std::find(states.begin(), states.end(), kind) != states.end();
  }

  FakeIdentity identity;
  FakeConsent consent;
  FakeStorage storage;
  FakeChat chat;
  FakeCalls calls;
  std::shared_ptr<test::LoopbackTransport> transport;
  std::unique_ptr<ConnectionOrchestrator> orchestrator;
  std::vector<StateKind> states;
  std::optional<ConnectionNotifications::Subscription> subscription;
};

struct OrchestratorFixture {
  std::shared_ptr<boost::asio::io_context> io = std::make_shared<boost::asio::io_context>();
  test::LoopbackNetwork network{*io};
  std::filesystem::path root = std::filesystem::temp_directory_path() / "peerlink_orchestrator_test";
  std::vector<std::unique_ptr<Node>> nodes;

  OrchestratorFixture() { std::filesystem::remove_all(root); }

  ~OrchestratorFixture() {
    for (auto &node : nodes) {
      node->orchestrator->stop();
    }
    run_for(20ms);
    nodes.clear();
    std::filesystem::remove_all(root);
    ConnectionOrchestrator::ResetTimeoutsForTest();
    TransportSession::ResetReadyTimeoutForTest();
  }

  Node &add_node(const std::string &id,
                 const ConnectionOrchestrator::Config &config = TestConfig()) {
    return add_node(message::PeerIdentity{id, "Device " + id, std::nullopt}, config);
  }

  Node &add_node(const message::PeerIdentity &identity,
                 const ConnectionOrchestrator::Config &config = TestConfig()) {
    std::string address = "10.0.0." + std::to_string(nodes.size() + 1);
    nodes.push_back(
        std::make_unique<Node>(network, io, identity, address, root / identity.id, config));
    Node &node = *nodes.back();
    REQUIRE(node.orchestrator->start());
    return node;
  }

  ConnectionResult dial(Node &from, Node &to) {
    return from.orchestrator->request_connection(to.transport->address(),
                                                 to.orchestrator->listening_port());
  }

  // Run at most `count` ready handlers
  void poll_handlers(int count) {
    io->restart();
    for (int i = 0; i < count; ++i) {
      io->poll_one();
    }
  }

  void run_for(std::chrono::milliseconds duration) {
    io->restart();
    io->run_for(duration);
  }

  bool run_until(const std::function<bool()> &done, std::chrono::milliseconds limit = 3s) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
      if (done()) return true;
      io->restart();
      io->run_for(5ms);
    }
    return done();
  }
};

bool Connected(const Node &a, const Node &b) {
  return a.orchestrator->registry().contains(b.id()) &&
         b.orchestrator->registry().contains(a.id()) && a.state() == StateKind::Connected &&
         b.state() == StateKind::Connected;
}

} // namespace

TEST_CASE("Orchestrator handshake with consent", "[network][orchestrator]") {
  OrchestratorFixture f;
  Node &a = f.add_node("alice");
  Node &b = f.add_node("bob");

  REQUIRE(a.state() == StateKind::Discovering);
  REQUIRE(b.state() == StateKind::Discovering);

  SECTION("Accepted") {
    REQUIRE(f.dial(a, b) == ConnectionResult::Success);
    REQUIRE(a.state() == StateKind::Requesting);
    REQUIRE(f.run_until([&] { return Connected(a, b); }));

    REQUIRE(b.consent.requests.size() == 1);
    REQUIRE(b.consent.requests[0].peer.id == "alice");
    REQUIRE(b.consent.requests[0].peer.display_name == "Device alice");

    std::vector<StateKind> initiator{StateKind::Discovering, StateKind::PeerFound,
                                     StateKind::Requesting, StateKind::Connecting,
                                     StateKind::Connected};
    std::vector<StateKind> acceptor{StateKind::Discovering, StateKind::IncomingRequest,
                                    StateKind::Connecting, StateKind::Connected};
    REQUIRE(a.states == initiator);
    REQUIRE(b.states == acceptor);

    // Already connected peers are not dialed again
    REQUIRE(f.dial(a, b) == ConnectionResult::AlreadyConnected);
  }

  SECTION("Declined") {
    ConnectionOrchestrator::SetRejectedRecoveryDelayForTest(30ms);
    b.consent.mode = FakeConsent::Mode::Reject;
    REQUIRE(f.dial(a, b) == ConnectionResult::Success);
    REQUIRE(f.run_until([&] { return a.state() == StateKind::Rejected; }));
    REQUIRE(b.saw(StateKind::Rejected));
    REQUIRE(b.state() == StateKind::Discovering);
    REQUIRE(a.orchestrator->registry().empty());
    REQUIRE(b.orchestrator->registry().empty());

    // Rejected recovers to Discovering on its own
    REQUIRE(f.run_until([&] { return a.state() == StateKind::Discovering; }));
    // A rejection is not a transport failure
    REQUIRE(a.orchestrator->circuit_breaker().ShouldAttemptConnection(
        ManualPeerId(b.transport->address(), b.orchestrator->listening_port())));
  }

  SECTION("Pending request is visible until decided") {
    b.consent.mode = FakeConsent::Mode::Hold;
    REQUIRE(f.dial(a, b) == ConnectionResult::Success);
    REQUIRE(f.run_until([&] { return b.orchestrator->pending_request().has_value(); }));
    REQUIRE(b.state() == StateKind::IncomingRequest);
    REQUIRE(b.orchestrator->pending_request()->peer.id == "alice");

    // A second attempt while one is in flight is refused
    REQUIRE(f.dial(a, b) == ConnectionResult::RequestInProgress);

    auto decide = b.consent.held;
    decide(true);
    REQUIRE(f.run_until([&] { return Connected(a, b); }));
    REQUIRE_FALSE(b.orchestrator->pending_request().has_value());
  }
}

TEST_CASE("Orchestrator handshake timeouts", "[network][orchestrator]") {
  OrchestratorFixture f;
  Node &a = f.add_node("alice");
  Node &b = f.add_node("bob");
  b.consent.mode = FakeConsent::Mode::Hold;

  SECTION("Initiator gives up waiting for an answer") {
    ConnectionOrchestrator::SetRequestingTimeoutForTest(60ms);
    REQUIRE(f.dial(a, b) == ConnectionResult::Success);
    REQUIRE(f.run_until([&] { return a.state() == StateKind::Failed; }));
    REQUIRE(a.orchestrator->state().reason() == "Connection timed out");
    REQUIRE_FALSE(a.orchestrator->has_outgoing_attempt());

    // The acceptor sees the cancel and withdraws the prompt
    REQUIRE(f.run_until([&] { return b.state() == StateKind::Discovering; }));
    REQUIRE(b.saw(StateKind::IncomingRequest));
    REQUIRE(b.consent.cancelled == std::vector<std::string>{"alice"});
    REQUIRE_FALSE(b.orchestrator->pending_request().has_value());

    // A late decision is ignored
    auto decide = b.consent.held;
    decide(true);
    f.run_for(20ms);
    REQUIRE(b.orchestrator->registry().empty());
  }

  SECTION("Acceptor expires the consent prompt") {
    ConnectionOrchestrator::SetConsentTimeoutForTest(60ms);
    ConnectionOrchestrator::SetRejectedRecoveryDelayForTest(1s);
    REQUIRE(f.dial(a, b) == ConnectionResult::Success);
    REQUIRE(f.run_until([&] { return a.state() == StateKind::Rejected; }));
    REQUIRE(b.consent.cancelled == std::vector<std::string>{"alice"});
    REQUIRE(b.state() == StateKind::Discovering);
  }

  SECTION("Transport never becomes ready") {
    TransportSession::SetReadyTimeoutForTest(50ms);
    a.transport->set_stall_connects(true);
    REQUIRE(f.dial(a, b) == ConnectionResult::Success);
    REQUIRE(f.run_until([&] { return a.state() == StateKind::Failed; }));
    REQUIRE(a.orchestrator->state().reason() == "Connection timed out");
  }
}

TEST_CASE("Orchestrator refuses unreachable and invalid peers", "[network][orchestrator]") {
  OrchestratorFixture f;
  Node &a = f.add_node("alice");

  SECTION("Nobody listening") {
    REQUIRE(a.orchestrator->request_connection("10.0.0.99", 1234) == ConnectionResult::Success);
    REQUIRE(f.run_until([&] { return a.state() == StateKind::Failed; }));
    REQUIRE(a.orchestrator->state().reason() == "Connection refused");
  }

  SECTION("Circuit opens after repeated failures") {
    for (int i = 0; i < 3; ++i) {
      REQUIRE(a.orchestrator->request_connection("10.0.0.99", 1234) == ConnectionResult::Success);
      REQUIRE(f.run_until([&] { return !a.orchestrator->has_outgoing_attempt(); }));
    }
    REQUIRE(a.orchestrator->request_connection("10.0.0.99", 1234) ==
            ConnectionResult::CircuitOpen);
  }

  SECTION("Self connect") {
    REQUIRE(f.dial(a, a) == ConnectionResult::Success);
    REQUIRE(f.run_until([&] { return a.state() == StateKind::Failed; }));
    REQUIRE(a.orchestrator->registry().empty());
  }

  SECTION("Certificate fingerprint mismatch") {
    // Identity claims one certificate, the transport presents another
    Node &m = f.add_node(message::PeerIdentity{"mallory", "Mallory", std::string(64, 'b')});
    m.transport->set_certificate_fingerprint(std::string(64, 'a'));

    REQUIRE(f.dial(m, a) == ConnectionResult::Success);
    REQUIRE(f.run_until([&] { return m.orchestrator->state().kind() == StateKind::Failed; }));
    REQUIRE(a.orchestrator->registry().empty());
    REQUIRE(a.consent.requests.empty());
    REQUIRE(a.state() == StateKind::Discovering);
  }
}

TEST_CASE("Orchestrator simultaneous connect yields one session", "[network][orchestrator]") {
  // Both sides dial; the second dial follows after `interleave` handlers so
  // hellos, requests and busy rejections cross in every order.
  for (bool low_first : {true, false}) {
    for (int interleave = 0; interleave <= 5; ++interleave) {
      INFO("low_first=" << low_first << " interleave=" << interleave);
      OrchestratorFixture f;
      Node &low = f.add_node("aa-device");
      Node &high = f.add_node("zz-device");
      low.consent.mode = FakeConsent::Mode::Hold;
      high.consent.mode = FakeConsent::Mode::Hold;

      Node &first = low_first ? low : high;
      Node &second = low_first ? high : low;
      REQUIRE(f.dial(first, second) == ConnectionResult::Success);
      f.poll_handlers(interleave);
      REQUIRE(f.dial(second, first) == ConnectionResult::Success);

      REQUIRE(f.run_until([&] { return Connected(low, high); }));
      f.run_for(50ms);

      REQUIRE(low.orchestrator->registry().size() == 1);
      REQUIRE(high.orchestrator->registry().size() == 1);
      REQUIRE(Connected(low, high));
      REQUIRE_FALSE(low.orchestrator->has_outgoing_attempt());
      REQUIRE_FALSE(high.orchestrator->has_outgoing_attempt());
      REQUIRE_FALSE(low.orchestrator->pending_request());
      REQUIRE_FALSE(high.orchestrator->pending_request());
      REQUIRE(first.consent.requests.empty());
      if (interleave <= 3) {
        // Second dial went out before the first request was delivered
        REQUIRE(second.consent.requests.empty());
      } else {
        // The prompt already raised is answered by dialing back
        REQUIRE(second.consent.requests.size() == 1);
        REQUIRE(second.consent.cancelled == std::vector<std::string>{first.id()});
      }
    }
  }
}

TEST_CASE("Orchestrator accepts the larger peer after a busy rejection",
          "[network][orchestrator]") {
  OrchestratorFixture f;
  Node &low = f.add_node("aa-device");
  Node &high = f.add_node("zz-device");
  low.consent.mode = FakeConsent::Mode::Hold;
  high.consent.mode = FakeConsent::Mode::Hold;
  ConnectionOrchestrator::SetRejectedRecoveryDelayForTest(1s);

  // high answers busy before its own hello reaches low
  REQUIRE(f.dial(low, high) == ConnectionResult::Success);
  f.poll_handlers(1);
  REQUIRE(f.dial(high, low) == ConnectionResult::Success);

  REQUIRE(f.run_until([&] { return Connected(low, high); }));
  REQUIRE(low.saw(StateKind::Rejected));
  REQUIRE(low.consent.requests.empty());
  REQUIRE(high.consent.requests.empty());

  SECTION("Only the peer that answered busy is let in") {
    Node &other = f.add_node("zzz-other");
    other.consent.mode = FakeConsent::Mode::Hold;
    REQUIRE(low.orchestrator->disconnect(high.id()));
    REQUIRE(f.dial(other, low) == ConnectionResult::Success);
    REQUIRE(f.run_until([&] { return low.consent.requests.size() == 1; }));
    REQUIRE(low.consent.requests[0].peer.id == "zzz-other");
    REQUIRE(low.orchestrator->registry().empty());
  }
}

TEST_CASE("Orchestrator enforces the connection limit", "[network][orchestrator]") {
  OrchestratorFixture f;
  Node &hub = f.add_node("hub");

  for (size_t i = 0; i < protocol::MAX_CONNECTIONS; ++i) {
    Node &client = f.add_node("client-" + std::to_string(i));
    REQUIRE(f.dial(client, hub) == ConnectionResult::Success);
    REQUIRE(f.run_until([&] { return Connected(client, hub); }));
  }
  REQUIRE(hub.orchestrator->registry().is_full());
  REQUIRE(hub.state() == StateKind::Connected);

  ConnectionOrchestrator::SetRejectedRecoveryDelayForTest(1s);
  Node &extra = f.add_node("extra");
  REQUIRE(f.dial(extra, hub) == ConnectionResult::Success);
  REQUIRE(f.run_until([&] { return extra.state() == StateKind::Rejected; }));
  REQUIRE(hub.orchestrator->registry().size() == protocol::MAX_CONNECTIONS);
  REQUIRE_FALSE(hub.orchestrator->registry().contains("extra"));

  // The hub cannot dial out either
  REQUIRE(f.dial(hub, extra) == ConnectionResult::RegistryFull);
}

TEST_CASE("Orchestrator disconnects", "[network][orchestrator]") {
  OrchestratorFixture f;
  Node &a = f.add_node("alice");
  Node &b = f.add_node("bob");
  REQUIRE(f.dial(a, b) == ConnectionResult::Success);
  REQUIRE(f.run_until([&] { return Connected(a, b); }));

  std::vector<std::string> lost;
  auto sub = b.orchestrator->notifications().SubscribeDisconnected(
      [&](const std::string &peer_id) { lost.push_back(peer_id); });

  SECTION("Deliberate") {
    REQUIRE(a.orchestrator->disconnect("bob"));
    REQUIRE(a.orchestrator->registry().empty());
    REQUIRE(a.state() == StateKind::Discovering);
    REQUIRE(a.saw(StateKind::Disconnected));

    REQUIRE(f.run_until([&] { return b.orchestrator->registry().empty(); }));
    REQUIRE(b.state() == StateKind::Failed);
    REQUIRE(b.orchestrator->state().reason() == "Peer disconnected");
    REQUIRE(lost == std::vector<std::string>{"alice"});

    REQUIRE_FALSE(a.orchestrator->disconnect("bob"));
  }

  SECTION("Engine stop") {
    b.orchestrator->stop();
    REQUIRE(b.state() == StateKind::Idle);
    REQUIRE(f.run_until([&] { return a.orchestrator->registry().empty(); }));
    REQUIRE(a.state() == StateKind::Failed);
  }
}

TEST_CASE("Orchestrator disconnects every peer at once", "[network][orchestrator]") {
  OrchestratorFixture f;
  Node &hub = f.add_node("hub");
  Node &a = f.add_node("alice");
  Node &b = f.add_node("bob");
  REQUIRE(f.dial(a, hub) == ConnectionResult::Success);
  REQUIRE(f.run_until([&] { return Connected(a, hub); }));
  REQUIRE(f.dial(b, hub) == ConnectionResult::Success);
  REQUIRE(f.run_until([&] { return Connected(b, hub); }));
  REQUIRE(hub.orchestrator->registry().size() == 2);

  hub.orchestrator->disconnect_all();
  REQUIRE(hub.orchestrator->registry().empty());
  REQUIRE(hub.state() == StateKind::Discovering);
  REQUIRE(f.run_until([&] {
    return a.orchestrator->registry().empty() && b.orchestrator->registry().empty();
  }));
}

TEST_CASE("Orchestrator follows process lifecycle", "[network][orchestrator]") {
  OrchestratorFixture f;
  Node &a = f.add_node("alice");
  REQUIRE(a.orchestrator->discovery().is_running());

  a.orchestrator->handle_lifecycle_change(LifecycleEvent::Background);
  REQUIRE_FALSE(a.orchestrator->discovery().is_running());

  a.orchestrator->handle_lifecycle_change(LifecycleEvent::Foreground);
  REQUIRE(a.orchestrator->discovery().is_running());
  REQUIRE(a.state() == StateKind::Discovering);

  SECTION("Foreground while connected leaves discovery alone") {
    Node &b = f.add_node("bob");
    REQUIRE(f.dial(a, b) == ConnectionResult::Success);
    REQUIRE(f.run_until([&] { return Connected(a, b); }));

    a.orchestrator->handle_lifecycle_change(LifecycleEvent::Background);
    REQUIRE_FALSE(a.orchestrator->discovery().is_running());
    a.orchestrator->handle_lifecycle_change(LifecycleEvent::Foreground);
    REQUIRE_FALSE(a.orchestrator->discovery().is_running());
    REQUIRE(a.state() == StateKind::Connected);
  }
}

TEST_CASE("Orchestrator routes session traffic", "[network][orchestrator]") {
  OrchestratorFixture f;
  Node &a = f.add_node("alice");
  Node &b = f.add_node("bob");
  REQUIRE(f.dial(a, b) == ConnectionResult::Success);
  REQUIRE(f.run_until([&] { return Connected(a, b); }));

  SECTION("Chat") {
    REQUIRE(a.orchestrator->send_text("bob", "hello there"));
    REQUIRE(f.run_until([&] { return !b.chat.texts.empty(); }));
    REQUIRE(b.chat.texts[0].first == "alice");
    REQUIRE(b.chat.texts[0].second == "hello there");
    REQUIRE_FALSE(a.orchestrator->send_text("nobody", "hi"));
  }

  SECTION("Chat disabled on the receiver") {
    FeatureSettings features;
    features.chat = false;
    b.orchestrator->set_features(features);
    REQUIRE(a.orchestrator->send_text("bob", "hello?"));
    REQUIRE(f.run_until([&] { return !a.chat.rejections.empty(); }));
    REQUIRE(a.chat.rejections[0] == protocol::reasons::FEATURE_DISABLED);
    REQUIRE(b.chat.texts.empty());
  }

  SECTION("File transfer") {
    auto path = f.root / "report.pdf";
    {
      std::ofstream out(path, std::ios::binary);
      out << std::string(3 * protocol::FILE_CHUNK_SIZE / 2, 'x');
    }
    std::vector<TransferRecord> received;
    auto sub = b.orchestrator->notifications().SubscribeTransferComplete(
        [&](const std::string &, const TransferRecord &r) { received.push_back(r); });

    REQUIRE(a.orchestrator->send_file("bob", path));
    REQUIRE(f.run_until([&] { return !received.empty(); }));
    REQUIRE(received[0].success);
    REQUIRE(received[0].file_name == "report.pdf");
    REQUIRE(std::filesystem::exists(f.root / "bob" / "report.pdf"));

    REQUIRE(f.run_until([&] {
      return a.state() == StateKind::Connected && b.state() == StateKind::Connected;
    }));
    REQUIRE(a.saw(StateKind::Transferring));
    REQUIRE(b.saw(StateKind::Transferring));
  }

  SECTION("File transfer disabled on the receiver") {
    auto path = f.root / "note.txt";
    {
      std::ofstream out(path);
      out << "note";
    }
    FeatureSettings features;
    features.file_transfer = false;
    b.orchestrator->set_features(features);

    REQUIRE(a.orchestrator->send_file("bob", path));
    auto transfer = a.orchestrator->registry().get("bob")->file_transfer();
    REQUIRE(f.run_until(
        [&] { return transfer->phase() == FileTransferSession::Phase::Rejected; }));
    REQUIRE(transfer->last_error() == "Peer has file transfer disabled");
    REQUIRE(a.state() == StateKind::Connected);

    // Locally disabled: nothing is offered
    a.orchestrator->set_features(features);
    REQUIRE_FALSE(a.orchestrator->send_file("bob", path));
  }

  SECTION("Voice call signaling") {
    REQUIRE(a.orchestrator->start_call("bob"));
    REQUIRE(f.run_until([&] { return !b.calls.requests.empty(); }));
    REQUIRE(b.orchestrator->answer_call("alice", true));
    REQUIRE(b.state() == StateKind::VoiceCall);
    REQUIRE(f.run_until([&] { return a.state() == StateKind::VoiceCall; }));
    REQUIRE(a.calls.accepted == std::vector<std::string>{"bob"});

    REQUIRE(a.orchestrator->end_call("bob"));
    REQUIRE(a.state() == StateKind::Connected);
    REQUIRE(f.run_until([&] { return b.state() == StateKind::Connected; }));
    REQUIRE(b.calls.ended == std::vector<std::string>{"alice"});
  }

  SECTION("Voice call disabled on the receiver") {
    FeatureSettings features;
    features.voice_call = false;
    b.orchestrator->set_features(features);
    REQUIRE(a.orchestrator->start_call("bob"));
    REQUIRE(f.run_until([&] { return !a.calls.rejections.empty(); }));
    REQUIRE(a.calls.rejections[0] == protocol::reasons::FEATURE_DISABLED);
    REQUIRE(b.calls.requests.empty());
  }
}

TEST_CASE("Orchestrator guards global state transitions", "[network][orchestrator]") {
  OrchestratorFixture f;
  Node &a = f.add_node("alice");
  REQUIRE(a.state() == StateKind::Discovering);

  REQUIRE_FALSE(a.orchestrator->transition_for_test(ConnectionState::Connected()));
  REQUIRE(a.state() == StateKind::Discovering);

  a.orchestrator->stop_discovery();
  REQUIRE(a.state() == StateKind::Idle);
  a.orchestrator->start_discovery();
  REQUIRE(a.state() == StateKind::Discovering);

  a.orchestrator->stop();
  REQUIRE(a.state() == StateKind::Idle);
  REQUIRE(a.orchestrator->request_connection("10.0.0.2", 1) == ConnectionResult::NotRunning);
}

namespace {

// A bare listener that answers the handshake by hand
struct ScriptedPeer {
  ScriptedPeer(test::LoopbackNetwork &network, const std::string &address)
      : transport(network, address) {
    transport.run();
    auto &io = network.io_context();
    REQUIRE(transport.listen(7000, [this, &io](TransportConnectionPtr conn) {
      connection = conn;
      session = TransportSession::accept(io, conn);
      session->set_handlers([this](const message::PeerMessage &m) { received.push_back(m.type()); },
                            [](message::DecodeError) {}, [](TransportError) {});
      session->start();
    }));
  }

  ~ScriptedPeer() {
    if (session) {
      session->close();
    }
    transport.stop();
  }

  bool got(message::MessageType type) const {
    return std::find(received.begin(), received.end(), type) != received.end();
  }

  test::LoopbackTransport transport;
  TransportConnectionPtr connection;
  TransportSessionPtr session;
  std::vector<message::MessageType> received;
};

// A length-prefixed frame whose body is not a message envelope
std::vector<uint8_t> GarbageFrame() {
  const std::string body = "not json";
  std::vector<uint8_t> frame{0, 0, 0, static_cast<uint8_t>(body.size())};
  frame.insert(frame.end(), body.begin(), body.end());
  return frame;
}

message::PeerMessage WithVersion(const message::PeerMessage &msg, uint32_t version) {
  std::optional<std::vector<uint8_t>> payload;
  if (msg.has_payload()) {
    payload = msg.payload();
  }
  return message::PeerMessage(msg.type(), msg.sender_id(), std::move(payload), version);
}

} // namespace

TEST_CASE("Orchestrator aborts malformed outgoing handshakes", "[network][orchestrator]") {
  OrchestratorFixture f;
  Node &a = f.add_node("alice");
  ScriptedPeer remote(f.network, "10.0.0.50");
  message::PeerIdentity remote_identity{"scripted", "Scripted", std::nullopt};

  REQUIRE(a.orchestrator->request_connection("10.0.0.50", 7000) == ConnectionResult::Success);
  REQUIRE(f.run_until(
      [&] { return remote.got(message::MessageType::ConnectionRequest); }));
  REQUIRE(remote.got(message::MessageType::Hello));

  SECTION("Accept from a different protocol version") {
    auto accept = WithVersion(message::make_connection_accept(remote_identity),
                              protocol::PROTOCOL_VERSION + 1);
    REQUIRE(remote.session->send(accept));
    REQUIRE(f.run_until([&] { return a.state() == StateKind::Failed; }));
    REQUIRE(a.orchestrator->state().reason() == "Protocol version mismatch");
  }

  SECTION("Undecodable frame") {
    REQUIRE(remote.connection->send(GarbageFrame()));
    REQUIRE(f.run_until([&] { return a.state() == StateKind::Failed; }));
    REQUIRE(a.orchestrator->state().reason() == "Handshake failed");
  }

  REQUIRE(a.orchestrator->registry().empty());
  REQUIRE_FALSE(a.orchestrator->has_outgoing_attempt());
  REQUIRE(f.run_until([&] { return remote.got(message::MessageType::ConnectionCancel); }));
  REQUIRE(a.orchestrator->circuit_breaker().FailureCount(ManualPeerId("10.0.0.50", 7000)) == 1);
}

TEST_CASE("Orchestrator aborts malformed inbound handshakes", "[network][orchestrator]") {
  OrchestratorFixture f;
  Node &a = f.add_node("alice");
  auto conn = std::make_shared<MockTransportConnection>();
  a.orchestrator->handle_inbound_session(TransportSession::accept(*f.io, conn));
  REQUIRE(conn->started());

  SECTION("Hello from a different protocol version") {
    auto hello = message::make_hello(message::PeerIdentity{"mallory", "Mallory", std::nullopt});
    conn->simulate_message(WithVersion(hello, protocol::PROTOCOL_VERSION + 1));
  }

  SECTION("Undecodable frame") {
    conn->simulate_receive(GarbageFrame());
  }

  SECTION("Request before hello") {
    conn->simulate_message(message::make_connection_request("mallory"));
  }

  REQUIRE_FALSE(conn->is_open());
  REQUIRE(a.consent.requests.empty());
  REQUIRE_FALSE(a.orchestrator->pending_request().has_value());
  REQUIRE(a.state() == StateKind::Discovering);
}

TEST_CASE("Orchestrator holds a single consent prompt", "[network][orchestrator]") {
  OrchestratorFixture f;
  ConnectionOrchestrator::SetRejectedRecoveryDelayForTest(1s);
  Node &a = f.add_node("alice");
  Node &b = f.add_node("bob");
  Node &c = f.add_node("carol");
  a.consent.mode = FakeConsent::Mode::Hold;

  REQUIRE(f.dial(b, a) == ConnectionResult::Success);
  REQUIRE(f.run_until([&] { return a.orchestrator->pending_request().has_value(); }));

  REQUIRE(f.dial(c, a) == ConnectionResult::Success);
  REQUIRE(f.run_until([&] { return c.state() == StateKind::Rejected; }));

  REQUIRE(a.consent.requests.size() == 1);
  REQUIRE(a.orchestrator->pending_request()->peer.id == "bob");
  REQUIRE(a.state() == StateKind::IncomingRequest);

  // The held prompt still completes
  auto decide = a.consent.held;
  decide(true);
  REQUIRE(f.run_until([&] { return Connected(a, b); }));
  REQUIRE_FALSE(a.orchestrator->registry().contains("carol"));
}

TEST_CASE("Orchestrator ignores timers of abandoned attempts", "[network][orchestrator]") {
  OrchestratorFixture f;
  Node &a = f.add_node("alice");
  Node &b = f.add_node("bob");

  SECTION("Requesting timeout") {
    ConnectionOrchestrator::SetRequestingTimeoutForTest(60ms);
    b.consent.mode = FakeConsent::Mode::Hold;
    REQUIRE(f.dial(a, b) == ConnectionResult::Success);
    REQUIRE(f.run_until([&] { return b.orchestrator->pending_request().has_value(); }));
    uint64_t generation = a.orchestrator->attempt_generation();

    a.orchestrator->cancel_request();
    REQUIRE(a.orchestrator->attempt_generation() > generation);
    REQUIRE(a.state() == StateKind::Discovering);
    REQUIRE(f.run_until([&] { return !b.orchestrator->pending_request().has_value(); }));

    // Past the first attempt's timeout
    f.run_for(150ms);
    REQUIRE(a.state() == StateKind::Discovering);
    REQUIRE_FALSE(a.saw(StateKind::Failed));

    // A fresh attempt is not cut short by the old timer
    b.consent.mode = FakeConsent::Mode::Accept;
    ConnectionOrchestrator::SetRequestingTimeoutForTest(5s);
    REQUIRE(f.dial(a, b) == ConnectionResult::Success);
    REQUIRE(f.run_until([&] { return Connected(a, b); }));
    f.run_for(100ms);
    REQUIRE(Connected(a, b));
  }

  SECTION("Readiness timeout") {
    TransportSession::SetReadyTimeoutForTest(30ms);
    a.transport->set_stall_connects(true);
    REQUIRE(f.dial(a, b) == ConnectionResult::Success);
    a.orchestrator->cancel_request();
    REQUIRE(a.state() == StateKind::Discovering);

    f.run_for(100ms);
    REQUIRE(a.state() == StateKind::Discovering);
    REQUIRE_FALSE(a.saw(StateKind::Failed));
    REQUIRE(a.orchestrator->circuit_breaker().FailureCount(
                ManualPeerId(b.transport->address(), b.orchestrator->listening_port())) == 0);
  }
}

TEST_CASE("Orchestrator redials peers lost to transport failure", "[network][orchestrator]") {
  OrchestratorFixture f;
  auto config = TestConfig();
  config.auto_reconnect = true;
  Node &a = f.add_node("alice", config);
  Node &b = f.add_node("bob");
  REQUIRE(f.dial(a, b) == ConnectionResult::Success);
  REQUIRE(f.run_until([&] { return Connected(a, b); }));
  const std::string target = ManualPeerId(b.transport->address(), b.orchestrator->listening_port());

  // bob's end goes away without a disconnect message
  auto drop_link = [&] {
    b.orchestrator->registry().get("alice")->session()->close();
    REQUIRE(b.orchestrator->disconnect("alice"));
  };

  SECTION("Reconnects after the backoff delay") {
    drop_link();
    REQUIRE(f.run_until([&] { return a.state() == StateKind::Failed; }));
    REQUIRE(a.orchestrator->registry().empty());

    REQUIRE(f.run_until([&] { return Connected(a, b); }));
    REQUIRE(a.transport->connect_attempts() == 2);
    REQUIRE(b.consent.requests.size() == 2);
  }

  SECTION("Open circuit stops the redial") {
    for (int i = 0; i < 3; ++i) {
      a.orchestrator->circuit_breaker().RecordFailure(target);
    }
    drop_link();
    REQUIRE(f.run_until([&] { return a.state() == StateKind::Failed; }));
    f.run_for(1500ms);
    REQUIRE(a.transport->connect_attempts() == 1);
    REQUIRE(a.orchestrator->registry().empty());
  }

  SECTION("A deliberate disconnect is not redialed") {
    REQUIRE(b.orchestrator->disconnect("alice"));
    REQUIRE(f.run_until([&] { return a.orchestrator->registry().empty(); }));
    f.run_for(1500ms);
    REQUIRE(a.transport->connect_attempts() == 1);
    REQUIRE(a.orchestrator->registry().empty());
  }
}
