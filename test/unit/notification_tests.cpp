// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "network/notifications.hpp"

using namespace peerlink::network;

TEST_CASE("ConnectionNotifications: RAII subscription cleanup", "[network][notifications]") {
  ConnectionNotifications notifications;
  bool called = false;

  {
    auto sub = notifications.SubscribeDisconnected([&](const std::string &) { called = true; });
    notifications.NotifyDisconnected("peer-1");
    REQUIRE(called);
    REQUIRE(notifications.SubscriberCount() == 1);
  }

  called = false;
  notifications.NotifyDisconnected("peer-2");
  REQUIRE_FALSE(called);
  REQUIRE(notifications.SubscriberCount() == 0);
}

TEST_CASE("ConnectionNotifications: Multiple subscribers and manual unsubscribe",
          "[network][notifications]") {
  ConnectionNotifications notifications;
  int count = 0;

  auto sub1 = notifications.SubscribeStateChange([&](const ConnectionState &) { count++; });
  auto sub2 = notifications.SubscribeStateChange([&](const ConnectionState &) { count++; });

  notifications.NotifyStateChange(ConnectionState::Discovering());
  REQUIRE(count == 2);

  sub1.Unsubscribe();
  sub1.Unsubscribe(); // idempotent
  notifications.NotifyStateChange(ConnectionState::Connected());
  REQUIRE(count == 3);
}

TEST_CASE("ConnectionNotifications: Moved subscription stays active", "[network][notifications]") {
  ConnectionNotifications notifications;
  double last = -1;

  ConnectionNotifications::Subscription outer;
  {
    auto inner = notifications.SubscribeTransferProgress(
        [&](const std::string &, double progress) { last = progress; });
    outer = std::move(inner);
  }

  notifications.NotifyTransferProgress("peer", 0.5);
  REQUIRE(last == 0.5);
}

TEST_CASE("ConnectionNotifications: Observer receives every event kind",
          "[network][notifications]") {
  struct Recorder : ConnectionObserver {
    std::vector<std::string> events;
    void on_state_change(const ConnectionState &s) override { events.push_back("state:" + s.ToString()); }
    void on_peer_connection_change(const std::string &id, const PeerConnectionState &s) override {
      events.push_back("peer:" + id + ":" + s.ToString());
    }
    void on_message_received(const peerlink::message::PeerMessage &m, const std::string &id) override {
      events.push_back(std::string("msg:") + peerlink::message::MessageTypeName(m.type()) + ":" + id);
    }
    void on_transfer_complete(const std::string &id, const TransferRecord &r) override {
      events.push_back("done:" + id + ":" + r.file_name);
    }
    void on_disconnected(const std::string &id) override { events.push_back("gone:" + id); }
    void on_peers_changed(const std::vector<DiscoveredPeer> &peers) override {
      events.push_back("peers:" + std::to_string(peers.size()));
    }
  };

  ConnectionNotifications notifications;
  Recorder recorder;
  auto sub = notifications.Subscribe(recorder);

  notifications.NotifyStateChange(ConnectionState::Failed("Connection timed out"));
  notifications.NotifyPeerConnectionChange("p", PeerConnectionState::Connected());
  notifications.NotifyMessageReceived(peerlink::message::make_ping("p"), "p");
  TransferRecord record;
  record.file_name = "a.txt";
  notifications.NotifyTransferComplete("p", record);
  notifications.NotifyDisconnected("p");
  notifications.NotifyPeersChanged({});

  const std::vector<std::string> expected = {"state:Failed(Connection timed out)",
                                             "peer:p:connected", "msg:ping:p", "done:p:a.txt",
                                             "gone:p", "peers:0"};
  REQUIRE(recorder.events == expected);
}

TEST_CASE("ConnectionNotifications: Callback may unsubscribe itself", "[network][notifications]") {
  ConnectionNotifications notifications;
  int calls = 0;
  ConnectionNotifications::Subscription sub;
  sub = notifications.SubscribeDisconnected([&](const std::string &) {
    calls++;
    sub.Unsubscribe();
  });

  notifications.NotifyDisconnected("a");
  notifications.NotifyDisconnected("b");
  REQUIRE(calls == 1);
}
