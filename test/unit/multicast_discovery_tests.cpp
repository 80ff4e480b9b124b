// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "network/multicast_discovery.hpp"
#include "util/time.hpp"

using namespace peerlink::network;
using peerlink::util::MockTimeScope;
using peerlink::util::SetMockTime;

TEST_CASE("Multicast announcement parsing", "[discovery][multicast]") {
    SECTION("Own format parses back") {
        auto datagram = MulticastDiscovery::make_announcement("peer-1", "Laptop", 9876);
        auto peer = MulticastDiscovery::parse_announcement(datagram, "192.168.1.20");
        REQUIRE(peer.has_value());
        CHECK(peer->id == "peer-1");
        CHECK(peer->display_name == "Laptop");
        CHECK(peer->host() == "192.168.1.20");
        CHECK(peer->port() == 9876);
        CHECK(peer->source == DiscoverySource::Service);
        REQUIRE(std::holds_alternative<ServiceEndpoint>(peer->endpoint));
        CHECK(std::get<ServiceEndpoint>(peer->endpoint).type == "_peerlink._tcp");
    }

    SECTION("Missing name falls back to the sender address") {
        auto peer = MulticastDiscovery::parse_announcement(
            R"({"proto":"peerlink","version":1,"id":"p","port":1234})", "10.1.1.1");
        REQUIRE(peer.has_value());
        CHECK(peer->display_name == "10.1.1.1");
    }

    SECTION("Garbage is ignored") {
        CHECK_FALSE(MulticastDiscovery::parse_announcement("hello", "10.1.1.1"));
        CHECK_FALSE(MulticastDiscovery::parse_announcement(
            R"({"proto":"other","id":"p","port":1234})", "10.1.1.1"));
        CHECK_FALSE(MulticastDiscovery::parse_announcement(
            R"({"proto":"peerlink","id":"","port":1234})", "10.1.1.1"));
        CHECK_FALSE(MulticastDiscovery::parse_announcement(
            R"({"proto":"peerlink","id":"p","port":0})", "10.1.1.1"));
        CHECK_FALSE(MulticastDiscovery::parse_announcement(
            R"({"proto":"peerlink","id":"p","port":70000})", "10.1.1.1"));
        CHECK_FALSE(MulticastDiscovery::parse_announcement(
            R"({"proto":"peerlink","id":"p","port":"9876"})", "10.1.1.1"));
    }
}

TEST_CASE("Multicast service table", "[discovery][multicast]") {
    MockTimeScope time(1'700'000'000);
    boost::asio::io_context io;
    MulticastDiscovery discovery(io, "me", "Me", 9876);

    std::vector<std::vector<DiscoveredPeer>> views;
    discovery.set_peers_handler(
        [&](const std::vector<DiscoveredPeer>& peers) { views.push_back(peers); });

    SECTION("Own announcements are dropped") {
        discovery.handle_announcement(MulticastDiscovery::make_announcement("me", "Me", 9876),
                                      "10.0.0.1");
        CHECK(views.empty());
    }

    SECTION("Repeated identical announcements publish once") {
        auto datagram = MulticastDiscovery::make_announcement("other", "Other", 9876);
        discovery.handle_announcement(datagram, "10.0.0.2");
        discovery.handle_announcement(datagram, "10.0.0.2");
        REQUIRE(views.size() == 1);
        CHECK(views[0].size() == 1);

        // Moving to another address is a change
        discovery.handle_announcement(datagram, "10.0.0.3");
        REQUIRE(views.size() == 2);
        CHECK(views[1][0].host() == "10.0.0.3");
    }

    SECTION("Services expire after the TTL") {
        discovery.handle_announcement(MulticastDiscovery::make_announcement("a", "A", 1000),
                                      "10.0.0.2");
        SetMockTime(1'700'000'000 + 15);
        discovery.handle_announcement(MulticastDiscovery::make_announcement("b", "B", 1000),
                                      "10.0.0.3");
        REQUIRE(views.size() == 2);

        SetMockTime(1'700'000'000 + 21);
        discovery.expire_services();
        REQUIRE(views.size() == 3);
        REQUIRE(views.back().size() == 1);
        CHECK(views.back()[0].id == "b");

        // Nothing changed, nothing published
        discovery.expire_services();
        CHECK(views.size() == 3);
    }
}
