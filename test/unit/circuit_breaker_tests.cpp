// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "network/circuit_breaker.hpp"
#include "util/time.hpp"

using namespace peerlink::network;
using peerlink::util::MockTimeScope;
using peerlink::util::SetMockTime;

TEST_CASE("CircuitBreaker opens after consecutive failures", "[breaker]") {
    MockTimeScope time(1'000'000);
    CircuitBreaker breaker;

    CHECK(breaker.ShouldAttemptConnection("peer"));
    breaker.RecordFailure("peer");
    breaker.RecordFailure("peer");
    CHECK(breaker.ShouldAttemptConnection("peer"));
    CHECK(breaker.FailureCount("peer") == 2);

    breaker.RecordFailure("peer");
    CHECK(breaker.IsOpen("peer"));
    CHECK_FALSE(breaker.ShouldAttemptConnection("peer"));

    // Other peers are unaffected
    CHECK(breaker.ShouldAttemptConnection("other"));
}

TEST_CASE("CircuitBreaker closes after cooldown", "[breaker]") {
    MockTimeScope time(1'000'000);
    CircuitBreaker breaker;
    for (int i = 0; i < 3; ++i) breaker.RecordFailure("peer");

    SetMockTime(1'000'000 + 299);
    CHECK_FALSE(breaker.ShouldAttemptConnection("peer"));

    SetMockTime(1'000'000 + 300);
    CHECK(breaker.ShouldAttemptConnection("peer"));
    CHECK(breaker.FailureCount("peer") == 0);

    // A single failure after the cooldown does not reopen it
    breaker.RecordFailure("peer");
    CHECK(breaker.ShouldAttemptConnection("peer"));
}

TEST_CASE("CircuitBreaker success resets the count", "[breaker]") {
    MockTimeScope time(1'000'000);
    CircuitBreaker breaker(2, std::chrono::seconds(10));

    breaker.RecordFailure("peer");
    breaker.RecordSuccess("peer");
    breaker.RecordFailure("peer");
    CHECK(breaker.ShouldAttemptConnection("peer"));
    CHECK(breaker.TrackedPeerCount() == 1);

    breaker.Clear();
    CHECK(breaker.TrackedPeerCount() == 0);
}
