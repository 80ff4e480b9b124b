// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license
// Unit tests for string parsing utilities

#include <catch2/catch_test_macros.hpp>
#include "util/string_parsing.hpp"

using namespace peerlink::util;

TEST_CASE("SafeParseInt - valid inputs", "[util][string_parsing]") {
    SECTION("Parse valid positive integer") {
        auto result = SafeParseInt("42", 0, 100);
        REQUIRE(result.has_value());
        REQUIRE(*result == 42);
    }

    SECTION("Parse valid negative integer") {
        auto result = SafeParseInt("-50", -100, 100);
        REQUIRE(result.has_value());
        REQUIRE(*result == -50);
    }

    SECTION("Parse at bounds") {
        REQUIRE(SafeParseInt("0", 0, 100) == 0);
        REQUIRE(SafeParseInt("100", 0, 100) == 100);
    }
}

TEST_CASE("SafeParseInt - invalid inputs", "[util][string_parsing]") {
    REQUIRE_FALSE(SafeParseInt("", 0, 100).has_value());
    REQUIRE_FALSE(SafeParseInt("abc", 0, 100).has_value());
    REQUIRE_FALSE(SafeParseInt("42x", 0, 100).has_value());
    REQUIRE_FALSE(SafeParseInt(" 42", 0, 100).has_value());
    REQUIRE_FALSE(SafeParseInt("101", 0, 100).has_value());
    REQUIRE_FALSE(SafeParseInt("-1", 0, 100).has_value());
    REQUIRE_FALSE(SafeParseInt("99999999999999999999999", 0, 100).has_value());
}

TEST_CASE("SafeParsePort", "[util][string_parsing]") {
    REQUIRE(SafeParsePort("9876") == 9876);
    REQUIRE(SafeParsePort("1") == 1);
    REQUIRE(SafeParsePort("65535") == 65535);
    REQUIRE_FALSE(SafeParsePort("0").has_value());
    REQUIRE_FALSE(SafeParsePort("65536").has_value());
    REQUIRE_FALSE(SafeParsePort("-1").has_value());
    REQUIRE_FALSE(SafeParsePort("port").has_value());
}

TEST_CASE("IsValidHex", "[util][string_parsing]") {
    REQUIRE(IsValidHex("deadBEEF0123"));
    REQUIRE_FALSE(IsValidHex(""));
    REQUIRE_FALSE(IsValidHex("0xff"));
    REQUIRE_FALSE(IsValidHex("ghij"));
}

TEST_CASE("ParseHostPort", "[util][string_parsing]") {
    SECTION("IPv4 and hostnames") {
        auto v4 = ParseHostPort("192.168.1.5:9876");
        REQUIRE(v4.has_value());
        CHECK(v4->first == "192.168.1.5");
        CHECK(v4->second == 9876);

        auto name = ParseHostPort("laptop.local:1234");
        REQUIRE(name.has_value());
        CHECK(name->first == "laptop.local");
        CHECK(name->second == 1234);
    }

    SECTION("Bracketed IPv6") {
        auto v6 = ParseHostPort("[fe80::1]:9876");
        REQUIRE(v6.has_value());
        CHECK(v6->first == "fe80::1");
        CHECK(v6->second == 9876);
    }

    SECTION("Rejected forms") {
        CHECK_FALSE(ParseHostPort("host").has_value());
        CHECK_FALSE(ParseHostPort(":9876").has_value());
        CHECK_FALSE(ParseHostPort("host:").has_value());
        CHECK_FALSE(ParseHostPort("host:0").has_value());
        CHECK_FALSE(ParseHostPort("host:70000").has_value());
        CHECK_FALSE(ParseHostPort("fe80::1:9876").has_value());
        CHECK_FALSE(ParseHostPort("[fe80::1]9876").has_value());
        CHECK_FALSE(ParseHostPort("[]:9876").has_value());
    }
}
