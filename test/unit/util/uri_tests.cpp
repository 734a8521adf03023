// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>

#include "util/uri.hpp"

using namespace lanpeer::util;

TEST_CASE("Uri::Parse splits scheme, authority and rest", "[util][uri]") {
    SECTION("Plain tcp address") {
        auto uri = Uri::Parse("tcp://0.0.0.0:22000");
        REQUIRE(uri.has_value());
        REQUIRE(uri->scheme == "tcp");
        REQUIRE(uri->host == "0.0.0.0:22000");
        REQUIRE(uri->rest.empty());
        REQUIRE(uri->ToString() == "tcp://0.0.0.0:22000");
    }

    SECTION("Relay url with user info and query") {
        auto uri = Uri::Parse("relay://user@192.0.2.7:22067/?id=ABC&pingInterval=1m0s");
        REQUIRE(uri.has_value());
        REQUIRE(uri->scheme == "relay");
        REQUIRE(uri->userinfo == "user");
        REQUIRE(uri->host == "192.0.2.7:22067");
        REQUIRE(uri->rest == "/?id=ABC&pingInterval=1m0s");
        REQUIRE(uri->ToString() == "relay://user@192.0.2.7:22067/?id=ABC&pingInterval=1m0s");
    }

    SECTION("Bracketed IPv6 host") {
        auto uri = Uri::Parse("quic://[2001:db8::1]:22000");
        REQUIRE(uri.has_value());
        REQUIRE(uri->host == "[2001:db8::1]:22000");
    }

    SECTION("No authority gives an empty host") {
        auto uri = Uri::Parse("mailto:someone");
        REQUIRE(uri.has_value());
        REQUIRE(uri->host.empty());
        REQUIRE_FALSE(uri->has_authority);
    }
}

TEST_CASE("Uri::Parse rejects malformed input", "[util][uri]") {
    REQUIRE_FALSE(Uri::Parse("tcp://0.0.0.0:22000 ").has_value());
    REQUIRE_FALSE(Uri::Parse("tcp://0.0.0.0:\n22000").has_value());
    REQUIRE_FALSE(Uri::Parse("://0.0.0.0:22000").has_value());
    REQUIRE_FALSE(Uri::Parse("1tcp://0.0.0.0:22000").has_value());
    REQUIRE_FALSE(Uri::Parse("tcp://[2001:db8::1:22000").has_value());
}

TEST_CASE("Uri host can be replaced", "[util][uri]") {
    auto uri = Uri::Parse("tcp://0.0.0.0:22000/path");
    REQUIRE(uri.has_value());
    uri->host = "192.0.2.5:22000";
    REQUIRE(uri->ToString() == "tcp://192.0.2.5:22000/path");
}
