// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>

#include "network/address_normalizer.hpp"

using namespace lanpeer::network;

namespace {

asio::ip::udp::endpoint Source(const std::string& ip, uint16_t port = 21027) {
    return asio::ip::udp::endpoint(asio::ip::make_address(ip), port);
}

}  // namespace

TEST_CASE("NormalizeAddresses: unspecified host takes the source ip", "[network][address_normalizer]") {
    auto src = Source("192.0.2.5");

    SECTION("0.0.0.0") {
        REQUIRE(NormalizeAddresses({"tcp://0.0.0.0:22000"}, src) == std::vector<std::string>{"tcp://192.0.2.5:22000"});
    }

    SECTION("Empty host") {
        REQUIRE(NormalizeAddresses({"tcp://:22000"}, src) == std::vector<std::string>{"tcp://192.0.2.5:22000"});
    }

    SECTION("IPv6 unspecified") {
        REQUIRE(NormalizeAddresses({"quic://[::]:22001"}, src) == std::vector<std::string>{"quic://192.0.2.5:22001"});
    }

    SECTION("Path and query survive the rewrite") {
        REQUIRE(NormalizeAddresses({"tcp://0.0.0.0:22000/x?y=1"}, src) ==
                std::vector<std::string>{"tcp://192.0.2.5:22000/x?y=1"});
    }

    SECTION("IPv6 source is bracketed") {
        REQUIRE(NormalizeAddresses({"tcp://0.0.0.0:22000"}, Source("fe80::1")) ==
                std::vector<std::string>{"tcp://[fe80::1]:22000"});
    }

    SECTION("Zone of a link-local source is percent-encoded") {
        auto scoped = asio::ip::make_address_v6("fe80::1");
        scoped.scope_id(4000);
        asio::ip::udp::endpoint source(scoped, 21027);

        auto result = NormalizeAddresses({"tcp://0.0.0.0:22000"}, source);
        REQUIRE(result.size() == 1);
        const std::string& uri = result[0];
        REQUIRE(uri.starts_with("tcp://[fe80::1%25"));
        REQUIRE(uri.ends_with("]:22000"));
        // Every '%' starts the "%25" escape
        for (size_t pos = uri.find('%'); pos != std::string::npos; pos = uri.find('%', pos + 1)) {
            REQUIRE(uri.compare(pos, 3, "%25") == 0);
        }
    }

    SECTION("IPv4-mapped source is unwrapped") {
        REQUIRE(NormalizeAddresses({"tcp://0.0.0.0:22000"}, Source("::ffff:192.0.2.5")) ==
                std::vector<std::string>{"tcp://192.0.2.5:22000"});
    }
}

TEST_CASE("NormalizeAddresses: specific hosts are kept verbatim", "[network][address_normalizer]") {
    auto src = Source("192.0.2.5");
    std::vector<std::string> in{"tcp://198.51.100.7:22000", "tcp://[2001:db8::7]:22000"};
    REQUIRE(NormalizeAddresses(in, src) == in);
}

TEST_CASE("NormalizeAddresses: invalid entries are dropped, order kept", "[network][address_normalizer]") {
    auto src = Source("192.0.2.5");
    std::vector<std::string> in{
        "tcp://198.51.100.7:22000",
        "tcp://0.0.0.0:22000 ",     // space
        "tcp://198.51.100.8",       // no port
        "tcp://198.51.100.9:port",  // non-numeric port
        "tcp://[2001:db8::1:22000", // unclosed bracket
        "tcp://0.0.0.0:22001",
    };
    REQUIRE(NormalizeAddresses(in, src) ==
            std::vector<std::string>{"tcp://198.51.100.7:22000", "tcp://192.0.2.5:22001"});
    REQUIRE(NormalizeAddresses({}, src).empty());
}

TEST_CASE("CanonicalizeAddress", "[network][address_normalizer]") {
    TcpAddress addr;
    addr.port = 22000;
    REQUIRE(CanonicalizeAddress(addr) == ":22000");

    addr.ip = asio::ip::make_address("0.0.0.0");
    REQUIRE(CanonicalizeAddress(addr) == ":22000");

    addr.ip = asio::ip::make_address("192.0.2.5");
    REQUIRE(CanonicalizeAddress(addr) == "192.0.2.5:22000");

    addr.ip = asio::ip::make_address("::ffff:192.0.2.5");
    REQUIRE(CanonicalizeAddress(addr) == "192.0.2.5:22000");

    addr.ip = asio::ip::make_address("2001:db8::5");
    REQUIRE(CanonicalizeAddress(addr) == "[2001:db8::5]:22000");
}

TEST_CASE("ResolveTcpAddress", "[network][address_normalizer]") {
    auto addr = ResolveTcpAddress("192.0.2.5:22000");
    REQUIRE(addr.has_value());
    REQUIRE(addr->ip == asio::ip::make_address("192.0.2.5"));
    REQUIRE(addr->port == 22000);

    auto empty = ResolveTcpAddress(":22000");
    REQUIRE(empty.has_value());
    REQUIRE(empty->IsUnspecified());

    REQUIRE_FALSE(ResolveTcpAddress("192.0.2.5").has_value());
    REQUIRE_FALSE(ResolveTcpAddress("192.0.2.5:99999").has_value());
}

TEST_CASE("ResolveAddresses canonicalizes own listen addresses", "[network][address_normalizer]") {
    std::vector<std::string> in{"tcp://0.0.0.0:22000", "tcp://[::ffff:192.0.2.5]:22000", "tcp://bad", "tcp://[2001:db8::1]:22000"};
    REQUIRE(ResolveAddresses(in) ==
            std::vector<std::string>{"tcp://:22000", "tcp://192.0.2.5:22000", "tcp://[2001:db8::1]:22000"});
}
