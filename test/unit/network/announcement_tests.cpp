// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license
// Wire format and decode robustness of discovery announcements

#include <catch2/catch_test_macros.hpp>

#include "network/announcement.hpp"
#include "network/xdr.hpp"

using namespace lanpeer;
using namespace lanpeer::protocol;

namespace {

Announce MakeAnnounce() {
    Announce pkt;
    pkt.this_device.id = std::vector<uint8_t>(32, 0xAB);
    pkt.this_device.addresses = {"tcp://0.0.0.0:22000"};
    return pkt;
}

}  // namespace

TEST_CASE("Announce: wire layout", "[network][announcement]") {
    auto bytes = MakeAnnounce().MarshalXDR();

    // magic(4) + id(4+32) + addr count(4) + addr(4+19+1 pad) + relay count(4)
    REQUIRE(bytes.size() == 72);
    REQUIRE(bytes[0] == 0x9D);
    REQUIRE(bytes[1] == 0x79);
    REQUIRE(bytes[2] == 0xBC);
    REQUIRE(bytes[3] == 0x40);
    REQUIRE(bytes[7] == 32);   // id length
    REQUIRE(bytes[43] == 1);   // address count
    REQUIRE(bytes[47] == 19);  // address length
    REQUIRE(bytes[67] == 0);   // padding
    REQUIRE(bytes[71] == 0);   // relay count
}

TEST_CASE("Announce: decode preserves order and relays", "[network][announcement]") {
    Announce pkt = MakeAnnounce();
    pkt.this_device.addresses = {"tcp://192.0.2.1:22000", "quic://0.0.0.0:22000", "tcp://192.0.2.1:22000"};
    pkt.this_device.relays = {{"relay://192.0.2.9:22067/?id=X", 42}, {"relay://192.0.2.10:22067", -1}};

    Announce decoded;
    REQUIRE(decoded.UnmarshalXDR(pkt.MarshalXDR()) == DecodeError::OK);
    REQUIRE(decoded.magic == ANNOUNCEMENT_MAGIC);
    REQUIRE(decoded.this_device.id == pkt.this_device.id);
    REQUIRE(decoded.this_device.addresses == pkt.this_device.addresses);
    REQUIRE(decoded.this_device.relays == pkt.this_device.relays);
}

TEST_CASE("Announce: decode errors", "[network][announcement]") {
    auto good = MakeAnnounce().MarshalXDR();
    Announce out;
    out.this_device.addresses = {"untouched"};

    SECTION("Empty input") {
        REQUIRE(out.UnmarshalXDR(nullptr, 0) == DecodeError::Truncated);
    }

    SECTION("Incorrect magic") {
        auto bad = good;
        bad[0] = 0x2E;
        bad[1] = 0xA7;
        bad[2] = 0xD9;
        bad[3] = 0x0B;
        REQUIRE(out.UnmarshalXDR(bad) == DecodeError::IncorrectMagic);
    }

    SECTION("Every truncation fails cleanly") {
        for (size_t len = 0; len < good.size(); ++len) {
            std::vector<uint8_t> cut(good.begin(), good.begin() + static_cast<std::ptrdiff_t>(len));
            REQUIRE(out.UnmarshalXDR(cut) == DecodeError::Truncated);
        }
    }

    SECTION("Too many addresses") {
        Announce pkt = MakeAnnounce();
        pkt.this_device.addresses.assign(MAX_ADDRESSES + 1, "tcp://192.0.2.1:22000");
        REQUIRE(out.UnmarshalXDR(pkt.MarshalXDR()) == DecodeError::LimitExceeded);
    }

    SECTION("Too many relays") {
        Announce pkt = MakeAnnounce();
        pkt.this_device.relays.assign(MAX_RELAYS + 1, Relay{"relay://192.0.2.9:22067", 1});
        REQUIRE(out.UnmarshalXDR(pkt.MarshalXDR()) == DecodeError::LimitExceeded);
    }

    SECTION("Address longer than a URL may be") {
        Announce pkt = MakeAnnounce();
        pkt.this_device.addresses = {std::string(MAX_URL_LENGTH + 1, 'a')};
        REQUIRE(out.UnmarshalXDR(pkt.MarshalXDR()) == DecodeError::LimitExceeded);
    }

    SECTION("Device id longer than 32 bytes") {
        Announce pkt = MakeAnnounce();
        pkt.this_device.id.assign(33, 1);
        REQUIRE(out.UnmarshalXDR(pkt.MarshalXDR()) == DecodeError::LimitExceeded);
    }

    SECTION("Device id shorter than 32 bytes") {
        Announce pkt = MakeAnnounce();
        pkt.this_device.id.assign(20, 1);
        REQUIRE(out.UnmarshalXDR(pkt.MarshalXDR()) == DecodeError::InvalidDeviceID);
    }

    SECTION("Count larger than the remaining payload") {
        xdr::XdrWriter w;
        w.write_uint32(ANNOUNCEMENT_MAGIC);
        w.write_opaque(std::vector<uint8_t>(32, 1));
        w.write_uint32(3);
        w.write_string("tcp://192.0.2.1:22000");
        REQUIRE(out.UnmarshalXDR(w.data()) == DecodeError::Truncated);
    }

    // Failed decodes leave no partial state behind
    REQUIRE(out.this_device.addresses == std::vector<std::string>{"untouched"});
    REQUIRE(out.this_device.id.empty());
}

TEST_CASE("Announce: random bytes never decode as valid", "[network][announcement]") {
    std::vector<uint8_t> junk(512);
    for (size_t i = 0; i < junk.size(); ++i) {
        junk[i] = static_cast<uint8_t>((i * 131 + 17) & 0xff);
    }
    Announce out;
    REQUIRE(out.UnmarshalXDR(junk) == DecodeError::IncorrectMagic);
    REQUIRE(std::string(DecodeErrorString(DecodeError::IncorrectMagic)) == "incorrect magic number");
}
