// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>

#include "discovery/reachability_cache.hpp"
#include "util/time.hpp"

using namespace lanpeer;
using namespace lanpeer::discovery;

namespace {

protocol::DeviceID MakeID(uint8_t b) {
    std::array<uint8_t, protocol::DeviceID::SIZE> bytes;
    bytes.fill(b);
    return protocol::DeviceID(bytes);
}

CacheEntry Entry(std::vector<std::string> direct) {
    CacheEntry e;
    e.direct = std::move(direct);
    e.when = util::GetSteadyTime();
    e.found = true;
    return e;
}

}  // namespace

TEST_CASE("ReachabilityCache: get and set", "[discovery][cache]") {
    ReachabilityCache cache(std::chrono::seconds(90));

    REQUIRE_FALSE(cache.Get(MakeID(1)).has_value());

    cache.Set(MakeID(1), Entry({"tcp://192.0.2.1:22000"}));
    auto got = cache.Get(MakeID(1));
    REQUIRE(got.has_value());
    REQUIRE(got->direct == std::vector<std::string>{"tcp://192.0.2.1:22000"});
    REQUIRE(got->found);

    SECTION("Last writer wins") {
        cache.Set(MakeID(1), Entry({"tcp://192.0.2.2:22000"}));
        REQUIRE(cache.Get(MakeID(1))->direct == std::vector<std::string>{"tcp://192.0.2.2:22000"});
        REQUIRE(cache.Size() == 1);
    }

    SECTION("Entries are independent per device") {
        cache.Set(MakeID(2), Entry({}));
        REQUIRE(cache.Size() == 2);
        REQUIRE(cache.Snapshot().size() == 2);
    }
}

TEST_CASE("ReachabilityCache: freshness boundary", "[discovery][cache]") {
    util::MockTimeScope mock_time(1700000000);
    ReachabilityCache cache(std::chrono::seconds(90));

    cache.Set(MakeID(1), Entry({"tcp://192.0.2.1:22000"}));
    auto entry = *cache.Get(MakeID(1));

    REQUIRE_FALSE(cache.IsStale(entry));

    util::SetMockTime(1700000000 + 89);
    REQUIRE_FALSE(cache.IsStale(entry));

    util::SetMockTime(1700000000 + 90);
    REQUIRE(cache.IsStale(entry));

    util::SetMockTime(1700000000 + 1000);
    REQUIRE(cache.IsStale(entry));

    // Stale entries are still returned; freshness is the caller's decision
    REQUIRE(cache.Get(MakeID(1)).has_value());
}

TEST_CASE("ReachabilityCache: sweep removes only long-expired entries", "[discovery][cache]") {
    util::MockTimeScope mock_time(1700000000);
    ReachabilityCache cache(std::chrono::seconds(90));

    cache.Set(MakeID(1), Entry({}));
    util::SetMockTime(1700000000 + 100);
    cache.Set(MakeID(2), Entry({}));

    util::SetMockTime(1700000000 + 179);
    REQUIRE(cache.Sweep(std::chrono::seconds(180)) == 0);

    util::SetMockTime(1700000000 + 180);
    REQUIRE(cache.Sweep(std::chrono::seconds(180)) == 1);
    REQUIRE_FALSE(cache.Get(MakeID(1)).has_value());
    REQUIRE(cache.Get(MakeID(2)).has_value());
}
