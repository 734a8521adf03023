// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>

#include "util/string_parsing.hpp"

using namespace lanpeer::util;

TEST_CASE("SafeParseInt64", "[util][string_parsing]") {
    REQUIRE(SafeParseInt64("42", 0, 100) == 42);
    REQUIRE(SafeParseInt64("-5", -10, 10) == -5);
    REQUIRE_FALSE(SafeParseInt64("", 0, 100).has_value());
    REQUIRE_FALSE(SafeParseInt64("101", 0, 100).has_value());
    REQUIRE_FALSE(SafeParseInt64("+1", 0, 100).has_value());
    REQUIRE_FALSE(SafeParseInt64(" 1", 0, 100).has_value());
    REQUIRE_FALSE(SafeParseInt64("1x", 0, 100).has_value());
    REQUIRE_FALSE(SafeParseInt64("99999999999999999999", 0, INT64_MAX).has_value());
}

TEST_CASE("SafeParsePort", "[util][string_parsing]") {
    REQUIRE(SafeParsePort("0") == 0);
    REQUIRE(SafeParsePort("21027") == 21027);
    REQUIRE(SafeParsePort("65535") == 65535);
    REQUIRE_FALSE(SafeParsePort("65536").has_value());
    REQUIRE_FALSE(SafeParsePort("-1").has_value());
    REQUIRE_FALSE(SafeParsePort("http").has_value());
}
