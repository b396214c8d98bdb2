// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for string parsing utilities

#include <catch2/catch_test_macros.hpp>
#include "util/string_parsing.hpp"
#include <limits>

using namespace tyr::util;

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
    REQUIRE_FALSE(SafeParseInt("x42", 0, 100).has_value());
    REQUIRE_FALSE(SafeParseInt(" 42", 0, 100).has_value());
    REQUIRE_FALSE(SafeParseInt("+42", 0, 100).has_value());
    REQUIRE_FALSE(SafeParseInt("-1", 0, 100).has_value());
    REQUIRE_FALSE(SafeParseInt("101", 0, 100).has_value());
    REQUIRE_FALSE(SafeParseInt("99999999999999999999", 0, std::numeric_limits<int>::max()).has_value());
}

TEST_CASE("SafeParsePort", "[util][string_parsing]") {
    REQUIRE(SafeParsePort("1") == 1);
    REQUIRE(SafeParsePort("7743") == 7743);
    REQUIRE(SafeParsePort("65535") == 65535);
    REQUIRE_FALSE(SafeParsePort("0").has_value());
    REQUIRE_FALSE(SafeParsePort("65536").has_value());
    REQUIRE_FALSE(SafeParsePort("-1").has_value());
    REQUIRE_FALSE(SafeParsePort("80a").has_value());
}

TEST_CASE("SafeParseInt64", "[util][string_parsing]") {
    REQUIRE(SafeParseInt64("5000", 0, 60000) == 5000);
    REQUIRE(SafeParseInt64("9223372036854775807", 0, std::numeric_limits<int64_t>::max()) ==
            std::numeric_limits<int64_t>::max());
    REQUIRE_FALSE(SafeParseInt64("60001", 0, 60000).has_value());
    REQUIRE_FALSE(SafeParseInt64("9223372036854775808", 0, std::numeric_limits<int64_t>::max()).has_value());
}

TEST_CASE("Trim, ToLower and SplitList", "[util][string_parsing]") {
    SECTION("Trim") {
        REQUIRE(Trim("  tcp://a:1 \t\n") == "tcp://a:1");
        REQUIRE(Trim("") == "");
        REQUIRE(Trim("   ") == "");
        REQUIRE(Trim("x") == "x");
    }

    SECTION("ToLower") {
        REQUIRE(ToLower("Europe-West") == "europe-west");
        REQUIRE(ToLower("TLS") == "tls");
    }

    SECTION("SplitList trims and drops empty items") {
        REQUIRE(SplitList("tcp, tls,,quic") == std::vector<std::string>{"tcp", "tls", "quic"});
        REQUIRE(SplitList("").empty());
        REQUIRE(SplitList(" , ,").empty());
        REQUIRE(SplitList("a;b", ';') == std::vector<std::string>{"a", "b"});
    }
}

TEST_CASE("HexStr", "[util][string_parsing]") {
    REQUIRE(HexStr({}) == "");
    REQUIRE(HexStr({0x00, 0x0f, 0xa0, 0xff}) == "000fa0ff");
}
