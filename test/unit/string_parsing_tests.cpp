// Unit tests for string parsing utilities
#include <catch2/catch_test_macros.hpp>
#include "util/string_parsing.hpp"
#include <cstdint>
#include <vector>

using namespace netsession::util;

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
        REQUIRE(*SafeParseInt("0", 0, 65535) == 0);
        REQUIRE(*SafeParseInt("65535", 0, 65535) == 65535);
    }
}

TEST_CASE("SafeParseInt - invalid inputs", "[util][string_parsing]") {
    SECTION("Empty string") {
        REQUIRE_FALSE(SafeParseInt("", 0, 100).has_value());
    }

    SECTION("Non-numeric and mixed") {
        REQUIRE_FALSE(SafeParseInt("abc", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("42x", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("4x2", 0, 100).has_value());
    }

    SECTION("Out of bounds") {
        REQUIRE_FALSE(SafeParseInt("-1", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("101", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("999999999999999999999", 0, 100).has_value());
    }

    SECTION("Whitespace and floating point") {
        REQUIRE_FALSE(SafeParseInt(" 42", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("42.5", 0, 100).has_value());
    }
}

TEST_CASE("SafeParsePort", "[util][string_parsing]") {
    SECTION("Valid ports") {
        REQUIRE(*SafeParsePort("1") == 1);
        REQUIRE(*SafeParsePort("502") == 502);
        REQUIRE(*SafeParsePort("65535") == 65535);
    }

    SECTION("Invalid ports") {
        REQUIRE_FALSE(SafeParsePort("0").has_value());
        REQUIRE_FALSE(SafeParsePort("-1").has_value());
        REQUIRE_FALSE(SafeParsePort("65536").has_value());
        REQUIRE_FALSE(SafeParsePort("").has_value());
        REQUIRE_FALSE(SafeParsePort("8080x").has_value());
    }
}

TEST_CASE("Trim, ToLower, EqualsIgnoreCase", "[util][string_parsing]") {
    SECTION("Trim") {
        REQUIRE(Trim("  udp://host  ") == "udp://host");
        REQUIRE(Trim("\t\n") == "");
        REQUIRE(Trim("") == "");
        REQUIRE(Trim("x") == "x");
    }

    SECTION("ToLower") {
        REQUIRE(ToLower("UDP") == "udp");
        REQUIRE(ToLower("WsS") == "wss");
    }

    SECTION("EqualsIgnoreCase") {
        REQUIRE(EqualsIgnoreCase("HTTP", "http"));
        REQUIRE_FALSE(EqualsIgnoreCase("http", "https"));
        REQUIRE_FALSE(EqualsIgnoreCase("tcp", "udp"));
    }
}

TEST_CASE("HexEncode", "[util][string_parsing]") {
    std::vector<uint8_t> data = {0x00, 0x01, 0xab, 0xff};

    SECTION("Whole buffer") {
        REQUIRE(HexEncode(data.data(), data.size()) == "0001abff");
    }

    SECTION("Truncated buffer is marked") {
        REQUIRE(HexEncode(data.data(), data.size(), 2) == "0001...");
    }

    SECTION("Limit larger than buffer") {
        REQUIRE(HexEncode(data.data(), data.size(), 16) == "0001abff");
    }

    SECTION("Empty buffer") {
        REQUIRE(HexEncode(data.data(), 0) == "");
    }
}
