#include <catch2/catch_test_macros.hpp>

#include "core/types/Target.hpp"

using namespace reconpulse::core;

TEST_CASE("Target IP literal classification", "[Target]") {
    SECTION("IPv4 literal") {
        Target target("192.168.1.10");
        REQUIRE(target.isIpLiteral());
        REQUIRE(target.host() == "192.168.1.10");
    }

    SECTION("IPv6 literal") {
        REQUIRE(Target("2001:db8::1").isIpLiteral());
        REQUIRE(Target("::1").isIpLiteral());
    }

    SECTION("Host names") {
        REQUIRE_FALSE(Target("example.com").isIpLiteral());
        REQUIRE_FALSE(Target("localhost").isIpLiteral());
    }

    SECTION("Malformed addresses are names") {
        REQUIRE_FALSE(Target::isIpAddress("256.1.1.1"));
        REQUIRE_FALSE(Target::isIpAddress("1.2.3"));
        REQUIRE_FALSE(Target::isIpAddress(""));
    }
}

TEST_CASE("Target URL host", "[Target]") {
    REQUIRE(Target("2001:db8::1").urlHost() == "[2001:db8::1]");
    REQUIRE(Target("::1").urlHost() == "[::1]");
    REQUIRE(Target("192.168.1.10").urlHost() == "192.168.1.10");
    REQUIRE(Target("example.com").urlHost() == "example.com");
}
