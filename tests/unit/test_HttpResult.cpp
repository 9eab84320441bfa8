#include <catch2/catch_test_macros.hpp>

#include "core/types/HttpResult.hpp"

using namespace reconpulse::core;

TEST_CASE("normalizeHeaders", "[HttpResult]") {
    auto normalized = normalizeHeaders(
        {{"Server", "nginx/1.24"}, {"X-Frame-Options", "SAMEORIGIN"}, {"content-type", "text/html"}});

    REQUIRE(normalized.size() == 3);
    REQUIRE(normalized.at("server") == "nginx/1.24");
    REQUIRE(normalized.at("x-frame-options") == "SAMEORIGIN");
    REQUIRE(normalized.at("content-type") == "text/html");
    REQUIRE(normalized.count("Server") == 0);
}

TEST_CASE("extractSecurityHeaders", "[HttpResult]") {
    auto headers = extractSecurityHeaders(normalizeHeaders(
        {{"Strict-Transport-Security", "max-age=63072000"}, {"Referrer-Policy", ""}}));

    REQUIRE(headers.size() == kSecurityHeaders.size());
    REQUIRE(headers.at("strict-transport-security") == "max-age=63072000");
    REQUIRE(headers.at("referrer-policy") == "");
    REQUIRE_FALSE(headers.at("content-security-policy").has_value());
    REQUIRE_FALSE(headers.at("permissions-policy").has_value());
}

TEST_CASE("HttpProbeOutcome::failed", "[HttpResult]") {
    auto outcome = HttpProbeOutcome::failed("https://example.com/", "HTTP probe disabled by configuration");

    REQUIRE(outcome.url == "https://example.com/");
    REQUIRE_FALSE(outcome.ok);
    REQUIRE_FALSE(outcome.statusCode.has_value());
    REQUIRE(outcome.error == "HTTP probe disabled by configuration");
    REQUIRE(outcome.securityHeaders.size() == 6);
    for (const auto& [name, value] : outcome.securityHeaders) {
        REQUIRE_FALSE(value.has_value());
    }
}

TEST_CASE("HttpResult scheme order", "[HttpResult]") {
    HttpResult result;
    auto schemes = result.schemes();

    REQUIRE(schemes[0].first == "http");
    REQUIRE(schemes[0].second == &result.http);
    REQUIRE(schemes[1].first == "https");
    REQUIRE(schemes[1].second == &result.https);
}
