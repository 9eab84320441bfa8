#include <catch2/catch_test_macros.hpp>

#include "infrastructure/network/ConnectScanner.hpp"

#include <asio.hpp>

#include <chrono>

using namespace reconpulse::infra;
using namespace std::chrono_literals;

TEST_CASE("ConnectScanner finds a local listener", "[ConnectScanner]") {
    asio::io_context io;
    asio::ip::tcp::acceptor acceptor(io, {asio::ip::make_address("127.0.0.1"), 0});
    const auto port = acceptor.local_endpoint().port();

    ConnectScanner scanner({port}, 1000ms);
    auto result = scanner.scan("127.0.0.1", 5s, "");

    REQUIRE(result.available);
    REQUIRE_FALSE(result.error.has_value());
    REQUIRE(result.services.size() == 1);
    REQUIRE(result.services[0].port == std::to_string(port) + "/tcp");
    REQUIRE(result.services[0].state == "open");
}

TEST_CASE("ConnectScanner cancellation", "[ConnectScanner]") {
    ConnectScanner scanner({22, 80});
    scanner.cancel();

    auto result = scanner.scan("127.0.0.1", 5s, "");

    REQUIRE(result.available);
    REQUIRE(result.error == "connect scan cancelled");
    REQUIRE(result.services.empty());
}
