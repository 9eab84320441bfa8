#include <catch2/catch_test_macros.hpp>

#include "core/types/PortScanResult.hpp"

#include <algorithm>

using namespace reconpulse::core;

TEST_CASE("PortScanResult default values", "[PortScanResult]") {
    PortScanResult result;

    REQUIRE_FALSE(result.available);
    REQUIRE_FALSE(result.skipped);
    REQUIRE_FALSE(result.error.has_value());
    REQUIRE_FALSE(result.command.has_value());
    REQUIRE(result.services.empty());
    REQUIRE(result.stdoutText.empty());
}

TEST_CASE("PortScanResult parseServiceLines", "[PortScanResult]") {
    SECTION("Only open tcp lines are kept") {
        auto services = PortScanResult::parseServiceLines(
            "22/tcp open ssh OpenSSH 8.9p1 Ubuntu\n80/tcp open http nginx 1.24\n"
            "443/tcp closed https");

        REQUIRE(services.size() == 2);
        REQUIRE(services[0].port == "22/tcp");
        REQUIRE(services[0].state == "open");
        REQUIRE(services[0].service == "ssh");
        REQUIRE(services[0].version == "OpenSSH 8.9p1 Ubuntu");
        REQUIRE(services[1].port == "80/tcp");
        REQUIRE(services[1].service == "http");
        REQUIRE(services[1].version == "nginx 1.24");
    }

    SECTION("Typical nmap output") {
        const std::string output =
            "Starting Nmap 7.94 ( https://nmap.org )\n"
            "Nmap scan report for example.com (93.184.216.34)\n"
            "PORT     STATE    SERVICE  VERSION\n"
            "25/tcp   filtered smtp\n"
            "80/tcp   open     http     ECAcc (nyb/1D2E)\n"
            "443/tcp  open     ssl/http ECAcc (nyb/1D13)\n"
            "53/udp   open     domain\n"
            "\n"
            "Nmap done: 1 IP address (1 host up) scanned in 12.34 seconds\n";

        auto services = PortScanResult::parseServiceLines(output);
        REQUIRE(services.size() == 2);
        REQUIRE(services[0].port == "80/tcp");
        REQUIRE(services[1].port == "443/tcp");
        REQUIRE(services[1].service == "ssl/http");
        REQUIRE(services[1].version == "ECAcc (nyb/1D13)");
    }

    SECTION("Lines without a version have an empty version") {
        auto services = PortScanResult::parseServiceLines("3306/tcp open mysql");
        REQUIRE(services.size() == 1);
        REQUIRE(services[0].version.empty());
        REQUIRE_FALSE(services[0].severity.has_value());
    }

    SECTION("Short lines are skipped") {
        REQUIRE(PortScanResult::parseServiceLines("22/tcp open").empty());
        REQUIRE(PortScanResult::parseServiceLines("").empty());
    }
}

TEST_CASE("ServiceDetector", "[ServiceDetector]") {
    SECTION("Known ports") {
        REQUIRE(ServiceDetector::detectService(22) == "ssh");
        REQUIRE(ServiceDetector::detectService(443) == "https");
        REQUIRE(ServiceDetector::detectService(3306) == "mysql");
    }

    SECTION("Unknown port") {
        REQUIRE(ServiceDetector::detectService(12345) == "unknown");
    }

    SECTION("Common ports are sorted and cover the table") {
        auto ports = ServiceDetector::commonPorts();
        REQUIRE(ports.size() == ServiceDetector::getKnownServices().size());
        REQUIRE(std::is_sorted(ports.begin(), ports.end()));
        REQUIRE(ports.front() == 21);
    }
}
