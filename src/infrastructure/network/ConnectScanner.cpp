#include "infrastructure/network/ConnectScanner.hpp"

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include <memory>
#include <system_error>
#include <utility>

namespace reconpulse::infra {

namespace {

constexpr std::chrono::milliseconds kPollSlice{100};

struct PortAttempt {
    uint16_t port{0};
    std::unique_ptr<asio::ip::tcp::socket> socket;
    std::unique_ptr<asio::steady_timer> timer;
    bool completed{false};
    bool open{false};
};

} // namespace

ConnectScanner::ConnectScanner(std::vector<uint16_t> ports,
                               std::chrono::milliseconds perPortTimeout)
    : ports_(std::move(ports)), perPortTimeout_(perPortTimeout) {}

core::PortScanResult ConnectScanner::scan(const std::string& target, std::chrono::seconds timeout,
                                          const std::string& args) {
    core::PortScanResult result;
    result.available = true;
    result.command = "connect-scan " + target + " (" + std::to_string(ports_.size()) + " ports)";

    if (!args.empty()) {
        spdlog::debug("Connect scanner ignores scanner arguments: {}", args);
    }

    if (cancelled_) {
        result.error = "connect scan cancelled";
        return result;
    }

    asio::io_context io;
    asio::ip::tcp::endpoint base;

    try {
        asio::ip::tcp::resolver resolver(io);
        auto endpoints = resolver.resolve(target, "");
        if (endpoints.empty()) {
            result.error = "Could not resolve " + target;
            return result;
        }
        base = endpoints.begin()->endpoint();
    } catch (const std::system_error& e) {
        result.error = "Could not resolve " + target + ": " + e.what();
        return result;
    }

    spdlog::info("Starting connect scan of {} ({}) on {} ports", target,
                 base.address().to_string(), ports_.size());

    std::vector<std::shared_ptr<PortAttempt>> attempts;
    attempts.reserve(ports_.size());

    for (uint16_t port : ports_) {
        auto attempt = std::make_shared<PortAttempt>();
        attempt->port = port;
        attempt->socket = std::make_unique<asio::ip::tcp::socket>(io);
        attempt->timer = std::make_unique<asio::steady_timer>(io);

        attempt->timer->expires_after(perPortTimeout_);
        attempt->timer->async_wait([attempt](const asio::error_code& ec) {
            if (ec || attempt->completed) {
                return;
            }
            attempt->completed = true;
            asio::error_code ignored;
            attempt->socket->close(ignored);
        });

        asio::ip::tcp::endpoint endpoint(base.address(), port);
        attempt->socket->async_connect(endpoint, [attempt](const asio::error_code& ec) {
            if (attempt->completed) {
                return;
            }
            attempt->completed = true;
            attempt->timer->cancel();
            attempt->open = !ec;

            asio::error_code ignored;
            attempt->socket->close(ignored);
        });

        attempts.push_back(std::move(attempt));
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!io.stopped() && !cancelled_ && std::chrono::steady_clock::now() < deadline) {
        io.run_for(kPollSlice);
    }

    if (!io.stopped()) {
        // Abort outstanding connects and drain their handlers before the sockets go away.
        for (const auto& attempt : attempts) {
            attempt->completed = true;
            asio::error_code ignored;
            attempt->socket->close(ignored);
            attempt->timer->cancel();
        }
        io.restart();
        io.run();

        if (cancelled_) {
            result.error = "connect scan cancelled";
            spdlog::warn("Connect scan of {} cancelled", target);
        } else {
            result.error = "connect scan timed out after " + std::to_string(timeout.count()) +
                           " seconds";
            spdlog::warn("Connect scan of {} timed out", target);
        }
        return result;
    }

    for (const auto& attempt : attempts) {
        if (!attempt->open) {
            continue;
        }
        core::ServiceEntry entry;
        entry.port = std::to_string(attempt->port) + "/tcp";
        entry.state = "open";
        entry.service = core::ServiceDetector::detectService(attempt->port);
        result.services.push_back(std::move(entry));
    }

    spdlog::info("Connect scan of {} complete: {} open ports", target, result.services.size());
    return result;
}

} // namespace reconpulse::infra
