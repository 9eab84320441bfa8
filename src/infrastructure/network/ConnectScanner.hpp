#pragma once

#include "core/services/IPortScanner.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <vector>

namespace reconpulse::infra {

/**
 * @brief Native TCP connect scanner for hosts without nmap.
 *
 * Resolves the target, then attempts a non-blocking connect to each port with
 * a per-port timeout. Open ports are named from the built-in service table;
 * no version detection is performed. Implements the core::IPortScanner interface.
 */
class ConnectScanner : public core::IPortScanner {
public:
    /**
     * @brief Constructs a scanner.
     * @param ports Ports to probe; defaults to the well-known service ports.
     * @param perPortTimeout Connect timeout for a single port.
     */
    explicit ConnectScanner(std::vector<uint16_t> ports = core::ServiceDetector::commonPorts(),
                            std::chrono::milliseconds perPortTimeout = std::chrono::milliseconds{
                                1500});

    core::PortScanResult scan(const std::string& target, std::chrono::seconds timeout,
                              const std::string& args) override;

    void cancel() override { cancelled_ = true; }

    std::string name() const override { return "connect"; }

private:
    std::vector<uint16_t> ports_;
    std::chrono::milliseconds perPortTimeout_;
    std::atomic<bool> cancelled_{false};
};

} // namespace reconpulse::infra
