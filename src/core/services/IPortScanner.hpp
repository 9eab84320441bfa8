/**
 * @file IPortScanner.hpp
 * @brief Interface for the TCP port/service scanning backend.
 *
 * This file defines the abstract interface the probe coordinator uses to
 * enumerate open TCP services on a target.
 */

#pragma once

#include "core/types/PortScanResult.hpp"

#include <chrono>
#include <string>

namespace reconpulse::core {

/**
 * @brief Interface for port scanning backends.
 *
 * Implementations report problems as data on the returned result (unavailable
 * tool, timeout, non-zero exit) rather than by throwing.
 */
class IPortScanner {
public:
    virtual ~IPortScanner() = default;

    /**
     * @brief Scans a target and returns the open services found.
     * @param target Host name or IP address.
     * @param timeout Hard limit for the whole scan.
     * @param args Backend-specific arguments (nmap argument string).
     * @return Populated scan result.
     */
    virtual PortScanResult scan(const std::string& target, std::chrono::seconds timeout,
                                const std::string& args) = 0;

    /**
     * @brief Aborts a running scan and makes later scans return at once.
     *
     * May be called from any thread. The interrupted scan reports the
     * cancellation as its error.
     */
    virtual void cancel() = 0;

    /**
     * @brief Short backend name used in logs ("nmap", "connect").
     */
    virtual std::string name() const = 0;
};

} // namespace reconpulse::core
