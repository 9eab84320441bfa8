/**
 * @file ScanSettings.hpp
 * @brief Immutable per-run scan configuration.
 */

#pragma once

#include <chrono>
#include <string>

namespace reconpulse::core {

inline constexpr const char* kDefaultNmapArgs = "-sT -Pn --top-ports 1000 -sV";

/**
 * @brief Settings consumed read-only by the probe coordinator.
 *
 * Produced by the configuration layer after CLI and file values have been merged.
 */
struct ScanSettings {
    std::chrono::seconds timeout{8};     ///< Global timeout (DNS lifetime, port scan base)
    std::chrono::seconds httpTimeout{8}; ///< Timeout for each HTTP(S) request
    std::chrono::seconds tlsTimeout{8};  ///< Timeout for the TLS handshake
    std::string nmapArgs{kDefaultNmapArgs}; ///< Arguments handed to the port scanner

    bool dns{true};  ///< Run the DNS probe
    bool http{true}; ///< Run the HTTP(S) probes
    bool tls{true};  ///< Run the TLS inspection
    bool nmap{true}; ///< Run the port scan

    /**
     * @brief Effective port scan timeout: scans take far longer than single connects.
     * @return max(timeout * 4, 20 seconds).
     */
    [[nodiscard]] std::chrono::seconds portScanTimeout() const;

    /**
     * @brief Rejects settings that cannot be represented as a scan.
     * @throws std::invalid_argument if any timeout is not positive.
     */
    void validate() const;

    bool operator==(const ScanSettings& other) const = default;
};

} // namespace reconpulse::core
