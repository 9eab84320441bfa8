/**
 * @file PortScanResult.hpp
 * @brief Port scan outcome, discovered services, and service-table parsing.
 *
 * This file defines the result of the port scanning probe: whether a scanner
 * backend was available, what it was invoked with, and the open TCP services
 * it reported.
 */

#pragma once

#include "core/types/Severity.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace reconpulse::core {

/**
 * @brief One open service as reported by the scanner.
 *
 * The severity fields start unset and are filled by the finding engine.
 */
struct ServiceEntry {
    std::string port;    ///< Port specification, e.g. "22/tcp"
    std::string state;   ///< Port state token, e.g. "open"
    std::string service; ///< Service name, e.g. "ssh"
    std::string version; ///< Version banner (may be empty)
    std::optional<Severity> severity;          ///< Derived severity
    std::optional<std::string> severityReason; ///< Reason for the derived severity

    bool operator==(const ServiceEntry& other) const = default;
};

/**
 * @brief Result of the port scanning probe for one target.
 */
struct PortScanResult {
    bool available{false};            ///< Scanner backend present and ran
    bool skipped{false};              ///< Probe disabled by configuration
    std::optional<std::string> error; ///< Non-fatal error description
    std::optional<std::string> command; ///< Invocation actually used
    std::vector<ServiceEntry> services; ///< Open services in scanner order
    std::string stdoutText;           ///< Raw scanner stdout
    std::string stderrText;           ///< Raw scanner stderr

    /**
     * @brief Extracts open TCP services from textual scanner output.
     *
     * Selects lines containing "/tcp" and the token "open", splits them on
     * whitespace and takes tokens 1/2/3/(4+) as port/state/service/version.
     * Lines that do not match are skipped.
     *
     * @param output Scanner stdout.
     * @return Services in the order they appear.
     */
    static std::vector<ServiceEntry> parseServiceLines(const std::string& output);

    bool operator==(const PortScanResult& other) const = default;
};

/**
 * @brief Utility class for naming services by well-known port number.
 */
class ServiceDetector {
public:
    /**
     * @brief Detects the likely service running on a port.
     * @param port The port number to look up.
     * @return Service name if known, "unknown" otherwise.
     */
    static std::string detectService(uint16_t port);

    /**
     * @brief Gets the map of known port-to-service mappings.
     * @return Reference to the map of port numbers to service names.
     */
    static const std::unordered_map<uint16_t, std::string>& getKnownServices();

    /**
     * @brief Well-known ports probed by the native connect scanner, ascending.
     */
    static std::vector<uint16_t> commonPorts();
};

} // namespace reconpulse::core
