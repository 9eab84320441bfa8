/**
 * @file SeverityRules.hpp
 * @brief Severity policy for open ports, missing headers and certificate lifetime.
 *
 * All functions are pure: no I/O and no mutation. The port tables are the
 * security policy of the tool and must not be reordered into a different
 * classification.
 */

#pragma once

#include "core/types/Severity.hpp"
#include "core/util/Timestamp.hpp"

#include <optional>
#include <string>

namespace reconpulse::core {

/**
 * @brief A severity with the human-readable reason that produced it.
 */
struct SeverityVerdict {
    Severity severity{Severity::Low};
    std::string reason;

    bool operator==(const SeverityVerdict& other) const = default;
};

/**
 * @brief Classifies an open port.
 * @param portSpec Port specification such as "22/tcp"; the text before '/' is the port.
 * @return High for remote-admin and database ports, medium for infrastructure
 *         services, low otherwise.
 */
SeverityVerdict severityForPort(const std::string& portSpec);

/**
 * @brief Classifies a missing security header.
 * @param headerName Lower-case header name.
 * @return Medium for CSP, HSTS and X-Frame-Options, low for the rest.
 */
Severity severityForMissingHeader(const std::string& headerName);

/**
 * @brief Classifies a certificate by the time left before notAfter.
 *
 * An absent or unparseable notAfter fails open to low. 14 and 45 days are
 * inclusive on the more severe side.
 *
 * @param notAfter ISO-8601 expiry timestamp.
 * @param now Reference instant, UTC.
 */
SeverityVerdict severityForTlsWindow(const std::optional<std::string>& notAfter,
                                     TimePoint now = std::chrono::system_clock::now());

} // namespace reconpulse::core
