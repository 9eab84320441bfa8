/**
 * @file HttpResult.hpp
 * @brief HTTP and HTTPS root probe outcomes.
 */

#pragma once

#include <array>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace reconpulse::core {

/// Security headers inspected on every response, in canonical order.
inline const std::array<std::string, 6> kSecurityHeaders = {
    "strict-transport-security", "content-security-policy", "x-frame-options",
    "x-content-type-options",    "referrer-policy",         "permissions-policy"};

/// Header name (lower-case) to value; nullopt means the server did not send it.
using SecurityHeaderMap = std::map<std::string, std::optional<std::string>>;

/**
 * @brief Outcome of a single GET against a scheme root.
 */
struct HttpProbeOutcome {
    std::string url;                     ///< URL that was requested
    bool ok{false};                      ///< Request completed with a success status
    std::optional<int> statusCode;       ///< HTTP status, if a response arrived
    std::optional<std::string> server;   ///< Value of the Server header
    SecurityHeaderMap securityHeaders;   ///< The six security headers
    std::optional<std::string> error;    ///< Failure description

    /**
     * @brief Builds an outcome with all six security headers unset.
     * @param url Requested URL.
     * @param error Failure description.
     */
    static HttpProbeOutcome failed(std::string url, std::string error);

    bool operator==(const HttpProbeOutcome& other) const = default;
};

/**
 * @brief Pair of probe outcomes keyed by scheme.
 */
struct HttpResult {
    HttpProbeOutcome http;
    HttpProbeOutcome https;

    /**
     * @brief Scheme-keyed view in the fixed traversal order "http", "https".
     */
    [[nodiscard]] std::array<std::pair<std::string, const HttpProbeOutcome*>, 2> schemes() const {
        return {{{"http", &http}, {"https", &https}}};
    }

    bool operator==(const HttpResult& other) const = default;
};

/**
 * @brief Lower-cases header names, keeping values verbatim.
 *
 * When a header name appears more than once the last value wins.
 */
std::map<std::string, std::string>
normalizeHeaders(const std::vector<std::pair<std::string, std::string>>& headers);

/**
 * @brief Picks the six security headers out of a normalized header map.
 */
SecurityHeaderMap extractSecurityHeaders(const std::map<std::string, std::string>& normalized);

} // namespace reconpulse::core
