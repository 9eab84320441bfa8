#pragma once

#include "core/types/HttpResult.hpp"

#include <chrono>
#include <string>

namespace reconpulse::core {

/**
 * @brief Performs a blocking GET and reports status, server and security headers.
 */
class IHttpProber {
public:
    virtual ~IHttpProber() = default;

    /**
     * @brief Requests a URL once.
     * @param url Absolute URL, e.g. "https://example.com/".
     * @param timeout Transfer timeout.
     * @return Outcome with ok=false and an error string on any failure.
     */
    virtual HttpProbeOutcome probe(const std::string& url, std::chrono::seconds timeout) = 0;
};

} // namespace reconpulse::core
