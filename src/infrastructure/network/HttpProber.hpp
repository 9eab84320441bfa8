#pragma once

#include "core/services/IHttpProber.hpp"

#include <string>

namespace reconpulse::infra {

/**
 * @brief Blocking HTTP(S) GET prober using Qt's network stack.
 *
 * Each call owns its own QNetworkAccessManager and a local event loop, so it
 * may be invoked from any worker thread while a QCoreApplication exists.
 * Redirects are followed unless they downgrade from HTTPS to HTTP.
 */
class HttpProber : public core::IHttpProber {
public:
    /**
     * @brief Constructs an HttpProber.
     * @param userAgent Value sent in the User-Agent header.
     */
    explicit HttpProber(std::string userAgent);

    core::HttpProbeOutcome probe(const std::string& url, std::chrono::seconds timeout) override;

private:
    std::string userAgent_;
};

} // namespace reconpulse::infra
