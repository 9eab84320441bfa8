#pragma once

#include "core/services/ITlsInspector.hpp"

namespace reconpulse::infra {

/**
 * @brief Reads the peer certificate and negotiated session of a TLS endpoint.
 *
 * Uses QSslSocket with the system trust store and certificate verification,
 * sending the host as SNI. Handshake or verification failures are reported
 * on the result, never thrown.
 */
class TlsInspector : public core::ITlsInspector {
public:
    core::TlsResult inspect(const std::string& host, uint16_t port,
                            std::chrono::seconds timeout) override;
};

} // namespace reconpulse::infra
