#pragma once

#include "core/types/TlsResult.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace reconpulse::core {

/**
 * @brief Performs a TLS handshake with SNI and reads the peer certificate.
 *
 * Certificate validity times are returned in ISO-8601 UTC form.
 */
class ITlsInspector {
public:
    virtual ~ITlsInspector() = default;

    virtual TlsResult inspect(const std::string& host, uint16_t port,
                              std::chrono::seconds timeout) = 0;
};

} // namespace reconpulse::core
