#pragma once

#include "core/types/DnsResult.hpp"

#include <chrono>
#include <string>

namespace reconpulse::core {

/**
 * @brief Resolves a name target and looks up its A/AAAA/CNAME/NS/MX/TXT records.
 *
 * Failures are appended to DnsResult::errors; the result is always structurally valid.
 */
class IDnsResolver {
public:
    virtual ~IDnsResolver() = default;

    virtual DnsResult resolve(const std::string& target, std::chrono::seconds lifetime) = 0;
};

} // namespace reconpulse::core
