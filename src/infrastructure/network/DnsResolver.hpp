#pragma once

#include "core/services/IDnsResolver.hpp"

#include <string>
#include <vector>

class QDnsLookup;

namespace reconpulse::infra {

/**
 * @brief DNS backend built on QHostInfo and QDnsLookup.
 *
 * The target's address is resolved through the system resolver, then the six
 * record types are queried concurrently under a single lifetime. A record
 * type with no answer or NXDOMAIN is left empty; any other lookup failure is
 * recorded in DnsResult::errors. Record text follows zone-file presentation
 * (names end with '.', MX as "<preference> <exchange>", TXT strings quoted).
 */
class DnsResolver : public core::IDnsResolver {
public:
    core::DnsResult resolve(const std::string& target, std::chrono::seconds lifetime) override;

private:
    static std::vector<std::string> recordsToText(const QDnsLookup& lookup);
};

} // namespace reconpulse::infra
