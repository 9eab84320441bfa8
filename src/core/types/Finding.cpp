#include "core/types/Finding.hpp"

namespace reconpulse::core {

std::string Finding::categoryToString() const {
    switch (category) {
    case FindingCategory::OpenPort:
        return "open_port";
    case FindingCategory::MissingSecurityHeader:
        return "missing_security_header";
    case FindingCategory::TlsCertificate:
        return "tls_certificate";
    }
    return "unknown";
}

std::optional<FindingCategory> Finding::categoryFromString(const std::string& str) {
    if (str == "open_port")
        return FindingCategory::OpenPort;
    if (str == "missing_security_header")
        return FindingCategory::MissingSecurityHeader;
    if (str == "tls_certificate")
        return FindingCategory::TlsCertificate;
    return std::nullopt;
}

} // namespace reconpulse::core
