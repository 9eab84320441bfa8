#pragma once

#include "core/types/Severity.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace reconpulse::core {

/// One relative distinguished name attribute, e.g. {"commonName", "example.com"}.
struct NameAttribute {
    std::string key;
    std::string value;

    bool operator==(const NameAttribute& other) const = default;
};

using DistinguishedName = std::vector<NameAttribute>;

struct CipherInfo {
    std::string name;
    std::string protocol;
    int bits{0};

    bool operator==(const CipherInfo& other) const = default;
};

/**
 * @brief Certificate and session details from the TLS handshake.
 *
 * When ok is false only error is meaningful. severity/severityReason are added
 * by the finding engine.
 */
struct TlsResult {
    bool ok{false};
    DistinguishedName subject;
    DistinguishedName issuer;
    std::vector<std::string> san;
    std::optional<std::string> notBefore; ///< ISO-8601 UTC, or raw text if unparseable
    std::optional<std::string> notAfter;  ///< ISO-8601 UTC, or raw text if unparseable
    std::optional<std::string> protocol;
    std::optional<CipherInfo> cipher;
    std::optional<std::string> error;
    std::optional<Severity> severity;
    std::optional<std::string> severityReason;

    static TlsResult failed(std::string error) {
        TlsResult result;
        result.error = std::move(error);
        return result;
    }

    bool operator==(const TlsResult& other) const = default;
};

} // namespace reconpulse::core
