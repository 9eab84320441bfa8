#include "core/types/HttpResult.hpp"

#include <algorithm>
#include <cctype>

namespace reconpulse::core {

HttpProbeOutcome HttpProbeOutcome::failed(std::string url, std::string error) {
    HttpProbeOutcome outcome;
    outcome.url = std::move(url);
    outcome.ok = false;
    outcome.error = std::move(error);
    for (const auto& name : kSecurityHeaders) {
        outcome.securityHeaders[name] = std::nullopt;
    }
    return outcome;
}

std::map<std::string, std::string>
normalizeHeaders(const std::vector<std::pair<std::string, std::string>>& headers) {
    std::map<std::string, std::string> normalized;
    for (const auto& [name, value] : headers) {
        std::string key = name;
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        normalized[key] = value;
    }
    return normalized;
}

SecurityHeaderMap extractSecurityHeaders(const std::map<std::string, std::string>& normalized) {
    SecurityHeaderMap headers;
    for (const auto& name : kSecurityHeaders) {
        auto it = normalized.find(name);
        headers[name] = it != normalized.end() ? std::optional<std::string>(it->second)
                                               : std::nullopt;
    }
    return headers;
}

} // namespace reconpulse::core
