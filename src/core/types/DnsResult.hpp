#pragma once

#include <array>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace reconpulse::core {

/// Record types looked up for name targets, in report order.
inline const std::array<std::string, 6> kDnsRecordTypes = {"A",  "AAAA", "CNAME",
                                                          "NS", "MX",   "TXT"};

struct DnsResult {
    std::string target;
    std::optional<std::string> resolvedIp;
    std::map<std::string, std::vector<std::string>> records;
    std::vector<std::string> errors;

    bool operator==(const DnsResult& other) const = default;
};

} // namespace reconpulse::core
