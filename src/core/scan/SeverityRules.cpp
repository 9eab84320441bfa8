#include "core/scan/SeverityRules.hpp"

#include <map>
#include <set>

namespace reconpulse::core {

namespace {

const std::map<std::string, std::string>& highRiskPorts() {
    static const std::map<std::string, std::string> ports = {
        {"21", "FTP exposed"},    {"22", "SSH exposed"},   {"23", "Telnet exposed"},
        {"25", "SMTP exposed"},   {"3389", "RDP exposed"}, {"445", "SMB exposed"},
        {"1433", "MSSQL exposed"}, {"3306", "MySQL exposed"}};
    return ports;
}

const std::map<std::string, std::string>& mediumRiskPorts() {
    static const std::map<std::string, std::string> ports = {{"53", "DNS service exposed"},
                                                             {"111", "RPC exposed"},
                                                             {"139", "NetBIOS exposed"},
                                                             {"5900", "VNC exposed"},
                                                             {"8080", "Alt HTTP exposed"}};
    return ports;
}

std::string portNumber(const std::string& portSpec) {
    return portSpec.substr(0, portSpec.find('/'));
}

} // namespace

SeverityVerdict severityForPort(const std::string& portSpec) {
    const auto number = portNumber(portSpec);

    if (auto it = highRiskPorts().find(number); it != highRiskPorts().end()) {
        return {Severity::High, it->second};
    }
    if (auto it = mediumRiskPorts().find(number); it != mediumRiskPorts().end()) {
        return {Severity::Medium, it->second};
    }
    if (number == "80" || number == "443") {
        return {Severity::Low, "Common web service"};
    }
    return {Severity::Low, "Open port"};
}

Severity severityForMissingHeader(const std::string& headerName) {
    static const std::set<std::string> mediumHeaders = {
        "content-security-policy", "strict-transport-security", "x-frame-options"};
    return mediumHeaders.contains(headerName) ? Severity::Medium : Severity::Low;
}

SeverityVerdict severityForTlsWindow(const std::optional<std::string>& notAfter, TimePoint now) {
    if (!notAfter || notAfter->empty()) {
        return {Severity::Low, "Certificate expiration unknown"};
    }

    auto expiry = parseIsoTimestamp(*notAfter);
    if (!expiry) {
        return {Severity::Low, "Certificate expiration format unknown"};
    }

    if (*expiry < now) {
        return {Severity::High, "Certificate expired"};
    }

    auto daysRemaining = std::chrono::floor<std::chrono::days>(*expiry - now).count();
    if (daysRemaining <= 14) {
        return {Severity::High,
                "Certificate expires soon (" + std::to_string(daysRemaining) + " days)"};
    }
    if (daysRemaining <= 45) {
        return {Severity::Medium,
                "Certificate expires soon-ish (" + std::to_string(daysRemaining) + " days)"};
    }
    return {Severity::Low,
            "Certificate valid (" + std::to_string(daysRemaining) + " days remaining)"};
}

} // namespace reconpulse::core
