#include "infrastructure/reporting/ReportSerializer.hpp"

#include "core/util/Timestamp.hpp"

namespace reconpulse::infra {

namespace {

template <typename T>
nlohmann::json optionalToJson(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

nlohmann::json severityToJson(const std::optional<core::Severity>& severity) {
    return severity ? nlohmann::json(core::severityToString(*severity)) : nlohmann::json(nullptr);
}

nlohmann::json settingsToJson(const core::ScanSettings& settings) {
    nlohmann::json j;
    j["timeout"] = settings.timeout.count();
    j["http_timeout"] = settings.httpTimeout.count();
    j["tls_timeout"] = settings.tlsTimeout.count();
    j["nmap_args"] = settings.nmapArgs;
    j["enable_dns"] = settings.dns;
    j["enable_http"] = settings.http;
    j["enable_tls"] = settings.tls;
    j["enable_nmap"] = settings.nmap;
    return j;
}

nlohmann::json dnsToJson(const core::DnsResult& dns) {
    nlohmann::json j;
    j["target"] = dns.target;
    j["resolved_ip"] = optionalToJson(dns.resolvedIp);
    j["records"] = nlohmann::json::object();
    for (const auto& [type, values] : dns.records) {
        j["records"][type] = values;
    }
    j["errors"] = dns.errors;
    return j;
}

nlohmann::json portScanToJson(const core::PortScanResult& scan) {
    nlohmann::json j;
    j["available"] = scan.available;
    j["skipped"] = scan.skipped;
    j["error"] = optionalToJson(scan.error);
    j["command"] = optionalToJson(scan.command);
    j["services"] = nlohmann::json::array();
    for (const auto& service : scan.services) {
        nlohmann::json s;
        s["port"] = service.port;
        s["state"] = service.state;
        s["service"] = service.service;
        s["version"] = service.version;
        if (service.severity) {
            s["severity"] = severityToJson(service.severity);
            s["severity_reason"] = optionalToJson(service.severityReason);
        }
        j["services"].push_back(s);
    }
    j["stdout"] = scan.stdoutText;
    j["stderr"] = scan.stderrText;
    return j;
}

nlohmann::json httpOutcomeToJson(const core::HttpProbeOutcome& outcome) {
    nlohmann::json j;
    j["url"] = outcome.url;
    j["ok"] = outcome.ok;
    j["status_code"] = optionalToJson(outcome.statusCode);
    j["server"] = optionalToJson(outcome.server);
    j["security_headers"] = nlohmann::json::object();
    for (const auto& [name, value] : outcome.securityHeaders) {
        j["security_headers"][name] = optionalToJson(value);
    }
    j["error"] = optionalToJson(outcome.error);
    return j;
}

nlohmann::json nameToJson(const core::DistinguishedName& name) {
    auto j = nlohmann::json::array();
    for (const auto& attribute : name) {
        j.push_back(nlohmann::json::array({attribute.key, attribute.value}));
    }
    return j;
}

nlohmann::json tlsToJson(const core::TlsResult& tls) {
    nlohmann::json j;
    j["ok"] = tls.ok;
    if (tls.ok) {
        j["subject"] = nameToJson(tls.subject);
        j["issuer"] = nameToJson(tls.issuer);
        j["san"] = tls.san;
        j["not_before"] = optionalToJson(tls.notBefore);
        j["not_after"] = optionalToJson(tls.notAfter);
        j["protocol"] = optionalToJson(tls.protocol);
        if (tls.cipher) {
            j["cipher"] = nlohmann::json::array(
                {tls.cipher->name, tls.cipher->protocol, tls.cipher->bits});
        } else {
            j["cipher"] = nullptr;
        }
    }
    j["error"] = optionalToJson(tls.error);
    if (tls.severity) {
        j["severity"] = severityToJson(tls.severity);
        j["severity_reason"] = optionalToJson(tls.severityReason);
    }
    return j;
}

} // namespace

nlohmann::json findingToJson(const core::Finding& finding) {
    nlohmann::json j;
    j["category"] = finding.categoryToString();
    j["target"] = finding.target;
    j["severity"] = core::severityToString(finding.severity);
    j["title"] = finding.title;
    j["details"] = finding.details;
    if (finding.service) {
        j["service"] = *finding.service;
    }
    return j;
}

nlohmann::json reportToJson(const core::ScanReport& report) {
    nlohmann::json j;
    j["target"] = report.target;
    j["scanned_at"] = core::formatIsoTimestamp(report.scannedAt);
    j["settings"] = settingsToJson(report.settings);
    j["dns"] = dnsToJson(report.dns);
    j["nmap"] = portScanToJson(report.nmap);
    j["http"]["http"] = httpOutcomeToJson(report.http.http);
    j["http"]["https"] = httpOutcomeToJson(report.http.https);
    j["tls"] = tlsToJson(report.tls);

    j["findings"] = nlohmann::json::array();
    for (const auto& finding : report.findings) {
        j["findings"].push_back(findingToJson(finding));
    }

    j["severity_summary"]["high"] = report.severitySummary.high;
    j["severity_summary"]["medium"] = report.severitySummary.medium;
    j["severity_summary"]["low"] = report.severitySummary.low;
    return j;
}

} // namespace reconpulse::infra
