#include "core/scan/FindingEngine.hpp"

#include "core/scan/SeverityRules.hpp"
#include "core/scan/SeveritySummary.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <utility>

namespace reconpulse::core {

namespace {

std::string toUpper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

bool isMissing(const SecurityHeaderMap& headers, const std::string& name) {
    auto it = headers.find(name);
    return it == headers.end() || !it->second.has_value();
}

} // namespace

FindingEngine::FindingEngine(Clock clock) : clock_(std::move(clock)) {}

ScanReport FindingEngine::annotate(ScanReport report) const {
    deriveFindings(report);
    return report;
}

std::vector<Finding> FindingEngine::deriveFindings(ScanReport& report) const {
    std::vector<Finding> findings;

    for (auto& service : report.nmap.services) {
        auto verdict = severityForPort(service.port);
        service.severity = verdict.severity;
        service.severityReason = verdict.reason;

        Finding finding;
        finding.category = FindingCategory::OpenPort;
        finding.target = service.port;
        finding.severity = verdict.severity;
        finding.title = "Open port " + service.port;
        finding.details = verdict.reason;
        finding.service = service.service;
        findings.push_back(std::move(finding));
    }

    for (const auto& [scheme, probe] : report.http.schemes()) {
        if (!probe->ok) {
            continue;
        }
        for (const auto& header : kSecurityHeaders) {
            if (!isMissing(probe->securityHeaders, header)) {
                continue;
            }

            Finding finding;
            finding.category = FindingCategory::MissingSecurityHeader;
            finding.target = scheme;
            finding.severity = severityForMissingHeader(header);
            finding.title = "Missing header: " + header;
            finding.details = toUpper(scheme) + " response is missing " + header;
            findings.push_back(std::move(finding));
        }
    }

    if (report.tls.ok) {
        auto verdict = severityForTlsWindow(report.tls.notAfter, clock_());
        report.tls.severity = verdict.severity;
        report.tls.severityReason = verdict.reason;

        Finding finding;
        finding.category = FindingCategory::TlsCertificate;
        finding.target = report.target;
        finding.severity = verdict.severity;
        finding.title = "TLS certificate health";
        finding.details = verdict.reason;
        findings.push_back(std::move(finding));
    }

    report.findings = findings;
    report.severitySummary = summarizeSeverity(findings);

    spdlog::debug("Derived {} findings for {} (high={}, medium={}, low={})", findings.size(),
                  report.target, report.severitySummary.high, report.severitySummary.medium,
                  report.severitySummary.low);
    return findings;
}

} // namespace reconpulse::core
