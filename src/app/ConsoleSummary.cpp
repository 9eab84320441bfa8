#include "app/ConsoleSummary.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <iterator>

namespace reconpulse::app {

namespace {

std::string statusText(const core::HttpProbeOutcome& outcome) {
    if (outcome.statusCode) {
        return std::to_string(*outcome.statusCode);
    }
    return outcome.error.value_or("no response");
}

} // namespace

std::string formatConsoleSummary(const core::ScanReport& report) {
    fmt::memory_buffer out;
    auto it = std::back_inserter(out);

    fmt::format_to(it, "=== {} ===\n", report.target);
    fmt::format_to(it, "DNS: {} ({} errors)\n", report.dns.resolvedIp.value_or("unresolved"),
                   report.dns.errors.size());

    if (report.nmap.available && report.nmap.error) {
        fmt::format_to(it, "Open ports: {} ({})\n", report.nmap.services.size(),
                       *report.nmap.error);
    } else if (report.nmap.available) {
        fmt::format_to(it, "Open ports: {}\n", report.nmap.services.size());
    } else {
        fmt::format_to(it, "Open ports: unavailable ({})\n",
                       report.nmap.error.value_or("port scan did not run"));
    }

    fmt::format_to(it, "HTTP: {} | HTTPS: {}\n", statusText(report.http.http),
                   statusText(report.http.https));

    if (report.tls.ok) {
        fmt::format_to(it, "TLS: {}\n", report.tls.severityReason.value_or("ok"));
    } else {
        fmt::format_to(it, "TLS: {}\n", report.tls.error.value_or("unavailable"));
    }

    const auto shown = std::min(report.findings.size(), kConsoleFindingLimit);
    fmt::format_to(it, "Findings ({}):\n", report.findings.size());
    for (std::size_t i = 0; i < shown; ++i) {
        const auto& finding = report.findings[i];
        fmt::format_to(it, "  [{}] {}: {}\n", core::severityToString(finding.severity),
                       finding.title, finding.details);
    }
    if (report.findings.size() > shown) {
        fmt::format_to(it, "  ... {} more\n", report.findings.size() - shown);
    }

    const auto& summary = report.severitySummary;
    fmt::format_to(it, "Totals: high={} medium={} low={}\n", summary.high, summary.medium,
                   summary.low);

    return fmt::to_string(out);
}

} // namespace reconpulse::app
