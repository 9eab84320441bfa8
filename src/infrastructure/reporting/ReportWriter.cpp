#include "infrastructure/reporting/ReportWriter.hpp"

#include "core/util/Timestamp.hpp"
#include "infrastructure/reporting/ReportSerializer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <utility>

namespace reconpulse::infra {

namespace {

std::string optionalText(const std::optional<std::string>& value) {
    return value ? *value : "n/a";
}

const char* severityClass(core::Severity severity) {
    switch (severity) {
    case core::Severity::High:
        return "sev-high";
    case core::Severity::Medium:
        return "sev-medium";
    case core::Severity::Low:
        return "sev-low";
    }
    return "sev-low";
}

void writeHttpSection(std::ostringstream& html, const std::string& scheme,
                      const core::HttpProbeOutcome& outcome) {
    html << "<h3>" << escapeHtml(scheme) << "</h3>\n<table>\n";
    html << "<tr><th>URL</th><td>" << escapeHtml(outcome.url) << "</td></tr>\n";
    html << "<tr><th>Status</th><td>"
         << (outcome.statusCode ? std::to_string(*outcome.statusCode) : "n/a") << "</td></tr>\n";
    html << "<tr><th>Server</th><td>" << escapeHtml(optionalText(outcome.server))
         << "</td></tr>\n";
    for (const auto& header : core::kSecurityHeaders) {
        auto it = outcome.securityHeaders.find(header);
        std::string value = (it != outcome.securityHeaders.end() && it->second)
                                ? *it->second
                                : "missing";
        html << "<tr><th>" << escapeHtml(header) << "</th><td>" << escapeHtml(value)
             << "</td></tr>\n";
    }
    if (outcome.error) {
        html << "<tr><th>Error</th><td>" << escapeHtml(*outcome.error) << "</td></tr>\n";
    }
    html << "</table>\n";
}

} // namespace

std::string escapeHtml(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
        case '&':
            escaped += "&amp;";
            break;
        case '<':
            escaped += "&lt;";
            break;
        case '>':
            escaped += "&gt;";
            break;
        case '"':
            escaped += "&quot;";
            break;
        case '\'':
            escaped += "&#x27;";
            break;
        default:
            escaped += c;
        }
    }
    return escaped;
}

ReportWriter::ReportWriter(std::filesystem::path outDir) : outDir_(std::move(outDir)) {}

std::string ReportWriter::baseName(const core::ScanReport& report) {
    std::string name = report.target;
    std::replace(name.begin(), name.end(), '/', '_');
    return name + "_" + core::formatFileTimestamp(report.scannedAt);
}

bool ReportWriter::ensureOutDir() {
    std::error_code ec;
    std::filesystem::create_directories(outDir_, ec);
    if (ec) {
        spdlog::error("Failed to create output directory {}: {}", outDir_.string(), ec.message());
        return false;
    }
    return true;
}

std::vector<std::filesystem::path> ReportWriter::write(const core::ScanReport& report,
                                                       OutputFormat format) {
    std::vector<std::filesystem::path> written;
    if (!ensureOutDir()) {
        return written;
    }

    const auto base = baseName(report);
    if (format == OutputFormat::Json || format == OutputFormat::Both) {
        auto path = outDir_ / (base + ".json");
        if (writeJson(path, report)) {
            written.push_back(path);
        }
    }
    if (format == OutputFormat::Html || format == OutputFormat::Both) {
        auto path = outDir_ / (base + ".html");
        if (writeHtml(path, report)) {
            written.push_back(path);
        }
    }
    return written;
}

bool ReportWriter::writeJson(const std::filesystem::path& path, const core::ScanReport& report) {
    std::ofstream file(path);
    if (!file) {
        spdlog::error("Failed to open report file for writing: {}", path.string());
        return false;
    }

    file << reportToJson(report).dump(2);
    spdlog::debug("Wrote JSON report {}", path.string());
    return static_cast<bool>(file);
}

bool ReportWriter::writeHtml(const std::filesystem::path& path, const core::ScanReport& report) {
    std::ofstream file(path);
    if (!file) {
        spdlog::error("Failed to open report file for writing: {}", path.string());
        return false;
    }

    file << renderHtml(report);
    spdlog::debug("Wrote HTML report {}", path.string());
    return static_cast<bool>(file);
}

std::string ReportWriter::renderHtml(const core::ScanReport& report) {
    std::ostringstream html;
    const auto& summary = report.severitySummary;

    html << "<!DOCTYPE html>\n<html lang=\"en\">\n<head>\n<meta charset=\"utf-8\">\n"
         << "<title>ReconPulse report: " << escapeHtml(report.target) << "</title>\n"
         << "<style>\n"
         << "body{font-family:sans-serif;margin:2em;background:#111;color:#eee}\n"
         << "table{border-collapse:collapse;margin-bottom:1.5em}\n"
         << "th,td{border:1px solid #444;padding:4px 8px;text-align:left}\n"
         << ".sev-high{color:#ff5555;font-weight:bold}\n"
         << ".sev-medium{color:#f1c40f;font-weight:bold}\n"
         << ".sev-low{color:#5dade2}\n"
         << "</style>\n</head>\n<body>\n";

    html << "<h1>Recon report for " << escapeHtml(report.target) << "</h1>\n";
    html << "<p>Scanned at " << escapeHtml(core::formatIsoTimestamp(report.scannedAt))
         << "</p>\n";

    html << "<h2>Severity summary</h2>\n<table>\n"
         << "<tr><th class=\"sev-high\">High</th><td>" << summary.high << "</td></tr>\n"
         << "<tr><th class=\"sev-medium\">Medium</th><td>" << summary.medium << "</td></tr>\n"
         << "<tr><th class=\"sev-low\">Low</th><td>" << summary.low << "</td></tr>\n"
         << "</table>\n";

    html << "<h2>Findings</h2>\n";
    if (report.findings.empty()) {
        html << "<p>No findings were generated.</p>\n";
    } else {
        html << "<table>\n<tr><th>Severity</th><th>Category</th><th>Target</th>"
             << "<th>Title</th><th>Details</th></tr>\n";
        for (const auto& finding : report.findings) {
            html << "<tr><td class=\"" << severityClass(finding.severity) << "\">"
                 << core::severityToString(finding.severity) << "</td><td>"
                 << finding.categoryToString() << "</td><td>" << escapeHtml(finding.target)
                 << "</td><td>" << escapeHtml(finding.title) << "</td><td>"
                 << escapeHtml(finding.details) << "</td></tr>\n";
        }
        html << "</table>\n";
    }

    html << "<h2>DNS</h2>\n<table>\n<tr><th>Resolved IP</th><td>"
         << escapeHtml(optionalText(report.dns.resolvedIp)) << "</td></tr>\n";
    for (const auto& [type, values] : report.dns.records) {
        std::string joined;
        for (const auto& value : values) {
            joined += (joined.empty() ? "" : ", ") + value;
        }
        html << "<tr><th>" << escapeHtml(type) << "</th><td>" << escapeHtml(joined)
             << "</td></tr>\n";
    }
    for (const auto& error : report.dns.errors) {
        html << "<tr><th>Error</th><td>" << escapeHtml(error) << "</td></tr>\n";
    }
    html << "</table>\n";

    html << "<h2>Open ports</h2>\n";
    if (report.nmap.error) {
        html << "<p>" << escapeHtml(*report.nmap.error) << "</p>\n";
    }
    if (!report.nmap.services.empty()) {
        html << "<table>\n<tr><th>Port</th><th>State</th><th>Service</th><th>Version</th>"
             << "<th>Severity</th></tr>\n";
        for (const auto& service : report.nmap.services) {
            auto severity = service.severity.value_or(core::Severity::Low);
            html << "<tr><td>" << escapeHtml(service.port) << "</td><td>"
                 << escapeHtml(service.state) << "</td><td>" << escapeHtml(service.service)
                 << "</td><td>" << escapeHtml(service.version) << "</td><td class=\""
                 << severityClass(severity) << "\">"
                 << (service.severity ? core::severityToString(*service.severity) : "n/a")
                 << "</td></tr>\n";
        }
        html << "</table>\n";
    }

    html << "<h2>HTTP(S)</h2>\n";
    writeHttpSection(html, "http", report.http.http);
    writeHttpSection(html, "https", report.http.https);

    html << "<h2>TLS</h2>\n<table>\n";
    if (report.tls.ok) {
        std::string san;
        for (const auto& name : report.tls.san) {
            san += (san.empty() ? "" : ", ") + name;
        }
        html << "<tr><th>Protocol</th><td>" << escapeHtml(optionalText(report.tls.protocol))
             << "</td></tr>\n"
             << "<tr><th>Cipher</th><td>"
             << escapeHtml(report.tls.cipher ? report.tls.cipher->name : "n/a") << "</td></tr>\n"
             << "<tr><th>Not before</th><td>" << escapeHtml(optionalText(report.tls.notBefore))
             << "</td></tr>\n"
             << "<tr><th>Not after</th><td>" << escapeHtml(optionalText(report.tls.notAfter))
             << "</td></tr>\n"
             << "<tr><th>SAN</th><td>" << escapeHtml(san) << "</td></tr>\n";
        if (report.tls.severity) {
            html << "<tr><th>Health</th><td class=\"" << severityClass(*report.tls.severity)
                 << "\">" << escapeHtml(optionalText(report.tls.severityReason))
                 << "</td></tr>\n";
        }
    } else {
        html << "<tr><th>Status</th><td>" << escapeHtml(optionalText(report.tls.error))
             << "</td></tr>\n";
    }
    html << "</table>\n</body>\n</html>\n";

    return html.str();
}

} // namespace reconpulse::infra
