#include "app/ProbeCoordinator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <utility>

namespace reconpulse::app {

namespace {

using Clock = std::chrono::steady_clock;

constexpr std::chrono::milliseconds kPollInterval{50};
constexpr uint16_t kTlsPort = 443;

core::DnsResult dnsPlaceholder(const core::Target& target, std::string error) {
    core::DnsResult result;
    result.target = target.host();
    if (target.isIpLiteral()) {
        result.resolvedIp = target.host();
    }
    result.errors.push_back(std::move(error));
    return result;
}

core::PortScanResult portScanPlaceholder(bool available, bool skipped, std::string error) {
    core::PortScanResult result;
    result.available = available;
    result.skipped = skipped;
    result.error = std::move(error);
    return result;
}

std::string secondsText(std::chrono::seconds budget) {
    return std::to_string(budget.count()) + " seconds";
}

} // namespace

ProbeCoordinator::ProbeCoordinator(infra::AsioContext& context, ProbeBackends backends)
    : context_(context), backends_(std::move(backends)) {
    if (!backends_.dns || !backends_.portScanner || !backends_.http || !backends_.tls) {
        throw std::invalid_argument("ProbeCoordinator requires all four probe backends");
    }
}

void ProbeCoordinator::cancel() {
    if (!cancelled_.exchange(true)) {
        spdlog::warn("Cancelling outstanding probes");
        backends_.portScanner->cancel();
    }
}

template <typename Result, typename Fallback>
Result ProbeCoordinator::await(std::future<Result>& future, const std::string& probe,
                               Clock::time_point deadline, std::chrono::seconds budget,
                               Fallback&& fallback) {
    while (true) {
        if (cancelled_) {
            spdlog::warn("{} probe cancelled", probe);
            return fallback(probe + " probe cancelled");
        }

        auto now = Clock::now();
        if (now >= deadline) {
            spdlog::warn("{} probe abandoned after {}", probe, secondsText(budget));
            return fallback(probe + " probe timed out after " + secondsText(budget));
        }

        auto wait = std::min<Clock::duration>(deadline - now, kPollInterval);
        if (future.wait_for(wait) == std::future_status::ready) {
            break;
        }
    }

    try {
        return future.get();
    } catch (const std::exception& e) {
        spdlog::error("{} probe failed: {}", probe, e.what());
        return fallback(probe + " probe failed: " + e.what());
    } catch (...) {
        spdlog::error("{} probe failed with a non-standard exception", probe);
        return fallback(probe + " probe failed: unknown error");
    }
}

core::ScanReport ProbeCoordinator::scan(const std::string& host,
                                        const core::ScanSettings& settings) {
    settings.validate();

    if (!context_.isRunning()) {
        context_.start();
    }

    const core::Target target(host);

    core::ScanReport report;
    report.target = host;
    report.scannedAt = std::chrono::system_clock::now();
    report.settings = settings;

    spdlog::info("Scanning {} ({})", host, target.isIpLiteral() ? "IP literal" : "name");

    // Port scan and HTTP(S) are launched first; DNS runs alongside them.
    std::future<core::PortScanResult> portFuture;
    Clock::time_point portDeadline;
    const auto portBudget = settings.portScanTimeout();
    if (settings.nmap && !cancelled_) {
        portDeadline = Clock::now() + portBudget + grace_;
        portFuture = context_.submit(
            [scanner = backends_.portScanner, host, portBudget, args = settings.nmapArgs]() {
                return scanner->scan(host, portBudget, args);
            });
    }

    const std::string httpUrl = "http://" + target.urlHost() + "/";
    const std::string httpsUrl = "https://" + target.urlHost() + "/";
    std::future<core::HttpProbeOutcome> httpFuture;
    std::future<core::HttpProbeOutcome> httpsFuture;
    Clock::time_point httpDeadline;
    if (settings.http && !cancelled_) {
        httpDeadline = Clock::now() + settings.httpTimeout + grace_;
        httpFuture = context_.submit(
            [prober = backends_.http, httpUrl, timeout = settings.httpTimeout]() {
                return prober->probe(httpUrl, timeout);
            });
        httpsFuture = context_.submit(
            [prober = backends_.http, httpsUrl, timeout = settings.httpTimeout]() {
                return prober->probe(httpsUrl, timeout);
            });
    }

    report.dns = runDns(target, settings);

    if (!settings.nmap) {
        report.nmap = portScanPlaceholder(false, true, "Port scan disabled by configuration");
    } else if (!portFuture.valid()) {
        report.nmap = portScanPlaceholder(false, false, "port scan probe cancelled");
    } else {
        report.nmap = await(portFuture, "port scan", portDeadline, portBudget,
                            [](std::string error) {
                                return portScanPlaceholder(true, false, std::move(error));
                            });
    }

    if (!settings.http) {
        report.http.http =
            core::HttpProbeOutcome::failed(httpUrl, "HTTP probe disabled by configuration");
        report.http.https =
            core::HttpProbeOutcome::failed(httpsUrl, "HTTP probe disabled by configuration");
    } else if (!httpFuture.valid()) {
        report.http.http = core::HttpProbeOutcome::failed(httpUrl, "HTTP probe cancelled");
        report.http.https = core::HttpProbeOutcome::failed(httpsUrl, "HTTPS probe cancelled");
    } else {
        report.http.http = await(httpFuture, "HTTP", httpDeadline, settings.httpTimeout,
                                 [&httpUrl](std::string error) {
                                     return core::HttpProbeOutcome::failed(httpUrl,
                                                                           std::move(error));
                                 });
        report.http.https = await(httpsFuture, "HTTPS", httpDeadline, settings.httpTimeout,
                                  [&httpsUrl](std::string error) {
                                      return core::HttpProbeOutcome::failed(httpsUrl,
                                                                            std::move(error));
                                  });
    }

    report.tls = runTls(host, settings, report.http.https);

    spdlog::info("Probes for {} finished: dns_errors={} services={} http={} https={} tls={}",
                 host, report.dns.errors.size(), report.nmap.services.size(),
                 report.http.http.ok ? "ok" : "failed", report.http.https.ok ? "ok" : "failed",
                 report.tls.ok ? "ok" : "unavailable");
    return report;
}

core::DnsResult ProbeCoordinator::runDns(const core::Target& target,
                                         const core::ScanSettings& settings) {
    if (!settings.dns) {
        return dnsPlaceholder(target, "DNS lookup disabled by configuration");
    }

    if (target.isIpLiteral()) {
        core::DnsResult result;
        result.target = target.host();
        result.resolvedIp = target.host();
        return result;
    }

    if (cancelled_) {
        return dnsPlaceholder(target, "DNS probe cancelled");
    }

    auto deadline = Clock::now() + settings.timeout + grace_;
    auto future = context_.submit(
        [resolver = backends_.dns, host = target.host(), lifetime = settings.timeout]() {
            return resolver->resolve(host, lifetime);
        });

    auto result = await(future, "DNS", deadline, settings.timeout,
                        [&target](std::string error) {
                            return dnsPlaceholder(target, std::move(error));
                        });
    // The backend reports on the name it was given; keep the report consistent.
    result.target = target.host();
    return result;
}

core::TlsResult ProbeCoordinator::runTls(const std::string& host,
                                         const core::ScanSettings& settings,
                                         const core::HttpProbeOutcome& https) {
    if (!settings.tls) {
        spdlog::info("TLS inspection disabled by configuration");
        return core::TlsResult::failed("TLS inspection disabled by configuration");
    }
    if (cancelled_) {
        return core::TlsResult::failed("TLS probe cancelled");
    }
    if (!https.ok) {
        spdlog::info("TLS skipped for {} (HTTPS not reachable)", host);
        return core::TlsResult::failed("HTTPS probe failed; TLS details unavailable.");
    }

    auto deadline = Clock::now() + settings.tlsTimeout + grace_;
    auto future = context_.submit(
        [inspector = backends_.tls, host, timeout = settings.tlsTimeout]() {
            return inspector->inspect(host, kTlsPort, timeout);
        });

    return await(future, "TLS", deadline, settings.tlsTimeout,
                 [](std::string error) { return core::TlsResult::failed(std::move(error)); });
}

} // namespace reconpulse::app
