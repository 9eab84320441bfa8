/**
 * @file ProbeCoordinator.hpp
 * @brief Runs the four probes for one target and assembles the scan report.
 */

#pragma once

#include "core/services/IDnsResolver.hpp"
#include "core/services/IHttpProber.hpp"
#include "core/services/IPortScanner.hpp"
#include "core/services/ITlsInspector.hpp"
#include "core/types/ScanReport.hpp"
#include "core/types/ScanSettings.hpp"
#include "core/types/Target.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>

namespace reconpulse::app {

/**
 * @brief Probe backends used by the coordinator.
 *
 * Held by shared_ptr so a probe abandoned after its deadline keeps its backend
 * alive until it returns on the worker thread.
 */
struct ProbeBackends {
    std::shared_ptr<core::IDnsResolver> dns;
    std::shared_ptr<core::IPortScanner> portScanner;
    std::shared_ptr<core::IHttpProber> http;
    std::shared_ptr<core::ITlsInspector> tls;
};

/**
 * @brief Orchestrates DNS, port scan, HTTP(S) and TLS probes for a target.
 *
 * DNS, port scan and both HTTP(S) probes run concurrently on the worker pool
 * and are joined before the TLS step, which only runs when HTTPS succeeded.
 * Every probe has a hard deadline of its backend timeout plus a grace period;
 * a probe that misses it is abandoned and replaced by a timeout placeholder.
 *
 * scan() always returns a structurally complete report. Probe failures,
 * backend exceptions and cancellation are recorded as data on the report.
 */
class ProbeCoordinator {
public:
    /**
     * @brief Constructs a coordinator.
     * @param context Started worker pool; needs at least four threads for full concurrency.
     * @param backends Probe backends; all four must be set.
     */
    ProbeCoordinator(infra::AsioContext& context, ProbeBackends backends);

    /**
     * @brief Probes a target.
     * @param target Host name or IP literal.
     * @param settings Validated before any probe runs.
     * @return Report with dns, nmap, http and tls populated; findings empty.
     * @throws std::invalid_argument if the settings are invalid.
     */
    core::ScanReport scan(const std::string& target, const core::ScanSettings& settings);

    /**
     * @brief Aborts outstanding probes. Sticky: later scans see every probe as cancelled.
     *
     * Stops waiting on every probe and cancels the port scan backend, which is
     * the only probe whose run time is not bounded by a short network timeout.
     * Safe to call from any thread.
     */
    void cancel();

    bool isCancelled() const { return cancelled_.load(); }

    /**
     * @brief Sets the extra time granted past each backend timeout before abandoning it.
     */
    void setDeadlineGrace(std::chrono::milliseconds grace) { grace_ = grace; }

private:
    template <typename Result, typename Fallback>
    Result await(std::future<Result>& future, const std::string& probe,
                 std::chrono::steady_clock::time_point deadline, std::chrono::seconds budget,
                 Fallback&& fallback);

    core::DnsResult runDns(const core::Target& target, const core::ScanSettings& settings);
    core::TlsResult runTls(const std::string& target, const core::ScanSettings& settings,
                           const core::HttpProbeOutcome& https);

    infra::AsioContext& context_;
    ProbeBackends backends_;
    std::atomic<bool> cancelled_{false};
    std::chrono::milliseconds grace_{2000};
};

} // namespace reconpulse::app
