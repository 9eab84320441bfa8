/**
 * @file FindingEngine.hpp
 * @brief Derives severity-tagged findings from a completed scan report.
 */

#pragma once

#include "core/types/Finding.hpp"
#include "core/types/ScanReport.hpp"
#include "core/util/Timestamp.hpp"

#include <functional>
#include <vector>

namespace reconpulse::core {

/**
 * @brief Applies the severity rules to every relevant part of a scan report.
 *
 * Traversal order is fixed: open services in scanner order, then missing
 * security headers for "http" and "https" in canonical header order, then the
 * TLS certificate. Missing-header findings are only produced for a scheme whose
 * probe succeeded; a header absent from the map or null counts as missing.
 *
 * Derivation is idempotent: the finding list is rebuilt from scratch on every
 * call and re-computed severities overwrite identical values.
 */
class FindingEngine {
public:
    using Clock = std::function<TimePoint()>;

    /**
     * @brief Constructs an engine.
     * @param clock Source of "now" for certificate lifetime checks.
     */
    explicit FindingEngine(Clock clock = [] { return std::chrono::system_clock::now(); });

    /**
     * @brief Returns an annotated copy of a probed report.
     *
     * Service entries and the TLS result carry their derived severity, and
     * findings and severitySummary are populated.
     */
    [[nodiscard]] ScanReport annotate(ScanReport report) const;

    /**
     * @brief Annotates a report the caller owns and returns its new findings.
     */
    std::vector<Finding> deriveFindings(ScanReport& report) const;

private:
    Clock clock_;
};

} // namespace reconpulse::core
