#pragma once

#include "core/types/DnsResult.hpp"
#include "core/types/Finding.hpp"
#include "core/types/HttpResult.hpp"
#include "core/types/PortScanResult.hpp"
#include "core/types/ScanSettings.hpp"
#include "core/types/TlsResult.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace reconpulse::core {

/**
 * @brief Aggregate result of all probes for one target.
 *
 * Populated by the probe coordinator; findings and severitySummary are filled
 * by the finding engine. Owned by exactly one scan run.
 */
struct ScanReport {
    std::string target;
    std::chrono::system_clock::time_point scannedAt;
    ScanSettings settings;
    DnsResult dns;
    PortScanResult nmap;
    HttpResult http;
    TlsResult tls;
    std::vector<Finding> findings;
    SeveritySummary severitySummary;

    bool operator==(const ScanReport& other) const = default;
};

} // namespace reconpulse::core
