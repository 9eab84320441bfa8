#include "core/scan/SeveritySummary.hpp"

namespace reconpulse::core {

SeveritySummary summarizeSeverity(const std::vector<Finding>& findings) {
    SeveritySummary summary;
    for (const auto& finding : findings) {
        switch (finding.severity) {
        case Severity::High:
            ++summary.high;
            break;
        case Severity::Medium:
            ++summary.medium;
            break;
        case Severity::Low:
            ++summary.low;
            break;
        default:
            break;
        }
    }
    return summary;
}

} // namespace reconpulse::core
