#include "core/types/Severity.hpp"

namespace reconpulse::core {

std::string severityToString(Severity severity) {
    switch (severity) {
    case Severity::Low:
        return "low";
    case Severity::Medium:
        return "medium";
    case Severity::High:
        return "high";
    }
    return "unknown";
}

std::optional<Severity> severityFromString(const std::string& str) {
    if (str == "low")
        return Severity::Low;
    if (str == "medium")
        return Severity::Medium;
    if (str == "high")
        return Severity::High;
    return std::nullopt;
}

} // namespace reconpulse::core
