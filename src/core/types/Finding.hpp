/**
 * @file Finding.hpp
 * @brief Severity-tagged observations derived from a scan report.
 */

#pragma once

#include "core/types/Severity.hpp"

#include <optional>
#include <string>

namespace reconpulse::core {

enum class FindingCategory : int { OpenPort = 0, MissingSecurityHeader = 1, TlsCertificate = 2 };

/**
 * @brief A single observation, ordered by insertion during finding derivation.
 */
struct Finding {
    FindingCategory category{FindingCategory::OpenPort};
    std::string target;   ///< Port spec, scheme name, or scan target depending on category
    Severity severity{Severity::Low};
    std::string title;
    std::string details;  ///< Human-readable reason
    std::optional<std::string> service;

    [[nodiscard]] std::string categoryToString() const;
    static std::optional<FindingCategory> categoryFromString(const std::string& str);

    bool operator==(const Finding& other) const = default;
};

/**
 * @brief Finding counts per severity.
 */
struct SeveritySummary {
    int high{0};
    int medium{0};
    int low{0};

    [[nodiscard]] int total() const { return high + medium + low; }

    bool operator==(const SeveritySummary& other) const = default;
};

} // namespace reconpulse::core
