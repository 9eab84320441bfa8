#pragma once

#include "core/types/ScanReport.hpp"

#include <string>

namespace reconpulse::app {

/// Number of findings listed before the summary is truncated.
inline constexpr std::size_t kConsoleFindingLimit = 12;

/**
 * @brief Renders the human-readable summary printed after each scan.
 */
std::string formatConsoleSummary(const core::ScanReport& report);

} // namespace reconpulse::app
