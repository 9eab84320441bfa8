#pragma once

#include "core/types/Finding.hpp"

#include <vector>

namespace reconpulse::core {

/**
 * @brief Counts findings per severity; unrecognized severities are ignored.
 */
SeveritySummary summarizeSeverity(const std::vector<Finding>& findings);

} // namespace reconpulse::core
