#pragma once

#include "core/types/ScanReport.hpp"

#include <nlohmann/json.hpp>

namespace reconpulse::infra {

/**
 * @brief Serializes a scan report as a JSON tree with snake_case keys.
 *
 * Unset optional values become null; severity annotations are included only
 * once the finding engine has set them.
 */
nlohmann::json reportToJson(const core::ScanReport& report);

nlohmann::json findingToJson(const core::Finding& finding);

} // namespace reconpulse::infra
