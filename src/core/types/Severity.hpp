#pragma once

#include <optional>
#include <string>

namespace reconpulse::core {

enum class Severity : int { Low = 0, Medium = 1, High = 2 };

std::string severityToString(Severity severity);
std::optional<Severity> severityFromString(const std::string& str);

} // namespace reconpulse::core
