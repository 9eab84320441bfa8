#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace reconpulse::core {

using TimePoint = std::chrono::system_clock::time_point;

/**
 * @brief Parses an ISO-8601 timestamp such as "2025-01-01T00:00:00+00:00".
 *
 * Accepts a date, an optional 'T' or ' ' separated time with optional fraction,
 * and an optional "Z" or "+HH:MM" offset. A timestamp without an offset is
 * taken to be UTC.
 *
 * @return The instant, or nullopt if the text is not a valid timestamp.
 */
std::optional<TimePoint> parseIsoTimestamp(const std::string& text);

/// Formats an instant as "YYYY-MM-DDTHH:MM:SS+00:00" (UTC, whole seconds).
std::string formatIsoTimestamp(TimePoint instant);

/// Formats an instant in local time as "YYYYmmdd_HHMMSS" for report file names.
std::string formatFileTimestamp(TimePoint instant);

/**
 * @brief Converts a peer certificate time ("Jan 01 00:00:00 2025 GMT") to ISO-8601 UTC.
 *
 * @return nullopt for an empty input, the ISO form on success, and the input
 *         unchanged when it cannot be parsed.
 */
std::optional<std::string> certTimeToIso(const std::optional<std::string>& certTime);

} // namespace reconpulse::core
