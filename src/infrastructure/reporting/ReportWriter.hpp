#pragma once

#include "core/types/ScanReport.hpp"
#include "infrastructure/config/ConfigManager.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace reconpulse::infra {

/**
 * @brief Writes finished scan reports to an output directory.
 *
 * Files are named "<target>_<YYYYmmdd_HHMMSS>.json|.html" with '/' in the
 * target replaced by '_'.
 */
class ReportWriter {
public:
    explicit ReportWriter(std::filesystem::path outDir);

    /**
     * @brief Writes the report in the requested format(s).
     * @return Paths of the files written successfully.
     */
    std::vector<std::filesystem::path> write(const core::ScanReport& report, OutputFormat format);

    bool writeJson(const std::filesystem::path& path, const core::ScanReport& report);
    bool writeHtml(const std::filesystem::path& path, const core::ScanReport& report);

    /// Base file name for a report, without extension.
    static std::string baseName(const core::ScanReport& report);

    /// Renders the HTML page for a report.
    static std::string renderHtml(const core::ScanReport& report);

private:
    bool ensureOutDir();

    std::filesystem::path outDir_;
};

/// Escapes &, <, >, " and ' for inclusion in HTML text or attribute values.
std::string escapeHtml(const std::string& text);

} // namespace reconpulse::infra
