#pragma once

#include "core/types/ScanSettings.hpp"

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace reconpulse::infra {

/**
 * @brief Report formats written after each scan.
 */
enum class OutputFormat { Json, Html, Both };

std::string outputFormatToString(OutputFormat format);
std::optional<OutputFormat> outputFormatFromString(const std::string& str);

/**
 * @brief Port scanning backend selection.
 */
enum class PortScanBackend { Nmap, Connect };

std::string portScanBackendToString(PortScanBackend backend);
std::optional<PortScanBackend> portScanBackendFromString(const std::string& str);

/**
 * @brief Validated contents of a scan profile file. Unset fields were absent.
 */
struct ScanProfile {
    std::vector<std::string> targets;          ///< Targets listed in the profile.
    std::map<std::string, bool> scanners;      ///< Probe toggles keyed by dns/http/tls/nmap.
    std::optional<OutputFormat> format;        ///< output.format
    std::optional<std::string> outDir;         ///< output.out_dir
    std::optional<int> httpTimeoutSeconds;     ///< timeouts.http.timeout
    std::optional<int> tlsTimeoutSeconds;      ///< timeouts.tls.timeout
    std::optional<PortScanBackend> backend;    ///< port_scanner.backend
    std::optional<std::string> nmapArgs;       ///< port_scanner.args
};

/**
 * @brief Values given on the command line; unset fields were not given.
 */
struct CliOverrides {
    std::string target;
    std::optional<std::string> outDir;
    std::optional<OutputFormat> format;
    std::optional<int> timeoutSeconds;
    std::optional<std::string> nmapArgs;
    bool noNmap{false};
};

/**
 * @brief Fully merged configuration for one invocation.
 */
struct RuntimeConfig {
    std::vector<std::string> targets;
    std::filesystem::path outDir{"reports"};
    OutputFormat format{OutputFormat::Both};
    PortScanBackend backend{PortScanBackend::Nmap};
    core::ScanSettings settings;
};

/**
 * @brief Merges CLI values over a scan profile.
 *
 * The CLI target is scanned first, followed by the profile's other targets.
 * CLI output directory, format, timeout and scanner arguments win over the
 * profile; the profile's HTTP and TLS timeouts win over the global timeout;
 * --no-nmap disables the port scan regardless of the profile.
 */
RuntimeConfig resolveRuntimeConfig(const ScanProfile& profile, const CliOverrides& cli);

/**
 * @brief Loads and validates JSON scan profiles.
 *
 * Example profile:
 * @code
 * {
 *   "targets": ["example.com"],
 *   "scanners": {"dns": true, "http": true, "tls": true, "nmap": false},
 *   "output": {"format": "html", "out_dir": "reports"},
 *   "timeouts": {"http": {"timeout": 5}, "tls": {"timeout": 9}},
 *   "port_scanner": {"backend": "nmap", "args": "-sT -Pn --top-ports 100"}
 * }
 * @endcode
 */
class ConfigManager {
public:
    /**
     * @brief Loads a profile from disk.
     * @param path Path to the JSON profile.
     * @return True if the file was read and is valid; see lastError() otherwise.
     */
    bool load(const std::filesystem::path& path);

    /**
     * @brief Validates an already-parsed profile document.
     * @return True if valid; see lastError() otherwise.
     */
    bool loadFromJson(const nlohmann::json& j);

    const ScanProfile& profile() const { return profile_; }

    const std::string& lastError() const { return lastError_; }

    RuntimeConfig resolve(const CliOverrides& cli) const {
        return resolveRuntimeConfig(profile_, cli);
    }

private:
    static ScanProfile parseProfile(const nlohmann::json& j);

    ScanProfile profile_;
    std::string lastError_;
};

} // namespace reconpulse::infra
