#include "infrastructure/config/ConfigManager.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <limits>
#include <set>
#include <stdexcept>

namespace reconpulse::infra {

namespace {

constexpr int kDefaultTimeoutSeconds = 8;

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

const nlohmann::json* section(const nlohmann::json& j, const std::string& key) {
    if (!j.contains(key) || j[key].is_null()) {
        return nullptr;
    }
    if (!j[key].is_object()) {
        throw ConfigError("'" + key + "' must be a mapping");
    }
    return &j[key];
}

std::optional<int> positiveTimeout(const nlohmann::json& timeouts, const std::string& key) {
    if (!timeouts.contains(key) || timeouts[key].is_null()) {
        return std::nullopt;
    }
    const auto& node = timeouts[key];
    if (!node.is_object()) {
        throw ConfigError("timeouts." + key + " must be a mapping");
    }
    if (!node.contains("timeout") || node["timeout"].is_null()) {
        return std::nullopt;
    }
    const auto& value = node["timeout"];
    if (!value.is_number_integer() || value.get<int64_t>() < 1 ||
        value.get<int64_t>() > std::numeric_limits<int>::max()) {
        throw ConfigError("timeouts." + key + ".timeout must be a positive integer");
    }
    return value.get<int>();
}

} // namespace

std::string outputFormatToString(OutputFormat format) {
    switch (format) {
    case OutputFormat::Json:
        return "json";
    case OutputFormat::Html:
        return "html";
    case OutputFormat::Both:
        return "both";
    }
    return "both";
}

std::optional<OutputFormat> outputFormatFromString(const std::string& str) {
    if (str == "json")
        return OutputFormat::Json;
    if (str == "html")
        return OutputFormat::Html;
    if (str == "both")
        return OutputFormat::Both;
    return std::nullopt;
}

std::string portScanBackendToString(PortScanBackend backend) {
    switch (backend) {
    case PortScanBackend::Nmap:
        return "nmap";
    case PortScanBackend::Connect:
        return "connect";
    }
    return "nmap";
}

std::optional<PortScanBackend> portScanBackendFromString(const std::string& str) {
    if (str == "nmap")
        return PortScanBackend::Nmap;
    if (str == "connect")
        return PortScanBackend::Connect;
    return std::nullopt;
}

bool ConfigManager::load(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        lastError_ = "Config file not found: " + path.string();
        spdlog::error("{}", lastError_);
        return false;
    }

    std::ifstream file(path);
    if (!file) {
        lastError_ = "Could not read config file: " + path.string();
        spdlog::error("{}", lastError_);
        return false;
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        lastError_ = std::string("Invalid JSON: ") + e.what();
        spdlog::error("Failed to load config {}: {}", path.string(), lastError_);
        return false;
    }

    if (!loadFromJson(j)) {
        return false;
    }

    spdlog::info("Loaded scan profile from {}", path.string());
    return true;
}

bool ConfigManager::loadFromJson(const nlohmann::json& j) {
    try {
        profile_ = parseProfile(j);
        lastError_.clear();
        return true;
    } catch (const ConfigError& e) {
        lastError_ = e.what();
    } catch (const nlohmann::json::exception& e) {
        lastError_ = std::string("Invalid config value: ") + e.what();
    }
    spdlog::error("Invalid scan profile: {}", lastError_);
    return false;
}

ScanProfile ConfigManager::parseProfile(const nlohmann::json& j) {
    ScanProfile profile;

    if (j.is_null()) {
        return profile;
    }
    if (!j.is_object()) {
        throw ConfigError("Config root must be a mapping/object");
    }

    if (j.contains("targets") && !j["targets"].is_null()) {
        const auto& targets = j["targets"];
        if (!targets.is_array()) {
            throw ConfigError("'targets' must be a non-empty string list");
        }
        for (const auto& target : targets) {
            if (!target.is_string() || target.get<std::string>().empty()) {
                throw ConfigError("'targets' must be a non-empty string list");
            }
            profile.targets.push_back(target.get<std::string>());
        }
    }

    if (const auto* scanners = section(j, "scanners")) {
        static const std::set<std::string> known = {"dns", "http", "tls", "nmap"};
        for (const auto& [key, value] : scanners->items()) {
            if (!known.contains(key)) {
                throw ConfigError("Unsupported scanner toggle: " + key);
            }
            if (!value.is_boolean()) {
                throw ConfigError("Scanner toggle '" + key + "' must be boolean");
            }
            profile.scanners[key] = value.get<bool>();
        }
    }

    if (const auto* output = section(j, "output")) {
        if (output->contains("format") && !(*output)["format"].is_null()) {
            const auto& format = (*output)["format"];
            auto parsed = format.is_string() ? outputFormatFromString(format.get<std::string>())
                                             : std::nullopt;
            if (!parsed) {
                throw ConfigError("output.format must be one of: json, html, both");
            }
            profile.format = parsed;
        }
        if (output->contains("out_dir") && !(*output)["out_dir"].is_null()) {
            if (!(*output)["out_dir"].is_string()) {
                throw ConfigError("output.out_dir must be a string path");
            }
            profile.outDir = (*output)["out_dir"].get<std::string>();
        }
    }

    if (const auto* timeouts = section(j, "timeouts")) {
        profile.httpTimeoutSeconds = positiveTimeout(*timeouts, "http");
        profile.tlsTimeoutSeconds = positiveTimeout(*timeouts, "tls");
    }

    if (const auto* scanner = section(j, "port_scanner")) {
        if (scanner->contains("backend") && !(*scanner)["backend"].is_null()) {
            const auto& backend = (*scanner)["backend"];
            auto parsed = backend.is_string()
                              ? portScanBackendFromString(backend.get<std::string>())
                              : std::nullopt;
            if (!parsed) {
                throw ConfigError("port_scanner.backend must be one of: nmap, connect");
            }
            profile.backend = parsed;
        }
        if (scanner->contains("args") && !(*scanner)["args"].is_null()) {
            if (!(*scanner)["args"].is_string()) {
                throw ConfigError("port_scanner.args must be a string");
            }
            profile.nmapArgs = (*scanner)["args"].get<std::string>();
        }
    }

    return profile;
}

RuntimeConfig resolveRuntimeConfig(const ScanProfile& profile, const CliOverrides& cli) {
    RuntimeConfig config;

    if (profile.targets.empty()) {
        if (!cli.target.empty()) {
            config.targets.push_back(cli.target);
        }
    } else {
        config.targets = profile.targets;
        if (!cli.target.empty() &&
            std::find(config.targets.begin(), config.targets.end(), cli.target) ==
                config.targets.end()) {
            config.targets.insert(config.targets.begin(), cli.target);
        }
    }

    config.outDir = cli.outDir.value_or(profile.outDir.value_or("reports"));
    config.format = cli.format.value_or(profile.format.value_or(OutputFormat::Both));
    config.backend = profile.backend.value_or(PortScanBackend::Nmap);

    const int timeout = cli.timeoutSeconds.value_or(kDefaultTimeoutSeconds);
    auto& settings = config.settings;
    settings.timeout = std::chrono::seconds{timeout};
    settings.httpTimeout = std::chrono::seconds{profile.httpTimeoutSeconds.value_or(timeout)};
    settings.tlsTimeout = std::chrono::seconds{profile.tlsTimeoutSeconds.value_or(timeout)};
    settings.nmapArgs = cli.nmapArgs.value_or(profile.nmapArgs.value_or(core::kDefaultNmapArgs));

    auto toggle = [&profile](const std::string& key) {
        auto it = profile.scanners.find(key);
        return it == profile.scanners.end() || it->second;
    };
    settings.dns = toggle("dns");
    settings.http = toggle("http");
    settings.tls = toggle("tls");
    settings.nmap = toggle("nmap") && !cli.noNmap;

    return config;
}

} // namespace reconpulse::infra
