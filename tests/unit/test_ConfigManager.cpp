#include <catch2/catch_test_macros.hpp>

#include "infrastructure/config/ConfigManager.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>

using namespace reconpulse::infra;
using namespace std::chrono_literals;

namespace {

class TestConfigDir {
public:
    TestConfigDir()
        : configDir_(std::filesystem::temp_directory_path() / "reconpulse_config_test") {
        cleanup();
        std::filesystem::create_directories(configDir_);
    }

    ~TestConfigDir() { cleanup(); }

    std::filesystem::path path() const { return configDir_; }

    std::filesystem::path write(const std::string& name, const std::string& content) const {
        auto file = configDir_ / name;
        std::ofstream out(file);
        out << content;
        return file;
    }

private:
    void cleanup() {
        if (std::filesystem::exists(configDir_)) {
            std::filesystem::remove_all(configDir_);
        }
    }

    std::filesystem::path configDir_;
};

bool rejects(const nlohmann::json& j, const std::string& expectedError) {
    ConfigManager manager;
    return !manager.loadFromJson(j) && manager.lastError() == expectedError;
}

} // namespace

TEST_CASE("ConfigManager load from file", "[ConfigManager]") {
    TestConfigDir testDir;

    SECTION("Full profile") {
        auto path = testDir.write("profile.json", R"({
            "targets": ["example.com", "10.0.0.1"],
            "scanners": {"dns": true, "http": false, "tls": true, "nmap": false},
            "output": {"format": "html", "out_dir": "out"},
            "timeouts": {"http": {"timeout": 5}, "tls": {"timeout": 9}},
            "port_scanner": {"backend": "connect", "args": "-sT --top-ports 10"}
        })");

        ConfigManager manager;
        REQUIRE(manager.load(path));
        REQUIRE(manager.lastError().empty());

        const auto& profile = manager.profile();
        REQUIRE(profile.targets == std::vector<std::string>{"example.com", "10.0.0.1"});
        REQUIRE(profile.scanners.at("http") == false);
        REQUIRE(profile.scanners.at("dns") == true);
        REQUIRE(profile.format == OutputFormat::Html);
        REQUIRE(profile.outDir == "out");
        REQUIRE(profile.httpTimeoutSeconds == 5);
        REQUIRE(profile.tlsTimeoutSeconds == 9);
        REQUIRE(profile.backend == PortScanBackend::Connect);
        REQUIRE(profile.nmapArgs == "-sT --top-ports 10");
    }

    SECTION("Empty object is a valid profile") {
        auto path = testDir.write("empty.json", "{}");
        ConfigManager manager;
        REQUIRE(manager.load(path));
        REQUIRE(manager.profile().targets.empty());
    }

    SECTION("Missing file") {
        ConfigManager manager;
        REQUIRE_FALSE(manager.load(testDir.path() / "missing.json"));
        REQUIRE(manager.lastError().rfind("Config file not found: ", 0) == 0);
    }

    SECTION("Malformed JSON") {
        auto path = testDir.write("broken.json", "{\"targets\": [");
        ConfigManager manager;
        REQUIRE_FALSE(manager.load(path));
        REQUIRE(manager.lastError().rfind("Invalid JSON: ", 0) == 0);
    }
}

TEST_CASE("ConfigManager validation", "[ConfigManager]") {
    using nlohmann::json;

    SECTION("Root must be an object") {
        REQUIRE(rejects(json::array({"example.com"}), "Config root must be a mapping/object"));
    }

    SECTION("Targets") {
        REQUIRE(rejects(json{{"targets", "example.com"}},
                        "'targets' must be a non-empty string list"));
        REQUIRE(rejects(json{{"targets", json::array({"example.com", ""})}},
                        "'targets' must be a non-empty string list"));
        REQUIRE(rejects(json{{"targets", json::array({1, 2})}}, "'targets' must be a non-empty string list"));
    }

    SECTION("Scanner toggles") {
        REQUIRE(rejects(json{{"scanners", {{"ftp", true}}}}, "Unsupported scanner toggle: ftp"));
        REQUIRE(rejects(json{{"scanners", {{"dns", "yes"}}}},
                        "Scanner toggle 'dns' must be boolean"));
        REQUIRE(rejects(json{{"scanners", true}}, "'scanners' must be a mapping"));
    }

    SECTION("Output") {
        REQUIRE(rejects(json{{"output", {{"format", "pdf"}}}},
                        "output.format must be one of: json, html, both"));
        REQUIRE(rejects(json{{"output", {{"out_dir", 5}}}}, "output.out_dir must be a string path"));
        REQUIRE(rejects(json{{"output", "reports"}}, "'output' must be a mapping"));
    }

    SECTION("Timeouts") {
        REQUIRE(rejects(json{{"timeouts", {{"http", 5}}}}, "timeouts.http must be a mapping"));
        REQUIRE(rejects(json{{"timeouts", {{"tls", {{"timeout", 0}}}}}},
                        "timeouts.tls.timeout must be a positive integer"));
        REQUIRE(rejects(json{{"timeouts", {{"http", {{"timeout", "5"}}}}}},
                        "timeouts.http.timeout must be a positive integer"));
        REQUIRE(rejects(json{{"timeouts", {{"http", {{"timeout", 2.5}}}}}},
                        "timeouts.http.timeout must be a positive integer"));
        REQUIRE(rejects(json{{"timeouts", {{"http", {{"timeout", int64_t{3000000000}}}}}}},
                        "timeouts.http.timeout must be a positive integer"));
    }

    SECTION("Port scanner") {
        REQUIRE(rejects(json{{"port_scanner", {{"backend", "masscan"}}}},
                        "port_scanner.backend must be one of: nmap, connect"));
        REQUIRE(rejects(json{{"port_scanner", {{"args", json::array({"-sT"})}}}},
                        "port_scanner.args must be a string"));
    }

    SECTION("A failed load keeps the previous profile") {
        ConfigManager manager;
        REQUIRE(manager.loadFromJson(json{{"targets", json::array({"example.com"})}}));
        REQUIRE_FALSE(manager.loadFromJson(json{{"targets", 42}}));
        REQUIRE(manager.profile().targets == std::vector<std::string>{"example.com"});
    }
}

TEST_CASE("resolveRuntimeConfig defaults", "[ConfigManager]") {
    CliOverrides cli;
    cli.target = "example.com";

    auto config = resolveRuntimeConfig(ScanProfile{}, cli);

    REQUIRE(config.targets == std::vector<std::string>{"example.com"});
    REQUIRE(config.outDir == std::filesystem::path("reports"));
    REQUIRE(config.format == OutputFormat::Both);
    REQUIRE(config.backend == PortScanBackend::Nmap);
    REQUIRE(config.settings.timeout == 8s);
    REQUIRE(config.settings.httpTimeout == 8s);
    REQUIRE(config.settings.tlsTimeout == 8s);
    REQUIRE(config.settings.nmapArgs == reconpulse::core::kDefaultNmapArgs);
    REQUIRE(config.settings.dns);
    REQUIRE(config.settings.http);
    REQUIRE(config.settings.tls);
    REQUIRE(config.settings.nmap);
}

TEST_CASE("resolveRuntimeConfig precedence", "[ConfigManager]") {
    ScanProfile profile;
    profile.targets = {"a.example", "b.example"};
    profile.scanners = {{"dns", false}, {"nmap", true}};
    profile.format = OutputFormat::Json;
    profile.outDir = "profile-out";
    profile.httpTimeoutSeconds = 3;
    profile.nmapArgs = "-sT --top-ports 50";

    SECTION("CLI target is scanned first") {
        CliOverrides cli;
        cli.target = "c.example";
        auto config = resolveRuntimeConfig(profile, cli);
        REQUIRE(config.targets ==
                std::vector<std::string>{"c.example", "a.example", "b.example"});
    }

    SECTION("CLI target already in the profile is not duplicated") {
        CliOverrides cli;
        cli.target = "b.example";
        auto config = resolveRuntimeConfig(profile, cli);
        REQUIRE(config.targets == std::vector<std::string>{"a.example", "b.example"});
    }

    SECTION("Profile values apply without CLI overrides") {
        auto config = resolveRuntimeConfig(profile, CliOverrides{});
        REQUIRE(config.outDir == std::filesystem::path("profile-out"));
        REQUIRE(config.format == OutputFormat::Json);
        REQUIRE(config.settings.nmapArgs == "-sT --top-ports 50");
        REQUIRE_FALSE(config.settings.dns);
        REQUIRE(config.settings.nmap);
        REQUIRE(config.settings.http);
    }

    SECTION("CLI wins over the profile") {
        CliOverrides cli;
        cli.outDir = "cli-out";
        cli.format = OutputFormat::Html;
        cli.timeoutSeconds = 20;
        cli.nmapArgs = "-sS";
        auto config = resolveRuntimeConfig(profile, cli);
        REQUIRE(config.outDir == std::filesystem::path("cli-out"));
        REQUIRE(config.format == OutputFormat::Html);
        REQUIRE(config.settings.timeout == 20s);
        REQUIRE(config.settings.nmapArgs == "-sS");
    }

    SECTION("Profile HTTP and TLS timeouts win over the global timeout") {
        CliOverrides cli;
        cli.timeoutSeconds = 20;
        auto config = resolveRuntimeConfig(profile, cli);
        REQUIRE(config.settings.httpTimeout == 3s);
        REQUIRE(config.settings.tlsTimeout == 20s);
    }

    SECTION("--no-nmap overrides the profile") {
        CliOverrides cli;
        cli.noNmap = true;
        auto config = resolveRuntimeConfig(profile, cli);
        REQUIRE_FALSE(config.settings.nmap);
    }
}

TEST_CASE("Output format and backend conversion", "[ConfigManager]") {
    REQUIRE(outputFormatToString(OutputFormat::Json) == "json");
    REQUIRE(outputFormatToString(OutputFormat::Both) == "both");
    REQUIRE(outputFormatFromString("html") == OutputFormat::Html);
    REQUIRE_FALSE(outputFormatFromString("HTML").has_value());

    REQUIRE(portScanBackendToString(PortScanBackend::Connect) == "connect");
    REQUIRE(portScanBackendFromString("nmap") == PortScanBackend::Nmap);
    REQUIRE_FALSE(portScanBackendFromString("masscan").has_value());
}
