#include <catch2/catch_test_macros.hpp>

#include "core/scan/FindingEngine.hpp"
#include "infrastructure/reporting/ReportWriter.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace reconpulse::core;
using namespace reconpulse::infra;

namespace {

class TestOutputDir {
public:
    TestOutputDir()
        : dir_(std::filesystem::temp_directory_path() / "reconpulse_report_test") {
        std::filesystem::remove_all(dir_);
    }

    ~TestOutputDir() { std::filesystem::remove_all(dir_); }

    std::filesystem::path path() const { return dir_; }

private:
    std::filesystem::path dir_;
};

std::string readFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

ScanReport sampleReport(const std::string& target) {
    ScanReport report;
    report.target = target;
    report.scannedAt = std::chrono::system_clock::now();
    report.dns.target = target;
    report.nmap.available = true;
    report.nmap.services = PortScanResult::parseServiceLines("23/tcp open telnet <script>");
    report.http.http = HttpProbeOutcome::failed("http://" + target + "/", "Connection refused");
    report.http.https.url = "https://" + target + "/";
    report.http.https.ok = true;
    report.http.https.statusCode = 200;
    report.http.https.server = "Apache \"test\" & co";
    report.tls = TlsResult::failed("HTTPS probe failed; TLS details unavailable.");
    return FindingEngine().annotate(report);
}

} // namespace

TEST_CASE("ReportWriter writes both formats", "[ReportWriter][integration]") {
    TestOutputDir out;
    ReportWriter writer(out.path() / "nested");
    auto report = sampleReport("example.com");

    auto written = writer.write(report, OutputFormat::Both);

    REQUIRE(written.size() == 2);
    REQUIRE(written[0].extension() == ".json");
    REQUIRE(written[1].extension() == ".html");
    REQUIRE(written[0].stem() == written[1].stem());
    REQUIRE(written[0].stem().string().rfind("example.com_", 0) == 0);

    SECTION("JSON report parses back") {
        auto j = nlohmann::json::parse(readFile(written[0]));
        REQUIRE(j["target"] == "example.com");
        REQUIRE(j["nmap"]["services"][0]["severity"] == "high");
        REQUIRE(j["severity_summary"]["high"] == report.severitySummary.high);
    }

    SECTION("HTML report is escaped") {
        auto html = readFile(written[1]);
        REQUIRE(html.find("<!DOCTYPE html>") == 0);
        REQUIRE(html.find("&lt;script&gt;") != std::string::npos);
        REQUIRE(html.find("<script>") == std::string::npos);
        REQUIRE(html.find("Apache &quot;test&quot; &amp; co") != std::string::npos);
        REQUIRE(html.find("Missing header: content-security-policy") != std::string::npos);
    }
}

TEST_CASE("ReportWriter single formats", "[ReportWriter][integration]") {
    TestOutputDir out;
    ReportWriter writer(out.path());
    auto report = sampleReport("10.0.0.0/24");

    SECTION("JSON only") {
        auto written = writer.write(report, OutputFormat::Json);
        REQUIRE(written.size() == 1);
        REQUIRE(written[0].extension() == ".json");
    }

    SECTION("HTML only") {
        auto written = writer.write(report, OutputFormat::Html);
        REQUIRE(written.size() == 1);
        REQUIRE(written[0].extension() == ".html");
    }

    SECTION("Slashes in the target are replaced") {
        REQUIRE(ReportWriter::baseName(report).rfind("10.0.0.0_24_", 0) == 0);
    }
}

TEST_CASE("ReportWriter reports unwritable locations", "[ReportWriter][integration]") {
    TestOutputDir out;
    std::filesystem::create_directories(out.path());
    auto blocker = out.path() / "blocker";
    std::ofstream(blocker) << "not a directory";

    ReportWriter writer(blocker / "reports");
    REQUIRE(writer.write(sampleReport("example.com"), OutputFormat::Both).empty());
}

TEST_CASE("escapeHtml", "[ReportWriter]") {
    REQUIRE(escapeHtml("<a href=\"x\">O'Neil & co</a>") ==
            "&lt;a href=&quot;x&quot;&gt;O&#x27;Neil &amp; co&lt;/a&gt;");
    REQUIRE(escapeHtml("plain") == "plain");
}
