#include <catch2/catch_test_macros.hpp>

#include "infrastructure/network/NmapScanner.hpp"

#include <QCoreApplication>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <thread>

using namespace reconpulse::infra;
using namespace std::chrono_literals;

namespace {

void ensureQtApp() {
    if (QCoreApplication::instance() == nullptr) {
        static int argc = 1;
        static char name[] = "reconpulse_tests";
        static char* argv[] = {name, nullptr};
        static QCoreApplication app(argc, argv);
    }
}

/// Stand-in scanner executables written as shell scripts.
class TestScriptDir {
public:
    explicit TestScriptDir(const std::string& tag)
        : dir_(std::filesystem::temp_directory_path() / ("reconpulse_scanner_test_" + tag)) {
        cleanup();
        std::filesystem::create_directories(dir_);
    }

    ~TestScriptDir() { cleanup(); }

    std::string script(const std::string& name, const std::string& body) const {
        auto file = dir_ / name;
        {
            std::ofstream out(file);
            out << "#!/bin/sh\n" << body;
        }
        std::filesystem::permissions(file, std::filesystem::perms::owner_all,
                                     std::filesystem::perm_options::replace);
        return file.string();
    }

private:
    void cleanup() {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path dir_;
};

} // namespace

TEST_CASE("NmapScanner missing executable", "[NmapScanner]") {
    ensureQtApp();
    NmapScanner scanner("reconpulse-no-such-binary");

    REQUIRE_FALSE(scanner.isAvailable());

    auto result = scanner.scan("127.0.0.1", 5s, "");
    REQUIRE_FALSE(result.available);
    REQUIRE_FALSE(result.skipped);
    REQUIRE(result.error == "reconpulse-no-such-binary is not installed or not in PATH.");
    REQUIRE(result.services.empty());
    REQUIRE_FALSE(result.command.has_value());
}

TEST_CASE("NmapScanner non-zero exit keeps parsed services", "[NmapScanner]") {
    ensureQtApp();
    TestScriptDir dir("exit3");
    auto exe = dir.script("fake-nmap-exit3",
                          "echo 'PORT   STATE SERVICE'\n"
                          "echo '22/tcp open  ssh'\n"
                          "echo 'warning' >&2\n"
                          "exit 3\n");
    NmapScanner scanner(exe);

    REQUIRE(scanner.isAvailable());

    auto result = scanner.scan("127.0.0.1", 10s, "-sT -p 22");
    REQUIRE(result.available);
    REQUIRE(result.error == exe + " exited with code 3");
    REQUIRE(result.services.size() == 1);
    REQUIRE(result.services[0].port == "22/tcp");
    REQUIRE(result.services[0].state == "open");
    REQUIRE(result.services[0].service == "ssh");
    REQUIRE(result.command == exe + " -sT -p 22 127.0.0.1");
    REQUIRE(result.stderrText == "warning\n");
}

TEST_CASE("NmapScanner successful run", "[NmapScanner]") {
    ensureQtApp();
    TestScriptDir dir("ok");
    auto exe = dir.script("fake-nmap-ok", "echo '80/tcp open http nginx 1.25'\n");
    NmapScanner scanner(exe);

    auto result = scanner.scan("example.com", 10s, "");
    REQUIRE(result.available);
    REQUIRE_FALSE(result.error.has_value());
    REQUIRE(result.services.size() == 1);
    REQUIRE(result.services[0].version == "nginx 1.25");
}

TEST_CASE("NmapScanner timeout", "[NmapScanner]") {
    ensureQtApp();
    TestScriptDir dir("slow");
    auto exe = dir.script("fake-nmap-slow", "echo '22/tcp open ssh'\nexec sleep 30\n");
    NmapScanner scanner(exe);

    auto start = std::chrono::steady_clock::now();
    auto result = scanner.scan("127.0.0.1", 1s, "");
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(elapsed < 10s);
    REQUIRE(result.available);
    REQUIRE(result.error == exe + " timed out after 1 seconds");
    REQUIRE(result.services.empty());
}

TEST_CASE("NmapScanner cancellation", "[NmapScanner]") {
    ensureQtApp();
    TestScriptDir dir("hang");
    auto exe = dir.script("fake-nmap-hang", "exec sleep 30\n");
    NmapScanner scanner(exe);

    std::thread canceller([&scanner] {
        std::this_thread::sleep_for(300ms);
        scanner.cancel();
    });

    auto start = std::chrono::steady_clock::now();
    auto result = scanner.scan("127.0.0.1", 60s, "");
    auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    REQUIRE(elapsed < 10s);
    REQUIRE(result.error == exe + " scan cancelled");
    REQUIRE(result.services.empty());

    SECTION("Later scans return without starting the process") {
        auto next = scanner.scan("127.0.0.1", 60s, "");
        REQUIRE(next.error == exe + " scan cancelled");
        REQUIRE(next.stdoutText.empty());
    }
}
