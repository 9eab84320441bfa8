#include "app/Application.hpp"

#include "app/ConsoleSummary.hpp"
#include "infrastructure/network/ConnectScanner.hpp"
#include "infrastructure/network/DnsResolver.hpp"
#include "infrastructure/network/HttpProber.hpp"
#include "infrastructure/network/NmapScanner.hpp"
#include "infrastructure/network/TlsInspector.hpp"
#include "infrastructure/reporting/ReportWriter.hpp"

#include <QCommandLineParser>
#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <thread>
#include <vector>

#ifndef RECONPULSE_VERSION
#define RECONPULSE_VERSION "0.1.0"
#endif

namespace reconpulse::app {

namespace {

constexpr int kMinTimeoutSeconds = 1;
constexpr int kMaxTimeoutSeconds = 120;
constexpr size_t kMinWorkerThreads = 4;

} // namespace

Application::Application(int& argc, char** argv) {
    qtApp_ = std::make_unique<QCoreApplication>(argc, argv);
    qtApp_->setApplicationName("reconpulse");
    qtApp_->setApplicationVersion(RECONPULSE_VERSION);

    if (!parseCommandLine()) {
        return;
    }

    initializeLogging();
    initializeComponents();
}

Application::~Application() {
    if (signals_) {
        asio::error_code ec;
        signals_->cancel(ec);
    }

    if (signalContext_) {
        signalContext_->stop();
    }

    if (asioContext_) {
        asioContext_->stop();
    }
}

std::string Application::userAgent() {
    return std::string("reconpulse/") + RECONPULSE_VERSION;
}

bool Application::parseCommandLine() {
    QCommandLineParser parser;
    parser.setApplicationDescription("Reconnaissance scanner: DNS, ports, HTTP(S) headers and TLS.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("target", "Host name or IP address to scan.", "[target]");

    QCommandLineOption configOption("config", "JSON scan profile.", "path");
    QCommandLineOption outDirOption("out-dir", "Directory for reports.", "dir");
    QCommandLineOption formatOption("format", "Report format: json, html or both.", "format");
    QCommandLineOption timeoutOption("timeout", "Probe timeout in seconds (1-120, default 8).",
                                     "seconds");
    QCommandLineOption nmapArgsOption("nmap-args", "Arguments passed to nmap.", "args");
    QCommandLineOption noNmapOption("no-nmap", "Skip the port scan.");
    QCommandLineOption verboseOption("verbose", "Log debug output to the console.");
    parser.addOptions({configOption, outDirOption, formatOption, timeoutOption, nmapArgsOption,
                       noNmapOption, verboseOption});

    parser.process(*qtApp_);

    infra::CliOverrides cli;
    const auto positional = parser.positionalArguments();
    if (positional.size() > 1) {
        spdlog::error("Only one target may be given on the command line");
        exitCode_ = 2;
        return false;
    }
    if (!positional.isEmpty()) {
        cli.target = positional.first().toStdString();
    }

    if (parser.isSet(outDirOption)) {
        cli.outDir = parser.value(outDirOption).toStdString();
    }

    if (parser.isSet(formatOption)) {
        const auto value = parser.value(formatOption).toStdString();
        cli.format = infra::outputFormatFromString(value);
        if (!cli.format) {
            spdlog::error("--format must be one of: json, html, both (got '{}')", value);
            exitCode_ = 2;
            return false;
        }
    }

    if (parser.isSet(timeoutOption)) {
        bool ok = false;
        const int timeout = parser.value(timeoutOption).toInt(&ok);
        if (!ok || timeout < kMinTimeoutSeconds || timeout > kMaxTimeoutSeconds) {
            spdlog::error("--timeout must be an integer between {} and {}", kMinTimeoutSeconds,
                          kMaxTimeoutSeconds);
            exitCode_ = 2;
            return false;
        }
        cli.timeoutSeconds = timeout;
    }

    if (parser.isSet(nmapArgsOption)) {
        cli.nmapArgs = parser.value(nmapArgsOption).toStdString();
    }
    cli.noNmap = parser.isSet(noNmapOption);
    verbose_ = parser.isSet(verboseOption);

    if (parser.isSet(configOption)) {
        const auto path = parser.value(configOption).toStdString();
        if (!config_.load(path)) {
            spdlog::error("Failed to load config: {}", config_.lastError());
            exitCode_ = 2;
            return false;
        }
    }

    runtime_ = config_.resolve(cli);
    if (runtime_.targets.empty()) {
        spdlog::error("No target given on the command line or in the config file");
        exitCode_ = 2;
        return false;
    }

    return true;
}

void Application::initializeLogging() {
    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(verbose_ ? spdlog::level::debug : spdlog::level::info);

    std::vector<spdlog::sink_ptr> sinks{consoleSink};

    const auto logDir = runtime_.outDir / "logs";
    std::error_code ec;
    std::filesystem::create_directories(logDir, ec);
    const auto logPath = logDir / "reconpulse.log";
    if (ec) {
        spdlog::warn("Cannot create log directory {}: {}", logDir.string(), ec.message());
    } else {
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logPath.string(), 5 * 1024 * 1024, 3);
        fileSink->set_level(spdlog::level::debug);
        sinks.push_back(fileSink);
    }

    auto logger = std::make_shared<spdlog::logger>("reconpulse", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::debug);
    spdlog::set_default_logger(logger);

    spdlog::info("ReconPulse {} starting...", qtApp_->applicationVersion().toStdString());
    if (!ec) {
        spdlog::info("Log file: {}", logPath.string());
    }
}

void Application::initializeComponents() {
    asioContext_ = std::make_unique<infra::AsioContext>(
        std::max<size_t>(kMinWorkerThreads, std::thread::hardware_concurrency()));
    asioContext_->start();

    ProbeBackends backends;
    backends.dns = std::make_shared<infra::DnsResolver>();
    backends.http = std::make_shared<infra::HttpProber>(userAgent());
    backends.tls = std::make_shared<infra::TlsInspector>();

    if (runtime_.backend == infra::PortScanBackend::Connect) {
        backends.portScanner = std::make_shared<infra::ConnectScanner>();
    } else {
        auto nmap = std::make_shared<infra::NmapScanner>();
        if (runtime_.settings.nmap && !nmap->isAvailable()) {
            spdlog::warn("nmap not found in PATH; port scans will be reported as unavailable. "
                         "Set port_scanner.backend to \"connect\" to use the built-in scanner.");
        }
        backends.portScanner = std::move(nmap);
    }
    spdlog::debug("Port scan backend: {}", backends.portScanner->name());

    coordinator_ = std::make_unique<ProbeCoordinator>(*asioContext_, std::move(backends));

    signalContext_ = std::make_unique<infra::AsioContext>(1);
    signalContext_->start();
    signals_ = std::make_unique<asio::signal_set>(signalContext_->getContext(), SIGINT, SIGTERM);
    waitForSignal();

    spdlog::info("Application components initialized");
}

void Application::waitForSignal() {
    signals_->async_wait([this](const asio::error_code& ec, int signal) {
        if (ec) {
            return;
        }
        if (++signalsReceived_ > 1) {
            spdlog::critical("Received signal {} again, exiting immediately", signal);
            spdlog::default_logger()->flush();
            std::_Exit(130);
        }
        spdlog::warn("Received signal {}, stopping scan (repeat to exit immediately)", signal);
        coordinator_->cancel();
        waitForSignal();
    });
}

void Application::scanTarget(const std::string& target) {
    auto report = findingEngine_.annotate(coordinator_->scan(target, runtime_.settings));

    fmt::print("{}", formatConsoleSummary(report));

    infra::ReportWriter writer(runtime_.outDir);
    auto written = writer.write(report, runtime_.format);
    for (const auto& path : written) {
        spdlog::info("Report written: {}", path.string());
    }
}

int Application::run() {
    if (exitCode_) {
        return *exitCode_;
    }

    for (const auto& target : runtime_.targets) {
        if (coordinator_->isCancelled()) {
            spdlog::warn("Skipping remaining targets after cancellation");
            break;
        }
        scanTarget(target);
    }

    return coordinator_->isCancelled() ? 130 : 0;
}

} // namespace reconpulse::app
