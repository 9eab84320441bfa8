#pragma once

#include "app/ProbeCoordinator.hpp"
#include "core/scan/FindingEngine.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <QCoreApplication>
#include <asio.hpp>
#include <memory>
#include <optional>
#include <string>

namespace reconpulse::app {

/**
 * @brief Command-line front end: parses options, runs scans and writes reports.
 */
class Application {
public:
    Application(int& argc, char** argv);
    ~Application();

    /**
     * @brief Scans every configured target in order.
     * @return Process exit code: 0 on success, 2 for usage errors, 130 if interrupted.
     */
    int run();

    static std::string userAgent();

private:
    bool parseCommandLine();
    void initializeLogging();
    void initializeComponents();
    void scanTarget(const std::string& target);
    void waitForSignal();

    std::unique_ptr<QCoreApplication> qtApp_;
    infra::ConfigManager config_;
    infra::RuntimeConfig runtime_;
    bool verbose_{false};
    std::optional<int> exitCode_;

    std::unique_ptr<infra::AsioContext> asioContext_;
    // Signals are serviced on their own thread so a pool busy with blocking
    // probes cannot delay cancellation.
    std::unique_ptr<infra::AsioContext> signalContext_;
    std::unique_ptr<asio::signal_set> signals_;
    int signalsReceived_{0};
    std::unique_ptr<ProbeCoordinator> coordinator_;
    core::FindingEngine findingEngine_;
};

} // namespace reconpulse::app
