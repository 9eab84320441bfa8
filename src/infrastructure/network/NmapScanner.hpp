#pragma once

#include "core/services/IPortScanner.hpp"

#include <atomic>
#include <string>

namespace reconpulse::infra {

/**
 * @brief Port scanner backed by the nmap executable.
 *
 * Runs "nmap <args> <target>" as a child process with a hard timeout and
 * parses the service table from its stdout. cancel() kills the child within
 * one poll interval.
 */
class NmapScanner : public core::IPortScanner {
public:
    /**
     * @brief Constructs a scanner.
     * @param executable Program name looked up on PATH, or an absolute path.
     */
    explicit NmapScanner(std::string executable = "nmap");

    core::PortScanResult scan(const std::string& target, std::chrono::seconds timeout,
                              const std::string& args) override;

    void cancel() override;

    std::string name() const override { return "nmap"; }

    /**
     * @brief Checks whether the executable can be found.
     */
    bool isAvailable() const;

private:
    std::string executable_;
    std::atomic<bool> cancelled_{false};
};

} // namespace reconpulse::infra
