#include "infrastructure/network/NmapScanner.hpp"

#include "core/types/ScanSettings.hpp"

#include <QFileInfo>
#include <QProcess>
#include <QStandardPaths>
#include <QStringList>
#include <spdlog/spdlog.h>

#include <utility>

namespace reconpulse::infra {

namespace {

constexpr int kStartTimeoutMs = 5000;
constexpr int kKillGraceMs = 2000;
constexpr int kPollSliceMs = 100;

QString locate(const std::string& executable) {
    auto name = QString::fromStdString(executable);
    if (name.contains('/')) {
        return QFileInfo(name).isExecutable() ? name : QString();
    }
    return QStandardPaths::findExecutable(name);
}

} // namespace

NmapScanner::NmapScanner(std::string executable) : executable_(std::move(executable)) {}

void NmapScanner::cancel() {
    if (!cancelled_.exchange(true)) {
        spdlog::info("Cancelling {} port scans", executable_);
    }
}

bool NmapScanner::isAvailable() const {
    return !locate(executable_).isEmpty();
}

core::PortScanResult NmapScanner::scan(const std::string& target, std::chrono::seconds timeout,
                                       const std::string& args) {
    core::PortScanResult result;

    auto program = locate(executable_);
    if (program.isEmpty()) {
        result.available = false;
        result.error = executable_ + " is not installed or not in PATH.";
        spdlog::warn("Port scan skipped: {}", *result.error);
        return result;
    }

    result.available = true;
    const std::string effectiveArgs = args.empty() ? core::kDefaultNmapArgs : args;
    QStringList arguments = QProcess::splitCommand(QString::fromStdString(effectiveArgs));
    arguments << QString::fromStdString(target);
    result.command = executable_ + " " + arguments.join(' ').toStdString();

    spdlog::info("Running {}", *result.command);

    if (cancelled_) {
        result.error = executable_ + " scan cancelled";
        return result;
    }

    QProcess process;
    process.start(program, arguments);
    if (!process.waitForStarted(kStartTimeoutMs)) {
        result.error = "failed to start " + executable_ + ": " +
                       process.errorString().toStdString();
        spdlog::error("Port scan failed: {}", *result.error);
        return result;
    }

    auto terminate = [this, &process]() {
        process.kill();
        if (!process.waitForFinished(kKillGraceMs)) {
            spdlog::warn("{} did not exit after kill", executable_);
        }
    };

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!process.waitForFinished(kPollSliceMs)) {
        if (process.state() == QProcess::NotRunning) {
            break;
        }
        if (cancelled_) {
            terminate();
            result.error = executable_ + " scan cancelled";
            spdlog::warn("Port scan of {} cancelled", target);
            return result;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            terminate();
            result.error = executable_ + " timed out after " + std::to_string(timeout.count()) +
                           " seconds";
            spdlog::warn("Port scan of {} timed out", target);
            return result;
        }
    }

    result.stdoutText = process.readAllStandardOutput().toStdString();
    result.stderrText = process.readAllStandardError().toStdString();
    result.services = core::PortScanResult::parseServiceLines(result.stdoutText);

    if (process.exitStatus() == QProcess::CrashExit) {
        result.error = executable_ + " terminated abnormally";
    } else if (process.exitCode() != 0) {
        result.error = executable_ + " exited with code " + std::to_string(process.exitCode());
    }

    if (result.error) {
        spdlog::warn("Port scan of {}: {}", target, *result.error);
    }
    spdlog::info("Port scan of {} complete: {} open services", target, result.services.size());
    return result;
}

} // namespace reconpulse::infra
