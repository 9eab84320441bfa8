#include "infrastructure/network/AsioContext.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace reconpulse::infra {

AsioContext::AsioContext(size_t threadCount) : threadCount_(std::max<size_t>(threadCount, 1)) {}

AsioContext::~AsioContext() {
    stop();
}

void AsioContext::workerLoop(size_t index) {
    spdlog::debug("Probe worker {} started", index);
    // A handler that throws unwinds out of run(); resume so the pool keeps its size.
    while (true) {
        try {
            ioContext_.run();
            break;
        } catch (const std::exception& e) {
            spdlog::error("Probe worker {} caught an unhandled exception: {}", index, e.what());
        }
    }
    spdlog::debug("Probe worker {} stopped", index);
}

void AsioContext::start() {
    if (running_.exchange(true)) {
        return;
    }

    ioContext_.restart();
    workGuard_.emplace(asio::make_work_guard(ioContext_));

    threads_.reserve(threadCount_);
    for (size_t i = 0; i < threadCount_; ++i) {
        threads_.emplace_back(&AsioContext::workerLoop, this, i);
    }

    spdlog::debug("Probe pool started with {} workers", threadCount_);
}

void AsioContext::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    if (auto pending = inFlight_.load(); pending > 0) {
        spdlog::warn("Stopping probe pool with {} probe(s) still pending; waiting for running "
                     "probes to return",
                     pending);
    }

    workGuard_.reset();
    ioContext_.stop();
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
    spdlog::debug("Probe pool stopped");
}

} // namespace reconpulse::infra
