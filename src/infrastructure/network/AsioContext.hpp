#pragma once

#include <asio.hpp>
#include <atomic>
#include <exception>
#include <future>
#include <memory>
#include <optional>
#include <thread>
#include <type_traits>
#include <vector>

namespace reconpulse::infra {

/**
 * @brief Worker pool for blocking probe calls, built on an Asio I/O context.
 *
 * Probes submitted here run on the worker threads; the caller keeps a future
 * and may stop waiting on it at any time. A task whose future was abandoned
 * still runs to completion on its worker and its result is dropped.
 * inFlight() counts submitted tasks that have not finished yet, including
 * abandoned ones.
 *
 * @note This class is non-copyable.
 */
class AsioContext {
public:
    /**
     * @brief Constructs a pool.
     * @param threadCount Number of worker threads (at least one).
     */
    explicit AsioContext(size_t threadCount = std::thread::hardware_concurrency());

    /**
     * @brief Stops the pool. Blocks until running probes return.
     */
    ~AsioContext();

    AsioContext(const AsioContext&) = delete;
    AsioContext& operator=(const AsioContext&) = delete;

    /// Starts the worker threads. No effect if already running.
    void start();

    /// Joins the workers once running tasks return. Queued tasks wait for the next start().
    void stop();

    bool isRunning() const { return running_.load(); }
    size_t threadCount() const { return threadCount_; }
    size_t inFlight() const { return inFlight_.load(); }

    asio::io_context& getContext() { return ioContext_; }

    template <typename Handler>
    void post(Handler&& handler) {
        asio::post(ioContext_, std::forward<Handler>(handler));
    }

    /**
     * @brief Runs a callable on the pool and returns a future for its result.
     *
     * Exceptions thrown by the callable are delivered through the future. Tasks
     * still queued when the pool is destroyed report broken_promise.
     */
    template <typename Fn>
    auto submit(Fn&& fn) -> std::future<std::invoke_result_t<std::decay_t<Fn>>> {
        using Result = std::invoke_result_t<std::decay_t<Fn>>;
        auto promise = std::make_shared<std::promise<Result>>();
        auto future = promise->get_future();

        ++inFlight_;
        post([this, promise, fn = std::forward<Fn>(fn)]() mutable {
            try {
                if constexpr (std::is_void_v<Result>) {
                    fn();
                    promise->set_value();
                } else {
                    promise->set_value(fn());
                }
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
            --inFlight_;
        });

        return future;
    }

private:
    void workerLoop(size_t index);

    using WorkGuard = asio::executor_work_guard<asio::io_context::executor_type>;

    asio::io_context ioContext_;
    std::optional<WorkGuard> workGuard_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    std::atomic<size_t> inFlight_{0};
    size_t threadCount_;
};

} // namespace reconpulse::infra
