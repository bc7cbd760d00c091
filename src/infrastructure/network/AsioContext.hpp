#pragma once

#include <asio.hpp>
#include <atomic>
#include <optional>
#include <thread>
#include <vector>

namespace netsweep::infra {

/**
 * @brief Owns an Asio I/O context and the worker threads that run it.
 *
 * All probe I/O (TCP connects, ICMP echo, reverse lookups and their deadline
 * timers) is driven by this context. An executor_work_guard keeps the context
 * running between scans until stop() is called.
 *
 * @note Non-copyable. Pass by reference to the components that need it.
 */
class AsioContext {
public:
    /**
     * @param threadCount Size of the I/O pool. Zero is treated as one.
     */
    explicit AsioContext(size_t threadCount = std::thread::hardware_concurrency());

    ~AsioContext();

    AsioContext(const AsioContext&) = delete;
    AsioContext& operator=(const AsioContext&) = delete;

    /**
     * @brief Starts the worker threads. Has no effect if already running.
     */
    void start();

    /**
     * @brief Halts the pool and joins every worker.
     *
     * Pending handlers are discarded; a later start() resumes with a fresh run.
     */
    void stop();

    [[nodiscard]] bool isRunning() const { return running_.load(); }

    [[nodiscard]] size_t threadCount() const { return threadCount_; }

    /**
     * @brief Number of handlers that exited with an exception since construction.
     */
    [[nodiscard]] size_t handlerFailures() const { return handlerFailures_.load(); }

    asio::io_context& getContext() { return ioContext_; }

    /// Queues @p handler on the pool.
    template <typename Handler>
    void post(Handler&& handler) {
        asio::post(ioContext_, std::forward<Handler>(handler));
    }

private:
    void runWorker(size_t index);

    using WorkGuard = asio::executor_work_guard<asio::io_context::executor_type>;

    asio::io_context ioContext_;
    std::optional<WorkGuard> workGuard_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    std::atomic<size_t> handlerFailures_{0};
    size_t threadCount_;
};

} // namespace netsweep::infra
