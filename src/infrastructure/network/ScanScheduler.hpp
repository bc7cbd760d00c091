#pragma once

#include "infrastructure/network/AsioContext.hpp"

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

namespace netsweep::infra {

/**
 * @brief Triggers a scan action periodically.
 *
 * The action is invoked from an I/O thread and must not block; it is expected
 * to hand the scan off (e.g. DiscoveryEngine::startScan). Ticks that fire while
 * the previous scan is still running are left to the action to skip.
 */
class ScanScheduler {
public:
    using ScanAction = std::function<void()>;

    /**
     * @brief Constructs a stopped scheduler.
     * @param context AsioContext that runs the timer.
     * @param interval Time between two triggers.
     * @param action Function invoked on every trigger.
     */
    ScanScheduler(AsioContext& context, std::chrono::milliseconds interval, ScanAction action);

    /**
     * @brief Destructor. Stops the scheduler.
     */
    ~ScanScheduler();

    ScanScheduler(const ScanScheduler&) = delete;
    ScanScheduler& operator=(const ScanScheduler&) = delete;

    /**
     * @brief Starts periodic triggering.
     * @param runImmediately Whether to trigger once right away.
     */
    void start(bool runImmediately = true);

    void stop();

    [[nodiscard]] bool isRunning() const { return running_.load(); }

    /**
     * @brief Changes the interval; takes effect from the next scheduling.
     */
    void setInterval(std::chrono::milliseconds interval);

    [[nodiscard]] std::chrono::milliseconds interval() const;

    [[nodiscard]] std::optional<std::chrono::system_clock::time_point> nextRunAt() const;

    /**
     * @brief Number of times the action has been triggered since construction.
     */
    [[nodiscard]] size_t triggerCount() const { return triggerCount_.load(); }

private:
    void scheduleNext();
    void trigger();

    AsioContext& context_;
    std::chrono::milliseconds interval_;
    ScanAction action_;
    std::shared_ptr<asio::steady_timer> timer_;
    std::optional<std::chrono::system_clock::time_point> nextRunAt_;
    mutable std::mutex mutex_;
    std::atomic<bool> running_{false};
    std::atomic<size_t> triggerCount_{0};
};

} // namespace netsweep::infra
