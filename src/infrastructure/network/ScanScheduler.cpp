#include "infrastructure/network/ScanScheduler.hpp"

#include <spdlog/spdlog.h>

namespace netsweep::infra {

ScanScheduler::ScanScheduler(AsioContext& context, std::chrono::milliseconds interval,
                             ScanAction action)
    : context_(context), interval_(interval), action_(std::move(action)),
      timer_(std::make_shared<asio::steady_timer>(context.getContext())) {
    spdlog::debug("ScanScheduler initialized with interval {} ms", interval_.count());
}

ScanScheduler::~ScanScheduler() {
    stop();
}

void ScanScheduler::start(bool runImmediately) {
    if (running_.exchange(true)) {
        return;
    }

    spdlog::info("Scan scheduler started, interval {} s",
                 std::chrono::duration_cast<std::chrono::seconds>(interval()).count());

    if (runImmediately) {
        context_.post([this]() {
            if (running_) {
                trigger();
            }
        });
    }

    std::lock_guard lock(mutex_);
    scheduleNext();
}

void ScanScheduler::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    std::lock_guard lock(mutex_);
    timer_->cancel();
    nextRunAt_.reset();
    spdlog::info("Scan scheduler stopped");
}

void ScanScheduler::setInterval(std::chrono::milliseconds interval) {
    std::lock_guard lock(mutex_);
    interval_ = interval;
}

std::chrono::milliseconds ScanScheduler::interval() const {
    std::lock_guard lock(mutex_);
    return interval_;
}

std::optional<std::chrono::system_clock::time_point> ScanScheduler::nextRunAt() const {
    std::lock_guard lock(mutex_);
    return nextRunAt_;
}

// Caller holds mutex_.
void ScanScheduler::scheduleNext() {
    if (!running_) {
        return;
    }

    nextRunAt_ = std::chrono::system_clock::now() + interval_;
    timer_->expires_after(interval_);
    timer_->async_wait([this](const asio::error_code& ec) {
        if (ec || !running_) {
            return;
        }

        trigger();

        std::lock_guard lock(mutex_);
        scheduleNext();
    });
}

void ScanScheduler::trigger() {
    ++triggerCount_;
    spdlog::debug("Scheduled scan triggered ({})", triggerCount_.load());

    try {
        if (action_) {
            action_();
        }
    } catch (const std::exception& e) {
        spdlog::error("Scheduled scan failed to start: {}", e.what());
    }
}

} // namespace netsweep::infra
