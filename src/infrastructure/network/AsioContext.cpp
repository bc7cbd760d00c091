#include "infrastructure/network/AsioContext.hpp"

#include <spdlog/spdlog.h>

namespace netsweep::infra {

AsioContext::AsioContext(size_t threadCount) : threadCount_(threadCount > 0 ? threadCount : 1) {}

AsioContext::~AsioContext() {
    stop();
}

void AsioContext::start() {
    if (running_.exchange(true)) {
        return;
    }

    workGuard_.emplace(asio::make_work_guard(ioContext_));

    threads_.reserve(threadCount_);
    for (size_t i = 0; i < threadCount_; ++i) {
        threads_.emplace_back([this, i]() { runWorker(i); });
    }

    spdlog::debug("I/O pool started with {} threads", threadCount_);
}

void AsioContext::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    workGuard_.reset();
    ioContext_.stop();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    // Allows a later start() on the same context
    ioContext_.restart();
    spdlog::debug("I/O pool stopped");
}

// A handler that throws must not take a worker thread down with it; the
// probe that owned it is written off by its own deadline timer instead.
void AsioContext::runWorker(size_t index) {
    while (true) {
        try {
            ioContext_.run();
            return;
        } catch (const std::exception& e) {
            ++handlerFailures_;
            spdlog::error("I/O worker {}: handler failed: {}", index, e.what());
        }
    }
}

} // namespace netsweep::infra
