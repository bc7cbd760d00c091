#pragma once

#include "core/services/IDetailFetcher.hpp"
#include "core/services/ILivenessProbe.hpp"
#include "core/services/IPortProbe.hpp"
#include "core/types/Errors.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <asio.hpp>

#include <algorithm>
#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>

namespace netsweep::testing {

/**
 * @brief Liveness probe answering from a fixed set of live addresses.
 *
 * With a context and a delay, answers arrive asynchronously after the delay,
 * which lets tests observe how many probes overlap.
 */
class FakeLivenessProbe : public core::ILivenessProbe {
public:
    explicit FakeLivenessProbe(infra::AsioContext* context = nullptr,
                               std::chrono::milliseconds delay = std::chrono::milliseconds(0))
        : context_(context), delay_(delay) {}

    void probeAsync(const std::string& address, const std::vector<uint16_t>&,
                    std::chrono::milliseconds, LivenessCallback callback) override {
        ++calls_;
        std::function<void(const std::string&)> hook;
        bool fail = false;
        {
            std::lock_guard lock(mutex_);
            probed_.insert(address);
            hook = onProbe_;
            fail = throwFor_.count(address) != 0;
        }
        if (hook) {
            hook(address);
        }
        if (fail) {
            throw std::runtime_error("simulated liveness failure for " + address);
        }

        auto status = isLive(address) ? core::DeviceStatus::Up : core::DeviceStatus::Down;
        int now = ++inFlight_;
        int seen = maxInFlight_.load();
        while (now > seen && !maxInFlight_.compare_exchange_weak(seen, now)) {
        }

        if (context_ == nullptr || delay_.count() == 0) {
            --inFlight_;
            callback(status);
            return;
        }

        auto timer = std::make_shared<asio::steady_timer>(context_->getContext(), delay_);
        timer->async_wait([this, timer, status, callback](const asio::error_code&) {
            --inFlight_;
            callback(status);
        });
    }

    void setLive(std::set<std::string> addresses) {
        std::lock_guard lock(mutex_);
        live_ = std::move(addresses);
    }

    void throwFor(const std::string& address) {
        std::lock_guard lock(mutex_);
        throwFor_.insert(address);
    }

    void setOnProbe(std::function<void(const std::string&)> hook) {
        std::lock_guard lock(mutex_);
        onProbe_ = std::move(hook);
    }

    bool wasProbed(const std::string& address) const {
        std::lock_guard lock(mutex_);
        return probed_.count(address) != 0;
    }

    int calls() const { return calls_.load(); }
    int maxInFlight() const { return maxInFlight_.load(); }

private:
    bool isLive(const std::string& address) const {
        std::lock_guard lock(mutex_);
        return live_.count(address) != 0;
    }

    infra::AsioContext* context_;
    std::chrono::milliseconds delay_;
    mutable std::mutex mutex_;
    std::set<std::string> live_;
    std::set<std::string> throwFor_;
    std::set<std::string> probed_;
    std::function<void(const std::string&)> onProbe_;
    std::atomic<int> calls_{0};
    std::atomic<int> inFlight_{0};
    std::atomic<int> maxInFlight_{0};
};

/**
 * @brief Port probe returning preset open ports per address.
 *
 * Only ports that were actually requested are reported open.
 */
class FakePortProbe : public core::IPortProbe {
public:
    void probePortsAsync(const std::string& address, const std::vector<uint16_t>& ports,
                         std::chrono::milliseconds, PortsCallback callback) override {
        ++calls_;
        core::PortSet open;
        {
            std::lock_guard lock(mutex_);
            if (throwFor_.count(address) != 0) {
                throw std::runtime_error("simulated port probe failure for " + address);
            }
            if (silent_.count(address) != 0) {
                return;
            }
            auto it = open_.find(address);
            if (it != open_.end()) {
                for (uint16_t port : ports) {
                    if (it->second.count(port) != 0) {
                        open.insert(port);
                    }
                }
            }
        }
        callback(open);
    }

    void setOpen(const std::string& address, core::PortSet ports) {
        std::lock_guard lock(mutex_);
        open_[address] = std::move(ports);
    }

    void throwFor(const std::string& address) {
        std::lock_guard lock(mutex_);
        throwFor_.insert(address);
    }

    // Never answers for this address.
    void silenceFor(const std::string& address) {
        std::lock_guard lock(mutex_);
        silent_.insert(address);
    }

    int calls() const { return calls_.load(); }

private:
    std::mutex mutex_;
    std::map<std::string, core::PortSet> open_;
    std::set<std::string> throwFor_;
    std::set<std::string> silent_;
    std::atomic<int> calls_{0};
};

/**
 * @brief Detail fetcher returning preset detail, or failing for unknown addresses.
 */
class FakeDetailFetcher : public core::IDetailFetcher {
public:
    core::DeviceDetail fetch(const std::string& address) override {
        ++calls_;
        std::lock_guard lock(mutex_);
        if (brokenFor_.count(address) != 0) {
            throw std::runtime_error("backend exploded");
        }
        auto it = details_.find(address);
        if (it == details_.end()) {
            throw core::DetailUnavailableError(address, "no record");
        }
        return it->second;
    }

    void setDetail(const std::string& address, core::DeviceDetail detail) {
        std::lock_guard lock(mutex_);
        details_[address] = std::move(detail);
    }

    void breakFor(const std::string& address) {
        std::lock_guard lock(mutex_);
        brokenFor_.insert(address);
    }

    int calls() const { return calls_.load(); }

private:
    std::mutex mutex_;
    std::map<std::string, core::DeviceDetail> details_;
    std::set<std::string> brokenFor_;
    std::atomic<int> calls_{0};
};

} // namespace netsweep::testing
