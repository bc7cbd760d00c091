#include "infrastructure/network/ScanOrchestrator.hpp"

#include "core/types/CidrRange.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

namespace netsweep::infra {

namespace {

// Extra time granted to a probe chain beyond its own deadlines before the
// address is written off.
constexpr auto WATCHDOG_GRACE = std::chrono::milliseconds(500);
constexpr auto DISPATCH_POLL = std::chrono::milliseconds(50);

// Clears the scanning flag when a pass ends, including by exception.
class ScanningGuard {
public:
    explicit ScanningGuard(std::atomic<bool>& flag) : flag_(flag) { flag_ = true; }
    ~ScanningGuard() { flag_ = false; }

    ScanningGuard(const ScanningGuard&) = delete;
    ScanningGuard& operator=(const ScanningGuard&) = delete;

private:
    std::atomic<bool>& flag_;
};

} // namespace

ScanOrchestrator::ScanOrchestrator(AsioContext& context, core::ILivenessProbe& livenessProbe,
                                   core::IPortProbe& portProbe, const core::Classifier& classifier,
                                   core::DeviceInventory& inventory)
    : context_(context), livenessProbe_(livenessProbe), portProbe_(portProbe),
      classifier_(classifier), inventory_(inventory), lastScanId_(inventory.latestScanId()),
      nextTurn_(lastScanId_ + 1) {}

uint64_t ScanOrchestrator::reserveScanId() {
    std::lock_guard lock(turnMutex_);
    return ++lastScanId_;
}

void ScanOrchestrator::releaseScanId(uint64_t scanId) {
    std::lock_guard lock(turnMutex_);
    if (scanId < nextTurn_) {
        return;
    }
    released_.insert(scanId);
    advanceTurn();
    turnChanged_.notify_all();
}

void ScanOrchestrator::waitForTurn(uint64_t scanId) {
    std::unique_lock lock(turnMutex_);
    turnChanged_.wait(lock, [this, scanId]() { return scanId <= nextTurn_; });
}

void ScanOrchestrator::endTurn(uint64_t scanId) {
    std::lock_guard lock(turnMutex_);
    if (scanId >= nextTurn_) {
        nextTurn_ = scanId + 1;
        advanceTurn();
    }
    turnChanged_.notify_all();
}

// Caller holds turnMutex_.
void ScanOrchestrator::advanceTurn() {
    while (released_.erase(nextTurn_) != 0) {
        ++nextTurn_;
    }
}

void ScanOrchestrator::setChangeCallback(ChangeCallback callback) {
    std::lock_guard lock(callbackMutex_);
    changeCallback_ = std::move(callback);
}

core::ScanResult ScanOrchestrator::runScan(const std::string& cidr, const core::ScanConfig& config,
                                           core::CancellationToken cancel) {
    config.validate();
    core::CidrRange::parse(cidr);
    return runScan(reserveScanId(), cidr, config, std::move(cancel));
}

core::ScanResult ScanOrchestrator::runScan(uint64_t scanId, const std::string& cidr,
                                           const core::ScanConfig& config,
                                           core::CancellationToken cancel) {
    // Passes run in the order their ids were reserved. The turn is handed on
    // however this pass ends, including by a validation error.
    waitForTurn(scanId);
    struct TurnRelease {
        ScanOrchestrator& self;
        uint64_t id;
        ~TurnRelease() { self.endTurn(id); }
    } turn{*this, scanId};

    config.validate();
    auto range = core::CidrRange::parse(cidr);

    std::lock_guard scanLock(scanMutex_);
    ScanningGuard guard(scanning_);

    if (!context_.isRunning()) {
        spdlog::warn("AsioContext was not running, starting it for scan {}", scanId);
        context_.start();
    }

    spdlog::info("Starting scan {} of {} ({} addresses, concurrency {})", scanId,
                 range.toString(), range.size(), config.concurrencyLimit);

    core::ScanResult result;
    result.scanId = scanId;
    result.startedAt = std::chrono::system_clock::now();

    auto known = inventory_.list();
    auto pass = std::make_shared<PassState>(scanId, config);

    for (const auto& address : range) {
        if (cancel.isCancelled()) {
            result.cancelled = true;
            break;
        }

        bool acquired = false;
        while (!(acquired = pass->slots.try_acquire_for(DISPATCH_POLL))) {
            if (cancel.isCancelled() || !context_.isRunning()) {
                break;
            }
        }
        if (!acquired) {
            result.cancelled = true;
            break;
        }

        {
            std::lock_guard lock(pass->mutex);
            ++pass->inFlight;
        }
        ++result.addressesProbed;
        dispatchAddress(pass, address);
    }

    {
        std::unique_lock lock(pass->mutex);
        auto drained = [&pass]() { return pass->inFlight == 0; };
        while (!pass->idle.wait_for(lock, DISPATCH_POLL, drained)) {
            // A stopped context never runs the outstanding completions or watchdogs.
            if (!context_.isRunning()) {
                spdlog::warn("I/O context stopped during scan {}, {} addresses left unresolved",
                             scanId, pass->inFlight);
                result.cancelled = true;
                break;
            }
        }
    }

    if (result.cancelled) {
        spdlog::info("Scan {} cancelled after dispatching {} of {} addresses", scanId,
                     result.addressesProbed, range.size());
    }

    std::set<std::string, core::AddressLess> seenUp;
    {
        std::lock_guard lock(pass->mutex);
        for (auto& [address, device] : pass->observed) {
            seenUp.insert(address);
            result.devices.push_back(device);
        }
    }

    // Known devices not seen Up in this pass are reported Down with their
    // previous generation, so the merge never loses them.
    for (auto& device : known) {
        if (seenUp.count(device.address) != 0) {
            continue;
        }
        device.markDown();
        device.detail.reset();
        device.role = classifier_.classify(device.openPorts, device.detail);
        result.devices.push_back(std::move(device));
    }

    std::sort(result.devices.begin(), result.devices.end(),
              [](const core::Device& a, const core::Device& b) {
                  return core::addressLess(a.address, b.address);
              });

    result.finishedAt = std::chrono::system_clock::now();

    spdlog::info("Scan {} complete: {} of {} probed addresses up in {} ms", scanId,
                 result.upCount(), result.addressesProbed, result.duration().count());

    auto changes = inventory_.applyScanResult(result);
    result.applied = inventory_.latestScanId() == scanId;

    ChangeCallback callback;
    {
        std::lock_guard lock(callbackMutex_);
        callback = changeCallback_;
    }
    if (callback && !changes.empty()) {
        callback(scanId, changes);
    }

    return result;
}

void ScanOrchestrator::dispatchAddress(const std::shared_ptr<PassState>& pass,
                                       const std::string& address) {
    auto task = std::make_shared<AddressTask>();
    task->address = address;
    task->watchdog = std::make_shared<asio::steady_timer>(context_.getContext());

    const auto& config = pass->config;
    const auto budget = config.livenessTimeout + config.portTimeout + WATCHDOG_GRACE;
    {
        std::lock_guard lock(task->timerMutex);
        task->watchdog->expires_after(budget);
        task->watchdog->async_wait([this, pass, task, budget](const asio::error_code& ec) {
            if (ec == asio::error::operation_aborted) {
                return;
            }
            if (!task->done) {
                spdlog::debug("Probe of {} overran its deadline, marking Down", task->address);
            }
            completeAddress(pass, task, nullptr);

            // The probe may still hold sockets, so its slot is kept until the
            // probe returns or a second budget has passed.
            std::lock_guard lock(task->timerMutex);
            if (task->slotReleased) {
                return;
            }
            task->watchdog->expires_after(budget);
            task->watchdog->async_wait([pass, task](const asio::error_code& reclaimEc) {
                if (reclaimEc == asio::error::operation_aborted) {
                    return;
                }
                if (releaseSlot(pass, task)) {
                    spdlog::warn("Probe of {} never returned, reclaiming its slot",
                                 task->address);
                }
            });
        });
    }

    try {
        livenessProbe_.probeAsync(
            address, pass->ports, config.livenessTimeout,
            [this, pass, task](core::DeviceStatus status) {
                if (status != core::DeviceStatus::Up || task->done) {
                    probeFinished(pass, task, nullptr);
                    return;
                }

                try {
                    portProbe_.probePortsAsync(task->address, pass->ports, pass->config.portTimeout,
                                               [this, pass, task](const core::PortSet& open) {
                                                   probeFinished(pass, task, &open);
                                               });
                } catch (const std::exception& e) {
                    spdlog::debug("Port probe of {} failed: {}", task->address, e.what());
                    probeFinished(pass, task, nullptr);
                }
            });
    } catch (const std::exception& e) {
        spdlog::debug("Liveness probe of {} failed: {}", address, e.what());
        probeFinished(pass, task, nullptr);
    }
}

void ScanOrchestrator::probeFinished(const std::shared_ptr<PassState>& pass,
                                     const std::shared_ptr<AddressTask>& task,
                                     const core::PortSet* openPorts) {
    completeAddress(pass, task, openPorts);
    {
        std::lock_guard lock(task->timerMutex);
        task->watchdog->cancel();
    }
    releaseSlot(pass, task);
}

bool ScanOrchestrator::releaseSlot(const std::shared_ptr<PassState>& pass,
                                   const std::shared_ptr<AddressTask>& task) {
    if (task->slotReleased.exchange(true)) {
        return false;
    }
    pass->slots.release();
    return true;
}

void ScanOrchestrator::completeAddress(const std::shared_ptr<PassState>& pass,
                                       const std::shared_ptr<AddressTask>& task,
                                       const core::PortSet* openPorts) {
    if (task->done.exchange(true)) {
        return;
    }

    std::optional<core::Device> device;
    if (openPorts != nullptr) {
        try {
            core::Device up;
            up.address = task->address;
            up.status = core::DeviceStatus::Up;
            up.openPorts = *openPorts;
            up.concerningPorts = core::intersectPorts(*openPorts, pass->config.concerningPorts);
            up.role = classifier_.classify(up.openPorts, std::nullopt);
            up.lastSeenScanId = pass->scanId;
            up.lastSeen = std::chrono::system_clock::now();
            device = std::move(up);
        } catch (const std::exception& e) {
            spdlog::warn("Classification of {} failed, recording as Down: {}", task->address,
                         e.what());
        }
    }

    {
        std::lock_guard lock(pass->mutex);
        if (device) {
            pass->observed.insert_or_assign(task->address, std::move(*device));
        }
        --pass->inFlight;
    }
    pass->idle.notify_all();
}

} // namespace netsweep::infra
