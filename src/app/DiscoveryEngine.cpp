#include "app/DiscoveryEngine.hpp"

#include "core/types/CidrRange.hpp"
#include "core/types/Errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <system_error>

namespace netsweep::app {

DiscoveryEngine::DiscoveryEngine(infra::AsioContext& context, core::ILivenessProbe& livenessProbe,
                                 core::IPortProbe& portProbe, core::IDetailFetcher* detailFetcher,
                                 const core::ClassifierConfig& classification)
    : detailFetcher_(detailFetcher), classifier_(classification), inventory_(classifier_),
      orchestrator_(context, livenessProbe, portProbe, classifier_, inventory_) {}

DiscoveryEngine::~DiscoveryEngine() {
    std::vector<ScanHandle> pending;
    {
        std::lock_guard lock(pendingMutex_);
        pending.swap(pending_);
    }

    for (auto& handle : pending) {
        handle.cancellation.cancel();
    }
    for (auto& handle : pending) {
        if (handle.result.valid()) {
            handle.result.wait();
        }
    }
}

ScanHandle DiscoveryEngine::startScan(const std::string& cidr, const core::ScanConfig& config) {
    config.validate();
    core::CidrRange::parse(cidr);

    ScanHandle handle;
    handle.scanId = orchestrator_.reserveScanId();

    auto cancellation = handle.cancellation;
    auto scanId = handle.scanId;
    try {
        handle.result = std::async(std::launch::async,
                                   [this, scanId, cidr, config, cancellation]() {
                                       return orchestrator_.runScan(scanId, cidr, config,
                                                                    cancellation);
                                   })
                            .share();
    } catch (const std::system_error& e) {
        spdlog::error("Could not start scan {}: {}", scanId, e.what());
        orchestrator_.releaseScanId(scanId);
        throw;
    }

    spdlog::info("Queued scan {} of {}", handle.scanId, cidr);

    std::lock_guard lock(pendingMutex_);
    pruneFinished();
    pending_.push_back(handle);
    return handle;
}

core::ScanResult DiscoveryEngine::runScan(const std::string& cidr, const core::ScanConfig& config) {
    return orchestrator_.runScan(cidr, config);
}

void DiscoveryEngine::cancelScans() {
    std::lock_guard lock(pendingMutex_);
    for (auto& handle : pending_) {
        if (!handle.ready()) {
            spdlog::info("Cancelling scan {}", handle.scanId);
            handle.cancellation.cancel();
        }
    }
}

// Caller holds pendingMutex_.
void DiscoveryEngine::pruneFinished() {
    std::erase_if(pending_, [](const ScanHandle& handle) { return handle.ready(); });
}

core::DeviceDetail DiscoveryEngine::getDeviceDetail(const std::string& address, bool refresh) {
    auto device = inventory_.get(address);
    if (!device) {
        throw core::DeviceNotFoundError(address);
    }

    if (!refresh && device->detail) {
        return *device->detail;
    }

    if (detailFetcher_ == nullptr) {
        throw core::DetailUnavailableError(address, "no detail source configured");
    }

    core::DeviceDetail detail;
    try {
        detail = detailFetcher_->fetch(address);
    } catch (const core::DetailUnavailableError& e) {
        spdlog::warn("{}", e.what());
        throw;
    } catch (const std::exception& e) {
        spdlog::warn("Detail fetch for {} failed: {}", address, e.what());
        throw core::DetailUnavailableError(address, e.what());
    }

    if (!inventory_.attachDetail(*device, detail)) {
        spdlog::debug("Detail for {} not cached, device changed during fetch", address);
    }
    return detail;
}

void DiscoveryEngine::setChangeCallback(infra::ScanOrchestrator::ChangeCallback callback) {
    orchestrator_.setChangeCallback(std::move(callback));
}

} // namespace netsweep::app
