#pragma once

#include "core/classification/Classifier.hpp"
#include "core/inventory/DeviceInventory.hpp"
#include "core/services/IDetailFetcher.hpp"
#include "core/services/ILivenessProbe.hpp"
#include "core/services/IPortProbe.hpp"
#include "core/types/ScanResult.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/network/ScanOrchestrator.hpp"

#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace netsweep::app {

/**
 * @brief Handle to a scan started with DiscoveryEngine::startScan().
 */
struct ScanHandle {
    uint64_t scanId{0};                           ///< Generation id of the scan
    std::shared_future<core::ScanResult> result;  ///< Completes when the result is applied
    core::CancellationToken cancellation;         ///< Cancels this scan only

    /**
     * @brief Checks whether the scan has finished, without blocking.
     */
    [[nodiscard]] bool ready() const {
        return result.valid() &&
               result.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }
};

/**
 * @brief Query and control surface of the discovery engine.
 *
 * Owns the classifier, the inventory and the orchestrator; the probes and the
 * detail fetcher are supplied by the caller so they can be replaced in tests.
 * This is the interface a serving layer consumes.
 */
class DiscoveryEngine {
public:
    /**
     * @brief Constructs the engine. Referenced objects must outlive it.
     * @param context AsioContext driving probe I/O.
     * @param livenessProbe Liveness probe implementation.
     * @param portProbe Port probe implementation.
     * @param detailFetcher Detail source, or nullptr to disable detail retrieval.
     * @param classification Port sets and hints for the default rule table.
     */
    DiscoveryEngine(infra::AsioContext& context, core::ILivenessProbe& livenessProbe,
                    core::IPortProbe& portProbe, core::IDetailFetcher* detailFetcher,
                    const core::ClassifierConfig& classification = {});

    /**
     * @brief Destructor. Cancels outstanding scans and waits for them.
     */
    ~DiscoveryEngine();

    DiscoveryEngine(const DiscoveryEngine&) = delete;
    DiscoveryEngine& operator=(const DiscoveryEngine&) = delete;

    /**
     * @brief Starts a scan in the background.
     *
     * The configuration and range are checked before returning, so invalid
     * input is reported to the caller directly. Scans run one at a time in
     * the order they were started.
     *
     * @throws core::InvalidConfigError, core::InvalidRangeError
     */
    ScanHandle startScan(const std::string& cidr, const core::ScanConfig& config);

    /**
     * @brief Runs a scan on the calling thread and returns its result.
     * @throws core::InvalidConfigError, core::InvalidRangeError
     */
    core::ScanResult runScan(const std::string& cidr, const core::ScanConfig& config);

    /**
     * @brief Cancels every scan started with startScan() that is still pending.
     */
    void cancelScans();

    [[nodiscard]] bool isScanning() const { return orchestrator_.isScanning(); }

    [[nodiscard]] std::vector<core::Device> listDevices() const { return inventory_.list(); }

    [[nodiscard]] std::optional<core::Device> getDevice(const std::string& address) const {
        return inventory_.get(address);
    }

    /**
     * @brief Returns extended attributes for a device.
     *
     * Cached detail is returned unless refresh is requested. A successful
     * fetch is cached on the device; a failed one leaves it untouched.
     *
     * @param address Address of a device in the inventory.
     * @param refresh Fetch even if detail is cached.
     * @throws core::DeviceNotFoundError if the address is not in the inventory.
     * @throws core::DetailUnavailableError if the fetch fails.
     */
    core::DeviceDetail getDeviceDetail(const std::string& address, bool refresh = false);

    /**
     * @brief Registers a callback for inventory changes after each scan.
     */
    void setChangeCallback(infra::ScanOrchestrator::ChangeCallback callback);

    core::DeviceInventory& inventory() { return inventory_; }
    const core::Classifier& classifier() const { return classifier_; }

private:
    void pruneFinished();

    core::IDetailFetcher* detailFetcher_;
    core::Classifier classifier_;
    core::DeviceInventory inventory_;
    infra::ScanOrchestrator orchestrator_;

    std::mutex pendingMutex_;
    std::vector<ScanHandle> pending_;
};

} // namespace netsweep::app
