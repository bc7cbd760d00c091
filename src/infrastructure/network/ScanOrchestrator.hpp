#pragma once

#include "core/classification/Classifier.hpp"
#include "core/inventory/DeviceInventory.hpp"
#include "core/services/ILivenessProbe.hpp"
#include "core/services/IPortProbe.hpp"
#include "core/types/ScanResult.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <asio.hpp>
#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <semaphore>
#include <set>
#include <string>
#include <vector>

namespace netsweep::infra {

/**
 * @brief Runs scan passes over a CIDR range and applies them to the inventory.
 *
 * Each address is probed for liveness and, if Up, for open ports; the result
 * is classified and collected. At most concurrencyLimit addresses are in
 * flight at once. A failing or hanging address is recorded as Down and never
 * aborts the pass. Scan passes are serialized in the order their ids were
 * reserved, so at most one result is being applied to the inventory at any
 * time and a newer id never overtakes an older one.
 *
 * The AsioContext should outlive every pass. A pass whose context is stopped
 * midway returns early, flagged cancelled, with the unresolved addresses left out.
 */
class ScanOrchestrator {
public:
    /**
     * @brief Callback receiving the inventory changes of an applied scan.
     */
    using ChangeCallback =
        std::function<void(uint64_t scanId, const std::vector<core::InventoryChange>& changes)>;

    /**
     * @brief Constructs the orchestrator. All references must outlive it.
     */
    ScanOrchestrator(AsioContext& context, core::ILivenessProbe& livenessProbe,
                     core::IPortProbe& portProbe, const core::Classifier& classifier,
                     core::DeviceInventory& inventory);

    ScanOrchestrator(const ScanOrchestrator&) = delete;
    ScanOrchestrator& operator=(const ScanOrchestrator&) = delete;

    /**
     * @brief Reserves the generation id for a scan that will run later.
     *
     * Every reserved id must be passed to runScan() or to releaseScanId(),
     * otherwise later passes wait for it indefinitely.
     */
    uint64_t reserveScanId();

    /**
     * @brief Gives up a reserved id that will never run, so later passes proceed.
     */
    void releaseScanId(uint64_t scanId);

    /**
     * @brief Runs a complete scan pass with a freshly reserved generation id.
     * @see runScan(uint64_t, const std::string&, const core::ScanConfig&, core::CancellationToken)
     */
    core::ScanResult runScan(const std::string& cidr, const core::ScanConfig& config,
                             core::CancellationToken cancel = {});

    /**
     * @brief Runs a complete scan pass and applies it to the inventory.
     *
     * Blocks until every pass with a lower reserved id has finished.
     * Configuration and range errors are raised before any network I/O.
     * On cancellation no new addresses are dispatched, probes already in
     * flight finish on their own deadlines, and the partial result is still
     * applied.
     *
     * @param scanId Generation id obtained from reserveScanId().
     * @param cidr IPv4 CIDR block to scan.
     * @param config Scan parameters.
     * @param cancel Cancellation token checked before each dispatch.
     * @return The result that was handed to the inventory, with
     *         ScanResult::applied telling whether the inventory took it.
     * @throws core::InvalidConfigError, core::InvalidRangeError
     */
    core::ScanResult runScan(uint64_t scanId, const std::string& cidr,
                             const core::ScanConfig& config, core::CancellationToken cancel = {});

    [[nodiscard]] bool isScanning() const { return scanning_.load(); }

    void setChangeCallback(ChangeCallback callback);

private:
    // State shared by the dispatch loop and the completion handlers of one pass.
    struct PassState {
        PassState(uint64_t id, core::ScanConfig cfg)
            : scanId(id), config(std::move(cfg)), ports(config.portsToCheck),
              slots(config.concurrencyLimit) {}

        uint64_t scanId;
        core::ScanConfig config;
        std::vector<uint16_t> ports;
        std::counting_semaphore<> slots;
        std::mutex mutex;
        std::condition_variable idle;
        size_t inFlight{0};
        std::map<std::string, core::Device, core::AddressLess> observed;
    };

    // done is set once the address has an outcome; slotReleased once its
    // concurrency slot is returned, which can be later.
    struct AddressTask {
        std::string address;
        std::atomic<bool> done{false};
        std::atomic<bool> slotReleased{false};
        std::mutex timerMutex;
        std::shared_ptr<asio::steady_timer> watchdog;
    };

    void waitForTurn(uint64_t scanId);
    void endTurn(uint64_t scanId);
    void advanceTurn();

    void dispatchAddress(const std::shared_ptr<PassState>& pass, const std::string& address);
    void probeFinished(const std::shared_ptr<PassState>& pass,
                       const std::shared_ptr<AddressTask>& task, const core::PortSet* openPorts);
    void completeAddress(const std::shared_ptr<PassState>& pass,
                         const std::shared_ptr<AddressTask>& task, const core::PortSet* openPorts);
    static bool releaseSlot(const std::shared_ptr<PassState>& pass,
                            const std::shared_ptr<AddressTask>& task);

    AsioContext& context_;
    core::ILivenessProbe& livenessProbe_;
    core::IPortProbe& portProbe_;
    const core::Classifier& classifier_;
    core::DeviceInventory& inventory_;

    std::mutex scanMutex_;
    std::atomic<bool> scanning_{false};

    std::mutex turnMutex_;
    std::condition_variable turnChanged_;
    uint64_t lastScanId_;
    uint64_t nextTurn_;
    std::set<uint64_t> released_;

    std::mutex callbackMutex_;
    ChangeCallback changeCallback_;
};

} // namespace netsweep::infra
