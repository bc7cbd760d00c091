/**
 * @file DeviceInventory.hpp
 * @brief Reconciled store of discovered devices.
 *
 * The inventory is the only shared mutable state of the discovery engine.
 * Readers always observe a complete snapshot; each scan result is merged into
 * a private copy that replaces the published snapshot in one step.
 */

#pragma once

#include "core/classification/Classifier.hpp"
#include "core/types/CidrRange.hpp"
#include "core/types/Device.hpp"
#include "core/types/ScanResult.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace netsweep::core {

/**
 * @brief Kind of change produced when a scan result is merged.
 */
enum class InventoryChangeType : int {
    Discovered = 0,  ///< Address found live for the first time
    CameUp = 1,      ///< Known device was Down and is Up again
    WentDown = 2,    ///< Known device was Up and is now Down or not reached
    PortsChanged = 3 ///< Device stayed Up but its open ports differ
};

/**
 * @brief One reconciliation event of a merge.
 */
struct InventoryChange {
    InventoryChangeType type{InventoryChangeType::Discovered};
    std::string address;
    PortSet previousPorts;
    PortSet currentPorts;
    uint64_t scanId{0};

    [[nodiscard]] std::string typeToString() const;

    bool operator==(const InventoryChange& other) const = default;
};

/**
 * @brief Thread-safe, snapshot-based device store.
 *
 * Writers (applyScanResult, attachDetail, evictNotSeenSince) are serialized.
 * Readers never block on a writer for longer than a pointer copy.
 */
class DeviceInventory {
public:
    /**
     * @brief Constructs an empty inventory.
     * @param classifier Classifier used to recompute roles; must outlive the inventory.
     */
    explicit DeviceInventory(const Classifier& classifier);

    DeviceInventory(const DeviceInventory&) = delete;
    DeviceInventory& operator=(const DeviceInventory&) = delete;

    /**
     * @brief Merges a scan result into the inventory.
     *
     * Up devices overwrite the record with the same address. Devices reported
     * Down, and known devices absent from the result, are kept with status
     * Down, no open ports and their previous lastSeenScanId. Down entries for
     * addresses never seen live are ignored. Roles are recomputed for every
     * touched record. Detail survives only if status and open ports are
     * unchanged.
     *
     * @param result Result of a scan pass.
     * @return Changes caused by the merge; empty if the result is stale
     *         (scanId not newer than the last applied one).
     */
    std::vector<InventoryChange> applyScanResult(const ScanResult& result);

    /**
     * @brief Returns all devices ordered by address.
     */
    [[nodiscard]] std::vector<Device> list() const;

    /**
     * @brief Looks up one device.
     * @param address IPv4 address of the device.
     * @return The device, or nullopt if the address is unknown.
     */
    [[nodiscard]] std::optional<Device> get(const std::string& address) const;

    /**
     * @brief Stores fetched detail for a device.
     *
     * The detail is stored only if the device's status and open ports still
     * match the record the fetch was based on; otherwise it is already stale.
     *
     * @param basis Device record observed before the fetch started.
     * @param detail Fetched attributes.
     * @return True if stored.
     */
    bool attachDetail(const Device& basis, DeviceDetail detail);

    /**
     * @brief Removes Down devices last seen before the given scan generation.
     *
     * The engine never calls this on its own; eviction is an external policy.
     *
     * @param scanId Devices with lastSeenScanId below this are eligible.
     * @return Number of devices removed.
     */
    std::size_t evictNotSeenSince(uint64_t scanId);

    /**
     * @brief Generation of the most recently applied scan result (0 if none).
     */
    [[nodiscard]] uint64_t latestScanId() const;

    [[nodiscard]] std::size_t size() const;

private:
    using DeviceMap = std::map<std::string, Device, AddressLess>;

    struct Snapshot {
        DeviceMap devices;
        uint64_t scanId{0};
    };

    std::shared_ptr<const Snapshot> snapshot() const;
    void publish(std::shared_ptr<const Snapshot> next);
    void carryForwardDown(Device& device, uint64_t scanId, std::vector<InventoryChange>& changes) const;

    const Classifier& classifier_;
    std::shared_ptr<const Snapshot> snapshot_;
    mutable std::mutex snapshotMutex_;
    std::mutex writeMutex_;
};

} // namespace netsweep::core
