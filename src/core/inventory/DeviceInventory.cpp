#include "core/inventory/DeviceInventory.hpp"

#include <spdlog/spdlog.h>

#include <set>

namespace netsweep::core {

std::string InventoryChange::typeToString() const {
    switch (type) {
    case InventoryChangeType::Discovered:
        return "Discovered";
    case InventoryChangeType::CameUp:
        return "CameUp";
    case InventoryChangeType::WentDown:
        return "WentDown";
    case InventoryChangeType::PortsChanged:
        return "PortsChanged";
    }
    return "Unknown";
}

DeviceInventory::DeviceInventory(const Classifier& classifier)
    : classifier_(classifier), snapshot_(std::make_shared<const Snapshot>()) {}

std::shared_ptr<const DeviceInventory::Snapshot> DeviceInventory::snapshot() const {
    std::lock_guard lock(snapshotMutex_);
    return snapshot_;
}

void DeviceInventory::publish(std::shared_ptr<const Snapshot> next) {
    std::lock_guard lock(snapshotMutex_);
    snapshot_ = std::move(next);
}

void DeviceInventory::carryForwardDown(Device& device, uint64_t scanId,
                                       std::vector<InventoryChange>& changes) const {
    if (device.isUp()) {
        InventoryChange change;
        change.type = InventoryChangeType::WentDown;
        change.address = device.address;
        change.previousPorts = device.openPorts;
        change.scanId = scanId;
        changes.push_back(std::move(change));
        device.detail.reset();
    }
    device.markDown();
    device.role = classifier_.classify(device.openPorts, device.detail);
}

std::vector<InventoryChange> DeviceInventory::applyScanResult(const ScanResult& result) {
    std::lock_guard writeLock(writeMutex_);

    auto current = snapshot();
    if (result.scanId <= current->scanId) {
        spdlog::warn("Ignoring stale scan result {} (inventory is at scan {})", result.scanId,
                     current->scanId);
        return {};
    }

    auto next = std::make_shared<Snapshot>(*current);
    next->scanId = result.scanId;

    std::vector<InventoryChange> changes;
    std::set<std::string, AddressLess> reported;

    for (const auto& observed : result.devices) {
        reported.insert(observed.address);
        auto it = next->devices.find(observed.address);

        if (!observed.isUp()) {
            if (it != next->devices.end()) {
                carryForwardDown(it->second, result.scanId, changes);
            }
            continue;
        }

        Device updated = observed;
        updated.concerningPorts = intersectPorts(observed.concerningPorts, observed.openPorts);
        updated.lastSeenScanId = result.scanId;
        if (updated.lastSeen == std::chrono::system_clock::time_point{}) {
            updated.lastSeen = result.finishedAt;
        }

        if (it == next->devices.end()) {
            InventoryChange change;
            change.type = InventoryChangeType::Discovered;
            change.address = updated.address;
            change.currentPorts = updated.openPorts;
            change.scanId = result.scanId;
            changes.push_back(std::move(change));
        } else {
            const auto& prior = it->second;
            if (!updated.detail && prior.isUp() && prior.openPorts == updated.openPorts) {
                updated.detail = prior.detail;
            }
            if (!prior.isUp() || prior.openPorts != updated.openPorts) {
                InventoryChange change;
                change.type = prior.isUp() ? InventoryChangeType::PortsChanged
                                           : InventoryChangeType::CameUp;
                change.address = updated.address;
                change.previousPorts = prior.openPorts;
                change.currentPorts = updated.openPorts;
                change.scanId = result.scanId;
                changes.push_back(std::move(change));
            }
        }

        updated.role = classifier_.classify(updated.openPorts, updated.detail);
        next->devices.insert_or_assign(updated.address, std::move(updated));
    }

    for (auto& [address, device] : next->devices) {
        if (reported.count(address) == 0) {
            carryForwardDown(device, result.scanId, changes);
        }
    }

    publish(std::move(next));

    for (const auto& change : changes) {
        if (change.type == InventoryChangeType::PortsChanged) {
            spdlog::debug("Scan {}: {} {}", change.scanId, change.address, change.typeToString());
        } else {
            spdlog::info("Scan {}: {} {}", change.scanId, change.address, change.typeToString());
        }
    }
    spdlog::info("Applied scan {}: {} devices reported, {} changes", result.scanId,
                 result.devices.size(), changes.size());

    return changes;
}

std::vector<Device> DeviceInventory::list() const {
    auto current = snapshot();

    std::vector<Device> devices;
    devices.reserve(current->devices.size());
    for (const auto& [address, device] : current->devices) {
        devices.push_back(device);
    }
    return devices;
}

std::optional<Device> DeviceInventory::get(const std::string& address) const {
    auto current = snapshot();

    auto it = current->devices.find(address);
    if (it == current->devices.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool DeviceInventory::attachDetail(const Device& basis, DeviceDetail detail) {
    std::lock_guard writeLock(writeMutex_);

    auto current = snapshot();
    auto it = current->devices.find(basis.address);
    if (it == current->devices.end()) {
        return false;
    }
    if (it->second.status != basis.status || it->second.openPorts != basis.openPorts) {
        spdlog::debug("Discarding stale detail for {}", basis.address);
        return false;
    }

    auto next = std::make_shared<Snapshot>(*current);
    auto& device = next->devices.at(basis.address);
    device.detail = std::move(detail);
    device.role = classifier_.classify(device.openPorts, device.detail);

    publish(std::move(next));
    return true;
}

std::size_t DeviceInventory::evictNotSeenSince(uint64_t scanId) {
    std::lock_guard writeLock(writeMutex_);

    auto current = snapshot();
    auto next = std::make_shared<Snapshot>(*current);

    auto removed = std::erase_if(next->devices, [scanId](const auto& entry) {
        return !entry.second.isUp() && entry.second.lastSeenScanId < scanId;
    });

    if (removed > 0) {
        publish(std::move(next));
        spdlog::info("Evicted {} devices not seen since scan {}", removed, scanId);
    }
    return removed;
}

uint64_t DeviceInventory::latestScanId() const {
    return snapshot()->scanId;
}

std::size_t DeviceInventory::size() const {
    return snapshot()->devices.size();
}

} // namespace netsweep::core
