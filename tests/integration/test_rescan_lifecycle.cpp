#include <catch2/catch_test_macros.hpp>

#include "app/DiscoveryEngine.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/serialization/DeviceJson.hpp"
#include "support/FakeProbes.hpp"

#include <map>
#include <mutex>
#include <vector>

using namespace netsweep::core;
using namespace netsweep::infra;
using namespace netsweep::app;
using netsweep::testing::FakeLivenessProbe;
using netsweep::testing::FakePortProbe;

namespace {

ScanConfig fastConfig() {
    ScanConfig config;
    config.concurrencyLimit = 4;
    config.livenessTimeout = std::chrono::milliseconds(50);
    config.portTimeout = std::chrono::milliseconds(50);
    return config;
}

class ChangeRecorder {
public:
    void record(uint64_t scanId, const std::vector<InventoryChange>& changes) {
        std::lock_guard lock(mutex_);
        auto& bucket = byScan_[scanId];
        bucket.insert(bucket.end(), changes.begin(), changes.end());
    }

    std::vector<InventoryChange> forScan(uint64_t scanId) {
        std::lock_guard lock(mutex_);
        auto it = byScan_.find(scanId);
        return it != byScan_.end() ? it->second : std::vector<InventoryChange>{};
    }

private:
    std::mutex mutex_;
    std::map<uint64_t, std::vector<InventoryChange>> byScan_;
};

} // namespace

TEST_CASE("Device lifecycle across rescans", "[lifecycle]") {
    AsioContext context(2);
    context.start();
    FakeLivenessProbe liveness;
    FakePortProbe ports;
    DiscoveryEngine engine(context, liveness, ports, nullptr);

    ChangeRecorder recorder;
    engine.setChangeCallback(
        [&recorder](uint64_t scanId, const std::vector<InventoryChange>& changes) {
            recorder.record(scanId, changes);
        });

    const std::string cidr = "10.3.0.0/29";

    // Scan 1: a web server appears
    liveness.setLive({"10.3.0.5"});
    ports.setOpen("10.3.0.5", {22, 80});
    auto first = engine.runScan(cidr, fastConfig());

    auto changes = recorder.forScan(first.scanId);
    REQUIRE(changes.size() == 1);
    REQUIRE(changes[0].type == InventoryChangeType::Discovered);
    REQUIRE(engine.getDevice("10.3.0.5")->role == DeviceRole::Server);

    // Scan 2: it starts answering SIP instead
    ports.setOpen("10.3.0.5", {5060});
    auto second = engine.runScan(cidr, fastConfig());

    changes = recorder.forScan(second.scanId);
    REQUIRE(changes.size() == 1);
    REQUIRE(changes[0].type == InventoryChangeType::PortsChanged);
    REQUIRE(engine.getDevice("10.3.0.5")->role == DeviceRole::VOIP);
    REQUIRE(engine.getDevice("10.3.0.5")->concerningPorts.empty());

    // Scan 3: it disappears
    liveness.setLive({});
    auto third = engine.runScan(cidr, fastConfig());

    changes = recorder.forScan(third.scanId);
    REQUIRE(changes.size() == 1);
    REQUIRE(changes[0].type == InventoryChangeType::WentDown);

    auto gone = engine.getDevice("10.3.0.5");
    REQUIRE(gone->status == DeviceStatus::Down);
    REQUIRE(gone->openPorts.empty());
    REQUIRE(gone->role == DeviceRole::Unknown);
    REQUIRE(gone->lastSeenScanId == second.scanId);

    SECTION("Coming back is reported") {
        liveness.setLive({"10.3.0.5"});
        ports.setOpen("10.3.0.5", {23, 161});
        auto fourth = engine.runScan(cidr, fastConfig());

        changes = recorder.forScan(fourth.scanId);
        REQUIRE(changes.size() == 1);
        REQUIRE(changes[0].type == InventoryChangeType::CameUp);
        REQUIRE(engine.getDevice("10.3.0.5")->role == DeviceRole::Switch);
        REQUIRE(engine.getDevice("10.3.0.5")->lastSeenScanId == fourth.scanId);
    }

    SECTION("Long-gone devices can be evicted") {
        REQUIRE(engine.inventory().evictNotSeenSince(third.scanId) == 1);
        REQUIRE(engine.listDevices().empty());
    }

    SECTION("Inventory serializes with the carried-forward record") {
        auto j = devicesToJson(engine.listDevices());

        REQUIRE(j.size() == 1);
        REQUIRE(j[0]["address"] == "10.3.0.5");
        REQUIRE(j[0]["status"] == "Down");
        REQUIRE(j[0]["lastSeenScanId"] == second.scanId);
    }
}

TEST_CASE("Scans of different ranges share one inventory", "[lifecycle]") {
    AsioContext context(2);
    context.start();
    FakeLivenessProbe liveness;
    FakePortProbe ports;
    DiscoveryEngine engine(context, liveness, ports, nullptr);

    liveness.setLive({"10.4.0.1", "10.5.0.1"});
    ports.setOpen("10.4.0.1", {22});
    ports.setOpen("10.5.0.1", {22});

    engine.runScan("10.4.0.0/30", fastConfig());
    engine.runScan("10.5.0.0/30", fastConfig());

    // A device outside the latest range was not reached by that pass
    auto other = engine.getDevice("10.4.0.1");
    REQUIRE(other.has_value());
    REQUIRE(other->status == DeviceStatus::Down);
    REQUIRE(engine.getDevice("10.5.0.1")->status == DeviceStatus::Up);
}
