#include <catch2/catch_test_macros.hpp>

#include "core/types/Errors.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/network/ScanOrchestrator.hpp"
#include "support/FakeProbes.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

using namespace netsweep::core;
using namespace netsweep::infra;
using netsweep::testing::FakeLivenessProbe;
using netsweep::testing::FakePortProbe;

namespace {

ScanConfig fastConfig() {
    ScanConfig config;
    config.concurrencyLimit = 8;
    config.livenessTimeout = std::chrono::milliseconds(50);
    config.portTimeout = std::chrono::milliseconds(50);
    return config;
}

const Device* findDevice(const ScanResult& result, const std::string& address) {
    auto it = std::find_if(result.devices.begin(), result.devices.end(),
                           [&address](const Device& d) { return d.address == address; });
    return it != result.devices.end() ? &*it : nullptr;
}

} // namespace

TEST_CASE("ScanOrchestrator validates before probing", "[ScanOrchestrator]") {
    AsioContext context(2);
    context.start();
    FakeLivenessProbe liveness;
    FakePortProbe ports;
    Classifier classifier;
    DeviceInventory inventory(classifier);
    ScanOrchestrator orchestrator(context, liveness, ports, classifier, inventory);

    SECTION("Zero concurrency fails without any probe") {
        auto config = fastConfig();
        config.concurrencyLimit = 0;

        REQUIRE_THROWS_AS(orchestrator.runScan("192.168.0.0/30", config), InvalidConfigError);
        REQUIRE(liveness.calls() == 0);
        REQUIRE(ports.calls() == 0);
    }

    SECTION("Malformed range fails without any probe") {
        REQUIRE_THROWS_AS(orchestrator.runScan("192.168.0.0/40", fastConfig()), InvalidRangeError);
        REQUIRE(liveness.calls() == 0);
    }

    SECTION("Failed validation leaves the inventory untouched") {
        auto config = fastConfig();
        config.portsToCheck.clear();

        REQUIRE_THROWS(orchestrator.runScan("192.168.0.0/30", config));
        REQUIRE(inventory.latestScanId() == 0);
        REQUIRE_FALSE(orchestrator.isScanning());
    }
}

TEST_CASE("ScanOrchestrator scans a range", "[ScanOrchestrator]") {
    AsioContext context(2);
    context.start();
    FakeLivenessProbe liveness;
    FakePortProbe ports;
    Classifier classifier;
    DeviceInventory inventory(classifier);
    ScanOrchestrator orchestrator(context, liveness, ports, classifier, inventory);

    liveness.setLive({"192.168.0.1"});
    ports.setOpen("192.168.0.1", {22, 80, 3306, 8080});

    auto result = orchestrator.runScan("192.168.0.0/30", fastConfig());

    SECTION("Every host address is probed") {
        REQUIRE(result.addressesProbed == 2);
        REQUIRE(liveness.wasProbed("192.168.0.1"));
        REQUIRE(liveness.wasProbed("192.168.0.2"));
        REQUIRE_FALSE(result.cancelled);
    }

    SECTION("Only live addresses are port probed") {
        REQUIRE(ports.calls() == 1);
    }

    SECTION("Live device is recorded with derived fields") {
        REQUIRE(result.devices.size() == 1);
        const auto* device = findDevice(result, "192.168.0.1");
        REQUIRE(device != nullptr);
        REQUIRE(device->status == DeviceStatus::Up);
        REQUIRE(device->openPorts == PortSet{22, 80, 3306, 8080});
        REQUIRE(device->concerningPorts == PortSet{80, 8080});
        REQUIRE(device->role == DeviceRole::Server);
        REQUIRE(device->lastSeenScanId == result.scanId);
    }

    SECTION("Result is applied to the inventory") {
        REQUIRE(result.scanId == 1);
        REQUIRE(inventory.latestScanId() == 1);
        REQUIRE(inventory.get("192.168.0.1").has_value());
        REQUIRE_FALSE(inventory.get("192.168.0.2").has_value());
    }

    SECTION("Scan ids increase") {
        auto second = orchestrator.runScan("192.168.0.0/30", fastConfig());
        REQUIRE(second.scanId == 2);
        REQUIRE(inventory.latestScanId() == 2);
    }

    SECTION("Timestamps bracket the pass") {
        REQUIRE(result.finishedAt >= result.startedAt);
        REQUIRE_FALSE(orchestrator.isScanning());
    }
}

TEST_CASE("ScanOrchestrator bounds concurrency", "[ScanOrchestrator]") {
    AsioContext context(4);
    context.start();
    FakeLivenessProbe liveness(&context, std::chrono::milliseconds(20));
    FakePortProbe ports;
    Classifier classifier;
    DeviceInventory inventory(classifier);
    ScanOrchestrator orchestrator(context, liveness, ports, classifier, inventory);

    auto config = fastConfig();
    config.concurrencyLimit = 3;
    config.livenessTimeout = std::chrono::milliseconds(500);

    auto result = orchestrator.runScan("10.10.0.0/28", config);

    REQUIRE(result.addressesProbed == 14);
    REQUIRE(liveness.calls() == 14);
    REQUIRE(liveness.maxInFlight() <= 3);
    REQUIRE(liveness.maxInFlight() >= 1);
}

TEST_CASE("ScanOrchestrator isolates per-address failures", "[ScanOrchestrator]") {
    AsioContext context(2);
    context.start();
    FakeLivenessProbe liveness;
    FakePortProbe ports;
    Classifier classifier;
    DeviceInventory inventory(classifier);
    ScanOrchestrator orchestrator(context, liveness, ports, classifier, inventory);

    liveness.setLive({"10.0.0.2", "10.0.0.3", "10.0.0.4"});
    liveness.throwFor("10.0.0.1");
    ports.throwFor("10.0.0.2");
    ports.setOpen("10.0.0.3", {23, 161});
    ports.silenceFor("10.0.0.4");

    auto result = orchestrator.runScan("10.0.0.0/29", fastConfig());

    REQUIRE(result.addressesProbed == 6);
    REQUIRE(findDevice(result, "10.0.0.1") == nullptr);
    REQUIRE(findDevice(result, "10.0.0.2") == nullptr);
    REQUIRE(findDevice(result, "10.0.0.4") == nullptr);

    const auto* healthy = findDevice(result, "10.0.0.3");
    REQUIRE(healthy != nullptr);
    REQUIRE(healthy->status == DeviceStatus::Up);
    REQUIRE(healthy->role == DeviceRole::Switch);
}

TEST_CASE("ScanOrchestrator cancellation", "[ScanOrchestrator]") {
    AsioContext context(2);
    context.start();
    Classifier classifier;
    DeviceInventory inventory(classifier);

    SECTION("Cancelled before start dispatches nothing") {
        FakeLivenessProbe liveness;
        FakePortProbe ports;
        ScanOrchestrator orchestrator(context, liveness, ports, classifier, inventory);

        CancellationToken token;
        token.cancel();
        auto result = orchestrator.runScan("10.0.0.0/24", fastConfig(), token);

        REQUIRE(result.cancelled);
        REQUIRE(result.addressesProbed == 0);
        REQUIRE(liveness.calls() == 0);
    }

    SECTION("Cancelled mid-pass stops dispatching and keeps partial results") {
        FakeLivenessProbe liveness(&context, std::chrono::milliseconds(10));
        FakePortProbe ports;
        ScanOrchestrator orchestrator(context, liveness, ports, classifier, inventory);

        liveness.setLive({"10.0.0.1"});
        ports.setOpen("10.0.0.1", {22});

        CancellationToken token;
        liveness.setOnProbe([&liveness, token](const std::string&) mutable {
            if (liveness.calls() == 3) {
                token.cancel();
            }
        });

        auto config = fastConfig();
        config.concurrencyLimit = 1;
        auto result = orchestrator.runScan("10.0.0.0/24", config, token);

        REQUIRE(result.cancelled);
        REQUIRE(result.addressesProbed == 3);
        REQUIRE(liveness.calls() == 3);
        REQUIRE(inventory.get("10.0.0.1")->status == DeviceStatus::Up);
    }
}

TEST_CASE("ScanOrchestrator reports known devices that vanished", "[ScanOrchestrator]") {
    AsioContext context(2);
    context.start();
    FakeLivenessProbe liveness;
    FakePortProbe ports;
    Classifier classifier;
    DeviceInventory inventory(classifier);
    ScanOrchestrator orchestrator(context, liveness, ports, classifier, inventory);

    std::mutex changesMutex;
    std::vector<InventoryChange> changes;
    orchestrator.setChangeCallback(
        [&](uint64_t, const std::vector<InventoryChange>& batch) {
            std::lock_guard lock(changesMutex);
            changes.insert(changes.end(), batch.begin(), batch.end());
        });

    liveness.setLive({"10.0.0.5"});
    ports.setOpen("10.0.0.5", {22, 80});
    orchestrator.runScan("10.0.0.0/29", fastConfig());

    liveness.setLive({});
    auto result = orchestrator.runScan("10.0.0.0/29", fastConfig());

    const auto* reported = findDevice(result, "10.0.0.5");
    REQUIRE(reported != nullptr);
    REQUIRE(reported->status == DeviceStatus::Down);
    REQUIRE(reported->openPorts.empty());
    REQUIRE(reported->role == DeviceRole::Unknown);
    REQUIRE(reported->lastSeenScanId == 1);
    REQUIRE(result.applied);

    auto device = inventory.get("10.0.0.5");
    REQUIRE(device->status == DeviceStatus::Down);
    REQUIRE(device->role == DeviceRole::Unknown);
    REQUIRE(device->lastSeenScanId == 1);

    std::lock_guard lock(changesMutex);
    REQUIRE(changes.size() == 2);
    REQUIRE(changes[0].type == InventoryChangeType::Discovered);
    REQUIRE(changes[1].type == InventoryChangeType::WentDown);
    REQUIRE(changes[1].scanId == 2);
}

TEST_CASE("ScanOrchestrator runs passes in reserved id order", "[ScanOrchestrator]") {
    AsioContext context(2);
    context.start();
    FakeLivenessProbe liveness;
    FakePortProbe ports;
    Classifier classifier;
    DeviceInventory inventory(classifier);
    ScanOrchestrator orchestrator(context, liveness, ports, classifier, inventory);

    liveness.setLive({"10.0.0.1"});
    ports.setOpen("10.0.0.1", {22});

    auto older = orchestrator.reserveScanId();
    auto newer = orchestrator.reserveScanId();
    REQUIRE(newer > older);

    SECTION("A newer pass waits for the older one") {
        auto newerResult = std::async(std::launch::async, [&]() {
            return orchestrator.runScan(newer, "10.0.0.0/30", fastConfig(), {});
        });
        REQUIRE(newerResult.wait_for(std::chrono::milliseconds(200)) ==
                std::future_status::timeout);
        REQUIRE(liveness.calls() == 0);

        auto olderResult = orchestrator.runScan(older, "10.0.0.0/30", fastConfig(), {});
        REQUIRE(olderResult.applied);

        REQUIRE(newerResult.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
        auto latest = newerResult.get();

        REQUIRE(latest.applied);
        REQUIRE(inventory.latestScanId() == newer);
        REQUIRE(inventory.get("10.0.0.1")->lastSeenScanId == newer);
    }

    SECTION("A released id does not hold up later passes") {
        orchestrator.releaseScanId(older);

        auto result = orchestrator.runScan(newer, "10.0.0.0/30", fastConfig(), {});
        REQUIRE(result.applied);
        REQUIRE(inventory.latestScanId() == newer);
    }

    SECTION("A pass rejected by validation hands on its turn") {
        auto config = fastConfig();
        config.concurrencyLimit = 0;
        REQUIRE_THROWS_AS(orchestrator.runScan(older, "10.0.0.0/30", config, {}),
                          InvalidConfigError);

        auto result = orchestrator.runScan(newer, "10.0.0.0/30", fastConfig(), {});
        REQUIRE(result.applied);
    }
}

TEST_CASE("ScanOrchestrator returns when the I/O context is stopped mid-pass",
          "[ScanOrchestrator]") {
    AsioContext context(2);
    context.start();
    FakeLivenessProbe liveness(&context, std::chrono::seconds(3));
    FakePortProbe ports;
    Classifier classifier;
    DeviceInventory inventory(classifier);
    ScanOrchestrator orchestrator(context, liveness, ports, classifier, inventory);

    liveness.setLive({"10.0.0.1"});
    auto config = fastConfig();
    config.livenessTimeout = std::chrono::seconds(3);

    auto pending = std::async(std::launch::async,
                              [&]() { return orchestrator.runScan("10.0.0.0/29", config); });
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    context.stop();

    REQUIRE(pending.wait_for(std::chrono::seconds(2)) == std::future_status::ready);
    auto result = pending.get();
    REQUIRE(result.cancelled);
    REQUIRE(result.devices.empty());
    REQUIRE_FALSE(orchestrator.isScanning());
}

TEST_CASE("ScanOrchestrator keeps a slot until an overdue probe returns", "[ScanOrchestrator]") {
    AsioContext context(2);
    context.start();
    // Answers well after the 600 ms watchdog but before a second budget passes.
    FakeLivenessProbe liveness(&context, std::chrono::milliseconds(900));
    FakePortProbe ports;
    Classifier classifier;
    DeviceInventory inventory(classifier);
    ScanOrchestrator orchestrator(context, liveness, ports, classifier, inventory);

    auto config = fastConfig();
    config.concurrencyLimit = 1;

    std::mutex timesMutex;
    std::map<std::string, std::chrono::steady_clock::time_point> probedAt;
    liveness.setOnProbe([&](const std::string& address) {
        std::lock_guard lock(timesMutex);
        probedAt[address] = std::chrono::steady_clock::now();
    });

    auto result = orchestrator.runScan("10.0.0.0/30", config);

    REQUIRE(result.addressesProbed == 2);
    REQUIRE(result.devices.empty());
    {
        std::lock_guard lock(timesMutex);
        REQUIRE(probedAt.size() == 2);
        REQUIRE(probedAt["10.0.0.2"] - probedAt["10.0.0.1"] >= std::chrono::milliseconds(850));
    }

    // The second probe is still outstanding; stop before the fakes go away.
    context.stop();
}
