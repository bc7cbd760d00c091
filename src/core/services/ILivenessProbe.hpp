/**
 * @file ILivenessProbe.hpp
 * @brief Interface for host liveness probing.
 *
 * This file defines the abstract interface for deciding whether an address
 * hosts a reachable device within a bounded time window.
 */

#pragma once

#include "core/types/Device.hpp"

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <vector>

namespace netsweep::core {

/**
 * @brief Interface for liveness probing.
 *
 * An address is Up when it answers an ICMP echo or a TCP connection attempt
 * to any of the given ports before the timeout. Unreachability is the normal
 * outcome and is reported as Down, never as an error.
 */
class ILivenessProbe {
public:
    /**
     * @brief Callback receiving the probe outcome.
     * @param status Up or Down.
     */
    using LivenessCallback = std::function<void(DeviceStatus status)>;

    virtual ~ILivenessProbe() = default;

    /**
     * @brief Starts an asynchronous liveness probe.
     *
     * The callback is invoked exactly once, no later than the timeout, on an
     * I/O thread.
     *
     * @param address IPv4 address to probe.
     * @param tcpPorts Ports to attempt TCP connections to.
     * @param timeout Deadline for the whole probe.
     * @param callback Function to call with the outcome.
     */
    virtual void probeAsync(const std::string& address, const std::vector<uint16_t>& tcpPorts,
                            std::chrono::milliseconds timeout, LivenessCallback callback) = 0;

    /**
     * @brief Probes an address and waits for the outcome.
     *
     * Must not be called from an I/O thread of the implementation.
     *
     * @return Up or Down; Down if the implementation overruns the timeout.
     */
    DeviceStatus probe(const std::string& address, const std::vector<uint16_t>& tcpPorts,
                       std::chrono::milliseconds timeout) {
        auto promise = std::make_shared<std::promise<DeviceStatus>>();
        auto future = promise->get_future();
        probeAsync(address, tcpPorts, timeout,
                   [promise](DeviceStatus status) { promise->set_value(status); });
        if (future.wait_for(timeout + std::chrono::milliseconds(500)) != std::future_status::ready) {
            return DeviceStatus::Down;
        }
        return future.get();
    }
};

} // namespace netsweep::core
