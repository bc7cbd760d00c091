/**
 * @file IPortProbe.hpp
 * @brief Interface for TCP port reachability probing.
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
 * @brief Interface for TCP port probing of a single address.
 *
 * All ports of one call are probed concurrently under one shared deadline, so
 * the call completes within timeoutPerPort regardless of the port count.
 */
class IPortProbe {
public:
    /**
     * @brief Callback receiving the ports that accepted a connection.
     */
    using PortsCallback = std::function<void(const PortSet& openPorts)>;

    virtual ~IPortProbe() = default;

    /**
     * @brief Starts probing the given ports asynchronously.
     * @param address IPv4 address to probe.
     * @param ports Ports to test.
     * @param timeoutPerPort Deadline shared by all port tests of this call.
     * @param callback Invoked exactly once with the open ports.
     */
    virtual void probePortsAsync(const std::string& address, const std::vector<uint16_t>& ports,
                                 std::chrono::milliseconds timeoutPerPort,
                                 PortsCallback callback) = 0;

    /**
     * @brief Probes the given ports and waits for the outcome.
     *
     * Must not be called from an I/O thread of the implementation.
     *
     * @return Open ports; empty if the implementation overruns the deadline.
     */
    PortSet probePorts(const std::string& address, const std::vector<uint16_t>& ports,
                       std::chrono::milliseconds timeoutPerPort) {
        auto promise = std::make_shared<std::promise<PortSet>>();
        auto future = promise->get_future();
        probePortsAsync(address, ports, timeoutPerPort,
                        [promise](const PortSet& open) { promise->set_value(open); });
        if (future.wait_for(timeoutPerPort + std::chrono::milliseconds(500)) !=
            std::future_status::ready) {
            return {};
        }
        return future.get();
    }
};

} // namespace netsweep::core
