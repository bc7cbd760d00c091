/**
 * @file ScanResult.hpp
 * @brief Scan configuration, cancellation and scan pass result types.
 *
 * This file defines the parameters of one orchestrated scan pass, the token
 * used to cancel a pass in flight, and the result handed to the inventory.
 */

#pragma once

#include "core/types/Device.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>

namespace netsweep::core {

/**
 * @brief Parameters of one scan pass.
 */
struct ScanConfig {
    int concurrencyLimit{64};                        ///< Maximum addresses probed at once
    std::chrono::milliseconds livenessTimeout{1000}; ///< Liveness probe deadline per address
    std::chrono::milliseconds portTimeout{1000};     ///< Deadline for all port probes of one address
    std::vector<uint16_t> portsToCheck{21, 22, 23, 80, 161, 443, 3306, 5060, 5061, 8080};
    PortSet concerningPorts{21, 80, 8080};           ///< Watch-list flagged for attention

    /**
     * @brief Checks the configuration and throws on the first problem found.
     *
     * Requires a positive concurrency limit and timeouts, and a non-empty
     * port list whose entries lie in 1-65535.
     *
     * @throws InvalidConfigError describing the problem.
     */
    void validate() const;

    /**
     * @brief Returns portsToCheck as a de-duplicated, ordered set.
     */
    [[nodiscard]] PortSet portSet() const { return PortSet(portsToCheck.begin(), portsToCheck.end()); }

    bool operator==(const ScanConfig& other) const = default;
};

/**
 * @brief Cooperative cancellation signal shared between a scan and its caller.
 *
 * Copies share the same flag. Cancelling stops new address dispatch; probes
 * already issued run to their own timeouts.
 */
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true); }

    [[nodiscard]] bool isCancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

/**
 * @brief Output of one scan pass.
 *
 * Contains every device found Up in the pass plus previously known devices
 * that were found Down or not reached, sorted by address.
 */
struct ScanResult {
    uint64_t scanId{0};                                ///< Scan generation
    std::chrono::system_clock::time_point startedAt;   ///< When dispatch began
    std::chrono::system_clock::time_point finishedAt;  ///< When the last probe completed
    std::vector<Device> devices;                       ///< Observed and carried-forward devices
    std::size_t addressesProbed{0};                    ///< Addresses dispatched before completion or cancel
    bool cancelled{false};                             ///< Whether the pass was cut short
    bool applied{false};                               ///< Whether the inventory accepted it

    /**
     * @brief Counts devices with status Up.
     */
    [[nodiscard]] std::size_t upCount() const;

    /**
     * @brief Wall-clock duration of the pass.
     */
    [[nodiscard]] std::chrono::milliseconds duration() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(finishedAt - startedAt);
    }
};

} // namespace netsweep::core
