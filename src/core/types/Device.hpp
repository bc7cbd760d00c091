/**
 * @file Device.hpp
 * @brief Discovered device record and its status and role types.
 *
 * This file defines the Device structure which represents one host observed
 * on the scanned network, along with the opaque detail attribute map that is
 * filled in lazily by a detail fetcher.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <variant>

namespace netsweep::core {

/**
 * @brief Reachability of a device in the most recent scan.
 */
enum class DeviceStatus : int {
    Up = 1,  ///< Device answered a liveness probe
    Down = 2 ///< Device did not answer, or was not reached in the last pass
};

/**
 * @brief Coarse device role derived by the classifier.
 */
enum class DeviceRole : int {
    Unknown = 0, ///< No classification rule matched
    Server = 1,  ///< Exposes typical server ports
    Switch = 2,  ///< Network infrastructure (management ports)
    VOIP = 3     ///< SIP phone, gateway or PBX
};

/**
 * @brief Set of TCP port numbers, ordered ascending.
 */
using PortSet = std::set<uint16_t>;

/**
 * @brief Value of a single detail attribute.
 */
using DetailValue = std::variant<std::string, int64_t, double, bool>;

/**
 * @brief Extended attributes of a device, keyed by attribute name.
 */
using DeviceDetail = std::map<std::string, DetailValue>;

/**
 * @brief Renders a detail value as a string.
 * @param value The value to render.
 * @return Text form of the value ("true"/"false" for booleans).
 */
std::string detailValueToString(const DetailValue& value);

/**
 * @brief A host observed on the network.
 *
 * The address is the identity of a device within an inventory snapshot.
 * The role is always derived from openPorts and detail; callers never set it
 * on records held by the inventory.
 */
struct Device {
    std::string address;                      ///< IPv4 address in dotted form
    DeviceStatus status{DeviceStatus::Down};  ///< Result of the most recent scan
    PortSet openPorts;                        ///< Ports found reachable in the most recent scan
    PortSet concerningPorts;                  ///< openPorts intersected with the watch-list
    DeviceRole role{DeviceRole::Unknown};     ///< Derived classification
    uint64_t lastSeenScanId{0};               ///< Generation of the last scan that saw the device Up
    std::chrono::system_clock::time_point lastSeen; ///< Wall-clock time of that observation
    std::optional<DeviceDetail> detail;       ///< Lazily fetched extended attributes

    /**
     * @brief Checks whether the device was Up in the most recent scan.
     */
    [[nodiscard]] bool isUp() const { return status == DeviceStatus::Up; }

    /**
     * @brief Marks the device as not reachable.
     *
     * Clears open and concerning ports. Does not touch lastSeenScanId.
     */
    void markDown();

    /**
     * @brief Converts this device's status to a string.
     * @return "Up" or "Down".
     */
    [[nodiscard]] std::string statusToString() const;

    /**
     * @brief Converts this device's role to a string.
     * @return "Server", "Switch", "VOIP" or "Unknown".
     */
    [[nodiscard]] std::string roleToString() const;

    static std::string statusToString(DeviceStatus status);
    static std::string roleToString(DeviceRole role);

    /**
     * @brief Parses a status string.
     * @param str "Up" or "Down"; anything else yields Down.
     */
    static DeviceStatus statusFromString(const std::string& str);

    /**
     * @brief Parses a role string.
     * @param str Role name as produced by roleToString(); unknown names yield Unknown.
     */
    static DeviceRole roleFromString(const std::string& str);

    bool operator==(const Device& other) const = default;
};

/**
 * @brief Computes the intersection of open ports with a watch-list.
 * @param openPorts Ports found open.
 * @param watchList Ports flagged for operator attention.
 * @return Ports present in both sets.
 */
PortSet intersectPorts(const PortSet& openPorts, const PortSet& watchList);

} // namespace netsweep::core
