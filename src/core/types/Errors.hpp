/**
 * @file Errors.hpp
 * @brief Exception types raised by the discovery engine.
 *
 * Network unreliability during a scan is never reported through these types;
 * it is folded into device status instead. These exceptions cover invalid
 * input and on-demand detail retrieval only.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace netsweep::core {

/**
 * @brief A CIDR block could not be parsed or is not supported.
 */
class InvalidRangeError : public std::runtime_error {
public:
    explicit InvalidRangeError(const std::string& message)
        : std::runtime_error("Invalid range: " + message) {}
};

/**
 * @brief A scan configuration failed validation.
 */
class InvalidConfigError : public std::runtime_error {
public:
    explicit InvalidConfigError(const std::string& message)
        : std::runtime_error("Invalid scan configuration: " + message) {}
};

/**
 * @brief Extended attributes for a device could not be retrieved.
 */
class DetailUnavailableError : public std::runtime_error {
public:
    DetailUnavailableError(const std::string& address, const std::string& reason)
        : std::runtime_error("Detail unavailable for " + address + ": " + reason),
          address_(address) {}

    const std::string& address() const { return address_; }

private:
    std::string address_;
};

/**
 * @brief The requested address is not present in the inventory.
 */
class DeviceNotFoundError : public std::runtime_error {
public:
    explicit DeviceNotFoundError(const std::string& address)
        : std::runtime_error("Device not found: " + address) {}
};

} // namespace netsweep::core
