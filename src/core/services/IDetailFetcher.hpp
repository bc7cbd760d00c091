/**
 * @file IDetailFetcher.hpp
 * @brief Interface for on-demand retrieval of extended device attributes.
 */

#pragma once

#include "core/types/Device.hpp"

#include <string>

namespace netsweep::core {

/**
 * @brief Pluggable source of extended attributes for one device.
 *
 * Detail is best effort and strictly additive: a failure never changes what
 * is already known about the device's status, ports or role.
 */
class IDetailFetcher {
public:
    virtual ~IDetailFetcher() = default;

    /**
     * @brief Retrieves extended attributes for an address.
     * @param address IPv4 address of the device.
     * @return Attribute map; may be empty.
     * @throws DetailUnavailableError on timeout or protocol failure.
     */
    virtual DeviceDetail fetch(const std::string& address) = 0;
};

} // namespace netsweep::core
