#include "core/types/Device.hpp"

#include <algorithm>
#include <iterator>
#include <sstream>
#include <type_traits>

namespace netsweep::core {

std::string detailValueToString(const DetailValue& value) {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else {
                std::ostringstream oss;
                oss << v;
                return oss.str();
            }
        },
        value);
}

void Device::markDown() {
    status = DeviceStatus::Down;
    openPorts.clear();
    concerningPorts.clear();
}

std::string Device::statusToString() const {
    return statusToString(status);
}

std::string Device::roleToString() const {
    return roleToString(role);
}

std::string Device::statusToString(DeviceStatus status) {
    switch (status) {
    case DeviceStatus::Up:
        return "Up";
    case DeviceStatus::Down:
        return "Down";
    }
    return "Down";
}

std::string Device::roleToString(DeviceRole role) {
    switch (role) {
    case DeviceRole::Unknown:
        return "Unknown";
    case DeviceRole::Server:
        return "Server";
    case DeviceRole::Switch:
        return "Switch";
    case DeviceRole::VOIP:
        return "VOIP";
    }
    return "Unknown";
}

DeviceStatus Device::statusFromString(const std::string& str) {
    if (str == "Up")
        return DeviceStatus::Up;
    return DeviceStatus::Down;
}

DeviceRole Device::roleFromString(const std::string& str) {
    if (str == "Server")
        return DeviceRole::Server;
    if (str == "Switch")
        return DeviceRole::Switch;
    if (str == "VOIP")
        return DeviceRole::VOIP;
    return DeviceRole::Unknown;
}

PortSet intersectPorts(const PortSet& openPorts, const PortSet& watchList) {
    PortSet result;
    std::set_intersection(openPorts.begin(), openPorts.end(), watchList.begin(), watchList.end(),
                          std::inserter(result, result.end()));
    return result;
}

} // namespace netsweep::core
