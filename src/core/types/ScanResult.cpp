#include "core/types/ScanResult.hpp"

#include "core/types/Errors.hpp"

#include <algorithm>

namespace netsweep::core {

void ScanConfig::validate() const {
    if (concurrencyLimit <= 0) {
        throw InvalidConfigError("concurrencyLimit must be positive, got " +
                                 std::to_string(concurrencyLimit));
    }
    if (livenessTimeout.count() <= 0) {
        throw InvalidConfigError("livenessTimeout must be positive");
    }
    if (portTimeout.count() <= 0) {
        throw InvalidConfigError("portTimeout must be positive");
    }
    if (portsToCheck.empty()) {
        throw InvalidConfigError("portsToCheck must not be empty");
    }
    if (std::find(portsToCheck.begin(), portsToCheck.end(), uint16_t{0}) != portsToCheck.end()) {
        throw InvalidConfigError("port 0 is not a valid TCP port");
    }
    if (concerningPorts.count(0) != 0) {
        throw InvalidConfigError("port 0 is not a valid concerning port");
    }
}

std::size_t ScanResult::upCount() const {
    return static_cast<std::size_t>(
        std::count_if(devices.begin(), devices.end(), [](const Device& d) { return d.isUp(); }));
}

} // namespace netsweep::core
