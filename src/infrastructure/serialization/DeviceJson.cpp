#include "infrastructure/serialization/DeviceJson.hpp"

#include <chrono>
#include <map>

namespace netsweep::infra {

namespace {

int64_t toEpochSeconds(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

nlohmann::json portsToJson(const core::PortSet& ports) {
    nlohmann::json j = nlohmann::json::array();
    for (uint16_t port : ports) {
        j.push_back(port);
    }
    return j;
}

} // namespace

std::optional<std::string> serviceName(uint16_t port) {
    // Covers the default probe list plus common management and VoIP ports.
    static const std::map<uint16_t, std::string> names = {
        {21, "ftp"},    {22, "ssh"},     {23, "telnet"},     {25, "smtp"},      {53, "dns"},
        {80, "http"},   {161, "snmp"},   {179, "bgp"},       {443, "https"},    {445, "smb"},
        {830, "netconf"}, {1720, "h323"}, {2000, "sccp"},    {3306, "mysql"},   {3389, "rdp"},
        {5060, "sip"},  {5061, "sips"},  {5432, "postgres"}, {5900, "vnc"},     {8080, "http-alt"},
        {8443, "https-alt"}};

    auto found = names.find(port);
    if (found == names.end()) {
        return std::nullopt;
    }
    return found->second;
}

nlohmann::json detailToJson(const core::DeviceDetail& detail) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [key, value] : detail) {
        std::visit([&j, &key](const auto& v) { j[key] = v; }, value);
    }
    return j;
}

nlohmann::json deviceToJson(const core::Device& device) {
    nlohmann::json j;
    j["address"] = device.address;
    j["status"] = device.statusToString();
    j["role"] = device.roleToString();
    j["openPorts"] = portsToJson(device.openPorts);
    j["concerningPorts"] = portsToJson(device.concerningPorts);

    nlohmann::json services = nlohmann::json::object();
    for (uint16_t port : device.openPorts) {
        if (auto name = serviceName(port)) {
            services[std::to_string(port)] = *name;
        }
    }
    j["services"] = services;

    j["lastSeenScanId"] = device.lastSeenScanId;
    j["lastSeen"] = toEpochSeconds(device.lastSeen);
    if (device.detail) {
        j["detail"] = detailToJson(*device.detail);
    } else {
        j["detail"] = nullptr;
    }
    return j;
}

nlohmann::json devicesToJson(const std::vector<core::Device>& devices) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& device : devices) {
        j.push_back(deviceToJson(device));
    }
    return j;
}

nlohmann::json scanResultToJson(const core::ScanResult& result) {
    nlohmann::json j;
    j["scanId"] = result.scanId;
    j["startedAt"] = toEpochSeconds(result.startedAt);
    j["finishedAt"] = toEpochSeconds(result.finishedAt);
    j["durationMs"] = result.duration().count();
    j["addressesProbed"] = result.addressesProbed;
    j["cancelled"] = result.cancelled;
    j["applied"] = result.applied;
    j["upCount"] = result.upCount();
    j["devices"] = devicesToJson(result.devices);
    return j;
}

nlohmann::json changeToJson(const core::InventoryChange& change) {
    nlohmann::json j;
    j["type"] = change.typeToString();
    j["address"] = change.address;
    j["previousPorts"] = portsToJson(change.previousPorts);
    j["currentPorts"] = portsToJson(change.currentPorts);
    j["scanId"] = change.scanId;
    return j;
}

} // namespace netsweep::infra
