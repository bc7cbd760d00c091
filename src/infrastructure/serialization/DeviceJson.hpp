#pragma once

#include "core/inventory/DeviceInventory.hpp"
#include "core/types/Device.hpp"
#include "core/types/ScanResult.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace netsweep::infra {

/**
 * @brief JSON representations of engine types, as handed to a serving layer.
 *
 * Timestamps are seconds since the Unix epoch. Open ports carry the service
 * name guessed from the port number.
 */
nlohmann::json detailToJson(const core::DeviceDetail& detail);

/// Service usually found on @p port, judged by the number alone.
std::optional<std::string> serviceName(uint16_t port);

nlohmann::json deviceToJson(const core::Device& device);
nlohmann::json devicesToJson(const std::vector<core::Device>& devices);
nlohmann::json scanResultToJson(const core::ScanResult& result);
nlohmann::json changeToJson(const core::InventoryChange& change);

} // namespace netsweep::infra
