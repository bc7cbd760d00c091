#include "infrastructure/config/ConfigManager.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace netsweep::infra {

ConfigManager::ConfigManager(const std::filesystem::path& configDir) : configDir_(configDir) {
    if (!std::filesystem::exists(configDir_)) {
        std::filesystem::create_directories(configDir_);
    }

    configPath_ = configDir_ / "config.json";
}

bool ConfigManager::load() {
    if (!std::filesystem::exists(configPath_)) {
        spdlog::info("No config at {}, writing defaults", configPath_.string());
        return save();
    }

    std::ifstream file(configPath_);
    if (!file) {
        spdlog::error("Cannot read config file {}", configPath_.string());
        return false;
    }

    // Parse into a copy so a bad file never leaves a half-applied configuration.
    AppConfig loaded;
    try {
        auto j = nlohmann::json::parse(file);
        loaded = fromJson(j);
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Ignoring config file {}: {}", configPath_.string(), e.what());
        return false;
    }

    config_ = std::move(loaded);
    spdlog::info("Loaded configuration from {}", configPath_.string());
    return true;
}

bool ConfigManager::save() {
    std::ofstream file(configPath_, std::ios::trunc);
    if (!file) {
        spdlog::error("Cannot write config file {}", configPath_.string());
        return false;
    }

    file << toJson().dump(2) << '\n';
    if (!file) {
        spdlog::error("Writing config file {} failed", configPath_.string());
        return false;
    }

    spdlog::debug("Saved configuration to {}", configPath_.string());
    return true;
}

nlohmann::json ConfigManager::toJson() const {
    nlohmann::json j;

    // Discovery
    j["discovery"]["cidr"] = config_.cidr;

    // Scan
    j["scan"]["concurrency_limit"] = config_.scan.concurrencyLimit;
    j["scan"]["liveness_timeout_ms"] = config_.scan.livenessTimeout.count();
    j["scan"]["port_timeout_ms"] = config_.scan.portTimeout.count();
    j["scan"]["ports_to_check"] = config_.scan.portsToCheck;
    j["scan"]["concerning_ports"] = config_.scan.concerningPorts;
    j["scan"]["use_icmp"] = config_.useIcmp;
    j["scan"]["io_threads"] = config_.ioThreads;

    // Classification
    j["classification"]["voip_ports"] = config_.classification.voipPorts;
    j["classification"]["switch_port_sets"] = config_.classification.switchPortSets;
    j["classification"]["server_ports"] = config_.classification.serverPorts;
    j["classification"]["voip_vendors"] = config_.classification.voipVendors;
    j["classification"]["server_hostname_hints"] = config_.classification.serverHostnameHints;

    // Detail
    j["detail"]["enabled"] = config_.detailEnabled;
    j["detail"]["timeout_ms"] = config_.detailTimeoutMs;

    // Schedule
    j["schedule"]["enabled"] = config_.scheduleEnabled;
    j["schedule"]["interval_minutes"] = config_.scheduleIntervalMinutes;

    // Logging
    j["logging"]["level"] = config_.logLevel;
    j["logging"]["file"] = config_.logFile;

    return j;
}

AppConfig ConfigManager::fromJson(const nlohmann::json& j) {
    AppConfig cfg;

    // Discovery
    if (j.contains("discovery")) {
        const auto& d = j["discovery"];
        cfg.cidr = d.value("cidr", cfg.cidr);
    }

    // Scan
    if (j.contains("scan")) {
        const auto& s = j["scan"];
        cfg.scan.concurrencyLimit = s.value("concurrency_limit", cfg.scan.concurrencyLimit);
        cfg.scan.livenessTimeout = std::chrono::milliseconds(
            s.value("liveness_timeout_ms", cfg.scan.livenessTimeout.count()));
        cfg.scan.portTimeout = std::chrono::milliseconds(
            s.value("port_timeout_ms", cfg.scan.portTimeout.count()));
        cfg.scan.portsToCheck = s.value("ports_to_check", cfg.scan.portsToCheck);
        cfg.scan.concerningPorts = s.value("concerning_ports", cfg.scan.concerningPorts);
        cfg.useIcmp = s.value("use_icmp", cfg.useIcmp);
        cfg.ioThreads = s.value("io_threads", cfg.ioThreads);
    }

    // Classification
    if (j.contains("classification")) {
        const auto& c = j["classification"];
        const auto dc = cfg.classification;
        cfg.classification.voipPorts = c.value("voip_ports", dc.voipPorts);
        cfg.classification.switchPortSets = c.value("switch_port_sets", dc.switchPortSets);
        cfg.classification.serverPorts = c.value("server_ports", dc.serverPorts);
        cfg.classification.voipVendors = c.value("voip_vendors", dc.voipVendors);
        cfg.classification.serverHostnameHints =
            c.value("server_hostname_hints", dc.serverHostnameHints);
    }

    // Detail
    if (j.contains("detail")) {
        const auto& d = j["detail"];
        cfg.detailEnabled = d.value("enabled", cfg.detailEnabled);
        cfg.detailTimeoutMs = d.value("timeout_ms", cfg.detailTimeoutMs);
    }

    // Schedule
    if (j.contains("schedule")) {
        const auto& s = j["schedule"];
        cfg.scheduleEnabled = s.value("enabled", cfg.scheduleEnabled);
        cfg.scheduleIntervalMinutes =
            s.value("interval_minutes", cfg.scheduleIntervalMinutes);
    }

    // Logging
    if (j.contains("logging")) {
        const auto& l = j["logging"];
        cfg.logLevel = l.value("level", cfg.logLevel);
        cfg.logFile = l.value("file", cfg.logFile);
    }

    return cfg;
}

} // namespace netsweep::infra
