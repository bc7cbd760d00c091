#pragma once

#include "core/classification/Classifier.hpp"
#include "core/types/ScanResult.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

namespace netsweep::infra {

/**
 * @brief Application configuration settings.
 *
 * Contains the default scan target and scan parameters, classification port
 * sets, detail lookup and scheduling settings, and logging preferences.
 */
struct AppConfig {
    // Discovery
    std::string cidr{"192.168.0.0/24"}; ///< Subnet scanned by default.

    // Scan parameters
    core::ScanConfig scan; ///< Concurrency, timeouts and port lists.

    // Classification
    core::ClassifierConfig classification; ///< Port sets and hints for the rule table.

    // Detail lookups
    bool detailEnabled{true}; ///< Allow on-demand detail retrieval.
    int detailTimeoutMs{2000}; ///< Reverse lookup timeout in milliseconds.

    // Scheduling
    bool scheduleEnabled{false};      ///< Rescan periodically.
    int scheduleIntervalMinutes{10};  ///< Minutes between scheduled scans.

    // Runtime
    int ioThreads{4};   ///< Worker threads driving probe I/O.
    bool useIcmp{true}; ///< Attempt ICMP echo for liveness (needs raw sockets).

    // Logging
    std::string logLevel{"info"};       ///< Console log level.
    std::string logFile{"netsweep.log"}; ///< Log file name inside the config directory.
};

/**
 * @brief Manages application configuration persistence.
 *
 * Handles loading and saving of the configuration from a JSON file in the
 * configuration directory. Missing keys keep their defaults.
 */
class ConfigManager {
public:
    /**
     * @brief Constructs a ConfigManager for the specified config directory.
     * @param configDir Path to the configuration directory (created if missing).
     */
    explicit ConfigManager(const std::filesystem::path& configDir);

    /**
     * @brief Loads configuration from disk.
     *
     * If the file does not exist, the defaults are written out.
     *
     * @return True if loaded (or created) successfully, false otherwise.
     */
    bool load();

    /**
     * @brief Saves configuration to disk.
     * @return True if saved successfully, false otherwise.
     */
    bool save();

    AppConfig& config() { return config_; }
    const AppConfig& config() const { return config_; }

    /**
     * @brief Returns the path to the configuration file.
     * @return Path to config.json.
     */
    std::filesystem::path configPath() const { return configPath_; }

    /**
     * @brief Returns the path to the log file.
     */
    std::filesystem::path logPath() const { return configDir_ / config_.logFile; }

    std::string configDir() const { return configDir_.string(); }

private:
    nlohmann::json toJson() const;
    static AppConfig fromJson(const nlohmann::json& j);

    std::filesystem::path configDir_;
    std::filesystem::path configPath_;
    AppConfig config_;
};

} // namespace netsweep::infra
