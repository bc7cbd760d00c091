#pragma once

#include "app/DiscoveryEngine.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/network/HostnameDetailFetcher.hpp"
#include "infrastructure/network/LivenessProbe.hpp"
#include "infrastructure/network/PortProbe.hpp"
#include "infrastructure/network/ScanScheduler.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace netsweep::app {

/**
 * @brief Command line settings that override the configuration file.
 */
struct AppOptions {
    std::filesystem::path configDir;
    std::optional<std::string> cidr;
    std::optional<std::string> detailAddress;
    std::optional<std::string> logLevel;
    bool watch{false};
};

class Application {
public:
    explicit Application(AppOptions options);
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    /**
     * @brief Runs a single scan, or keeps rescanning in watch mode until SIGINT/SIGTERM.
     * @return Process exit code.
     */
    int run();

    infra::ConfigManager& config() { return *config_; }
    DiscoveryEngine& engine() { return *engine_; }

    /**
     * @brief Default configuration directory ($XDG_CONFIG_HOME/netsweep or ~/.config/netsweep).
     */
    static std::filesystem::path defaultConfigDir();

private:
    void initializeLogging();
    void initializeComponents();
    int runOnce(const std::string& cidr);
    int runWatch(const std::string& cidr);
    int printDetail(const std::string& address);

    AppOptions options_;
    std::unique_ptr<infra::ConfigManager> config_;
    std::unique_ptr<infra::AsioContext> asioContext_;
    std::unique_ptr<infra::LivenessProbe> livenessProbe_;
    std::unique_ptr<infra::PortProbe> portProbe_;
    std::unique_ptr<infra::HostnameDetailFetcher> detailFetcher_;
    std::unique_ptr<DiscoveryEngine> engine_;
    std::unique_ptr<infra::ScanScheduler> scheduler_;
};

} // namespace netsweep::app
